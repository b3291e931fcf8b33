#include <gtest/gtest.h>

#include "fakes.hpp"
#include "manifest.hpp"

using manifest::kind;

TEST(Manifest, ParsesObj) {
  auto r = manifest::parse("obj /usr/lib64/libfoo.so.1.2.3 d41d8cd98f00b204e9800998ecf8427e 1700000000");
  EXPECT_EQ(r.type, kind::obj);
  EXPECT_EQ(r.path, "/usr/lib64/libfoo.so.1.2.3");
  EXPECT_EQ(r.md5, "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(r.mtime, "1700000000");
}

TEST(Manifest, ObjPathsMayContainSpaces) {
  auto r = manifest::parse("obj /usr/share/doc/foo-1.0/READ ME.txt 0123456789abcdef0123456789abcdef 1700000000");
  EXPECT_EQ(r.type, kind::obj);
  EXPECT_EQ(r.path, "/usr/share/doc/foo-1.0/READ ME.txt");
  EXPECT_EQ(r.md5, "0123456789abcdef0123456789abcdef");
}

TEST(Manifest, ParsesSym) {
  auto r = manifest::parse("sym /usr/lib64/libfoo.so.1 -> libfoo.so.1.2.3 1700000000");
  EXPECT_EQ(r.type, kind::sym);
  EXPECT_EQ(r.path, "/usr/lib64/libfoo.so.1");
  EXPECT_EQ(r.target, "libfoo.so.1.2.3");
  EXPECT_EQ(r.mtime, "1700000000");
}

TEST(Manifest, ParsesDir) {
  auto r = manifest::parse("dir /usr/lib64");
  EXPECT_EQ(r.type, kind::dir);
  EXPECT_EQ(r.path, "/usr/lib64");
}

TEST(Manifest, UnknownTypes) {
  EXPECT_EQ(manifest::parse("nonsense").type, kind::unknown);
  EXPECT_EQ(manifest::parse("foo /usr/bin/foo").type, kind::unknown);
}

TEST(Manifest, ReadDropsBlankAndMalformedLines) {
  fakes::Database db;
  auto dir = db.add("app-misc/foo-1.0", {},
    "dir /usr\n"
    "\n"
    "obj /usr/bin/foo abcdef 1\n"
    "garbage\n"
    "sym /usr/bin/bar -> foo 1\n"
  );

  auto contents = manifest::read(dir / "CONTENTS");
  ASSERT_EQ(contents.size(), 3);
  EXPECT_EQ(contents[0].type, kind::dir);
  EXPECT_EQ(contents[1].type, kind::obj);
  EXPECT_EQ(contents[1].path, "/usr/bin/foo");
  EXPECT_EQ(contents[2].type, kind::sym);
}

TEST(Manifest, ReadMissingThrows) {
  fakes::Database db;
  auto dir = db.add("app-misc/foo-1.0", {}, std::nullopt);
  EXPECT_THROW(manifest::read(dir / "CONTENTS"), std::runtime_error);
}

TEST(Manifest, SonameLike) {
  EXPECT_TRUE(manifest::soname_like("/usr/lib64/libfoo.so"));
  EXPECT_TRUE(manifest::soname_like("/usr/lib64/libfoo.so.1"));
  EXPECT_TRUE(manifest::soname_like("/usr/lib64/libfoo.so.1.2.3"));
  EXPECT_FALSE(manifest::soname_like("/usr/lib64/libfoo.a"));
  EXPECT_FALSE(manifest::soname_like("/usr/lib64/libfoo.sock"));
  EXPECT_FALSE(manifest::soname_like("/usr/bin/foo"));
}

TEST(Manifest, BinLike) {
  EXPECT_TRUE(manifest::bin_like("/usr/bin/foo"));
  EXPECT_TRUE(manifest::bin_like("/usr/sbin/foo"));
  EXPECT_TRUE(manifest::bin_like("/usr/libexec/foo/helper"));
  EXPECT_FALSE(manifest::bin_like("/usr/lib64/foo/helper"));
}
