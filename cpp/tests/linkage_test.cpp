#include <gtest/gtest.h>

#include <fstream>

#include "fakes.hpp"
#include "linkage.hpp"
#include "soname.hpp"


TEST(Scanelf, ParsesLine) {
  auto s = linkage::parse("EM_X86_64;/usr/lib64/libfoo.so.1;libfoo.so.1;/usr/lib64/foo;libc.so.6,libm.so.6");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->arch, "X86_64");
  EXPECT_EQ(s->path, "/usr/lib64/libfoo.so.1");
  EXPECT_EQ(s->soname, "libfoo.so.1");
  EXPECT_EQ(s->rpath, "/usr/lib64/foo");
  EXPECT_EQ(s->needed, "libc.so.6,libm.so.6");
}

TEST(Scanelf, Placeholders) {
  auto s = linkage::parse("EM_X86_64;/usr/bin/foo;  -  ;  -  ;libc.so.6");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->soname, "");
  EXPECT_EQ(s->rpath, "");
  EXPECT_EQ(s->elf2_line(), "X86_64;/usr/bin/foo;;;libc.so.6");
  EXPECT_EQ(s->needed_line(), "/usr/bin/foo libc.so.6");
}

TEST(Scanelf, ArchWithoutPrefix) {
  auto s = linkage::parse("AARCH64;/usr/bin/foo;;;libc.so.6");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->arch, "AARCH64");
}

TEST(Scanelf, Malformed) {
  EXPECT_FALSE(linkage::parse(""));
  EXPECT_FALSE(linkage::parse("scanelf: /usr/bin/foo: Permission denied"));
  EXPECT_FALSE(linkage::parse("EM_X86_64;  -  ;;;libc.so.6"));
}

TEST(Scanelf, Elf2LineIsReadable) {
  auto s = linkage::parse("EM_386;/usr/lib/libfoo.so.1;libfoo.so.1;$ORIGIN;libc.so.6");
  ASSERT_TRUE(s);

  auto e = soname::entry::parse(s->elf2_line());
  EXPECT_EQ(e.arch, "386");
  EXPECT_EQ(e.filename, "/usr/lib/libfoo.so.1");
  EXPECT_EQ(e.soname, "libfoo.so.1");
  EXPECT_EQ(e.runpaths, shared::vector{"$ORIGIN"});
  EXPECT_EQ(e.needed, shared::vector{"libc.so.6"});
  EXPECT_EQ(soname::multilib_category(e.arch), "x86_32");
}

TEST(Scanelf, BuildInfo) {
  EXPECT_EQ(linkage::build_info("/tmp/work"), std::filesystem::path("/tmp/work/build-info"));
}


class ScanelfOutput : public testing::Test {
  protected:
    shared::TemporaryDirectory work;
    fakes::Probe probe;

    std::filesystem::path info() const {return linkage::build_info(work.get_path());}

    shared::vector read(const std::string& name) const {
      shared::vector lines;
      std::ifstream in(info() / name);
      for (std::string line; std::getline(in, line);) lines.emplace_back(line);
      return lines;
    }
};


TEST_F(ScanelfOutput, WritesRecords) {
  EXPECT_TRUE(linkage::write(work.get_path(), {
    "EM_X86_64;/usr/lib64/libbar.so.2;libbar.so.2;  -  ;libc.so.6",
    "EM_X86_64;/usr/bin/bar;  -  ;  -  ;libbar.so.2,libc.so.6",
  }, probe));

  EXPECT_EQ(read("NEEDED"), (shared::vector{"/usr/lib64/libbar.so.2 libc.so.6", "/usr/bin/bar libbar.so.2,libc.so.6"}));
  EXPECT_EQ(read("NEEDED.ELF.2"), (shared::vector{
    "X86_64;/usr/lib64/libbar.so.2;libbar.so.2;;libc.so.6",
    "X86_64;/usr/bin/bar;;;libbar.so.2,libc.so.6",
  }));

  // Only the object without a soname needed a second look.
  EXPECT_EQ(probe.calls, shared::vector{"/usr/bin/bar"});
}

TEST_F(ScanelfOutput, ImplicitSoname) {
  probe.descriptions = {
    {"/usr/lib64/libimplicit.so", fakes::elf_shared},
    {"/usr/bin/foo", fakes::elf_executable},
  };

  EXPECT_TRUE(linkage::write(work.get_path(), {
    "EM_X86_64;/usr/lib64/libimplicit.so;  -  ;  -  ;libc.so.6",
    "EM_X86_64;/usr/bin/foo;  -  ;  -  ;libimplicit.so,libc.so.6",
  }, probe));

  EXPECT_EQ(read("NEEDED.ELF.2"), (shared::vector{
    "X86_64;/usr/lib64/libimplicit.so;libimplicit.so;;libc.so.6",
    "X86_64;/usr/bin/foo;;;libimplicit.so,libc.so.6",
  }));
}

TEST_F(ScanelfOutput, ProbeFailureKeepsObject) {
  probe.failing = {"/usr/lib64/libgone.so"};
  EXPECT_TRUE(linkage::write(work.get_path(), {"EM_X86_64;/usr/lib64/libgone.so;  -  ;  -  ;libc.so.6"}, probe));
  EXPECT_EQ(read("NEEDED.ELF.2"), shared::vector{"X86_64;/usr/lib64/libgone.so;;;libc.so.6"});
}

TEST_F(ScanelfOutput, MalformedLinesSkipped) {
  EXPECT_TRUE(linkage::write(work.get_path(), {
    "scanelf: /usr/bin/foo: Permission denied",
    "",
    "EM_X86_64;/usr/bin/bar;libbar.so;  -  ;libc.so.6",
  }, probe));
  EXPECT_EQ(read("NEEDED"), shared::vector{"/usr/bin/bar libc.so.6"});
}

TEST_F(ScanelfOutput, NothingToWrite) {
  EXPECT_FALSE(linkage::write(work.get_path(), {"scanelf: /usr/bin/foo: Permission denied", "   "}, probe));
  EXPECT_FALSE(linkage::write(work.get_path(), {}, probe));
  EXPECT_FALSE(std::filesystem::exists(info() / "NEEDED"));
  EXPECT_FALSE(std::filesystem::exists(info()));
}
