#include <gtest/gtest.h>

#include "fakes.hpp"
#include "staging.hpp"

namespace fs = std::filesystem;


class Staging : public testing::Test {
  protected:
    shared::TemporaryDirectory db, out;
    staging::Writer writer{db.get_path(), out.get_path()};

    std::string read(const fs::path& path) {
      return exec::file::parse<std::string>(path.string(), exec::dump);
    }
};


TEST_F(Staging, WritesUnderRoot) {
  auto written = writer.write(fs::path(db.get_path()) / "dev-libs" / "bar-2.0", "PROVIDES", "x86_64: libbar.so.2\n");
  EXPECT_EQ(written, fs::path(out.get_path()) / "dev-libs" / "bar-2.0" / "PROVIDES");
  EXPECT_EQ(read(written), "x86_64: libbar.so.2\n");

  // The live database is untouched.
  EXPECT_FALSE(fs::exists(fs::path(db.get_path()) / "dev-libs"));
}

TEST_F(Staging, RelativePackage) {
  auto written = writer.write("dev-libs/bar-2.0", "REQUIRES", "x86_64: libc.so.6\n");
  EXPECT_EQ(written, fs::path(out.get_path()) / "dev-libs" / "bar-2.0" / "REQUIRES");
  EXPECT_TRUE(fs::exists(written));
}

TEST_F(Staging, EmptyContent) {
  EXPECT_THROW(writer.write("dev-libs/bar-2.0", "PROVIDES", ""), staging::empty_record);
  EXPECT_FALSE(fs::exists(fs::path(out.get_path()) / "dev-libs"));
}

TEST_F(Staging, RefusesEscape) {
  EXPECT_THROW(writer.write("../../etc", "passwd", "x"), std::runtime_error);
  EXPECT_THROW(writer.write("dev-libs/bar-2.0", "../../../escape", "x"), std::runtime_error);
  EXPECT_THROW(writer.write("/etc/portage", "PROVIDES", "x"), std::runtime_error);
  EXPECT_THROW(writer.rewrite(fs::path(db.get_path()) / ".." / "elsewhere"), std::runtime_error);
}

TEST_F(Staging, NeverOutsideRoot) {
  const std::vector<fs::path> packages = {
    "a/b", "a/../b", "./a/b", fs::path(db.get_path()) / "a" / "b", fs::path(db.get_path()) / "a" / "." / "b",
  };
  for (const auto& pkg : packages) {
    auto target = writer.rewrite(pkg).lexically_relative(writer.get_root());
    ASSERT_FALSE(target.empty()) << pkg;
    EXPECT_NE(*target.begin(), "..") << pkg;
  }
}

TEST_F(Staging, RewriteStripsDatabase) {
  EXPECT_EQ(writer.rewrite(fs::path(db.get_path()) / "net-misc" / "openssh-8.6_p1-r2"), writer.get_root() / "net-misc" / "openssh-8.6_p1-r2");
}

TEST(StagingRoots, TrailingSlashes) {
  shared::TemporaryDirectory db, out;
  auto writer = staging::Writer(db.get_path() + "/", out.get_path() + "/");
  EXPECT_EQ(writer.get_root(), fs::path(out.get_path()));
  EXPECT_EQ(writer.rewrite(db.get_path() + "/cat/pkg-1.0/"), fs::path(out.get_path()) / "cat" / "pkg-1.0");
}

TEST(StagingRoots, CreatesOutput) {
  shared::TemporaryDirectory db, parent;
  const auto output = fs::path(parent.get_path()) / "nested" / "staging";
  auto writer = staging::Writer(db.get_path(), output.string());
  EXPECT_TRUE(fs::is_directory(output));
}

TEST(StagingRoots, FreshTemporaryRoot) {
  shared::TemporaryDirectory db;
  auto first = staging::Writer(db.get_path()), second = staging::Writer(db.get_path());

  // Left behind for review, so clean up ourselves.
  EXPECT_TRUE(fs::is_directory(first.get_root()));
  EXPECT_TRUE(fs::is_directory(second.get_root()));
  EXPECT_NE(first.get_root(), second.get_root());
  EXPECT_TRUE(fs::is_empty(first.get_root()));

  fs::remove_all(first.get_root());
  fs::remove_all(second.get_root());
}
