#include <fstream>

#include "staging.hpp"

using namespace shared;
namespace fs = std::filesystem;

namespace staging {

  // Lexically normal, without a trailing separator.
  fs::path normal(const fs::path& path) {
    auto n = fs::absolute(path).lexically_normal();
    if (!n.has_filename() && n.has_relative_path()) n = n.parent_path();
    return n;
  }


  // Whether path is inside of base. Both must be normal.
  bool within(const fs::path& base, const fs::path& path) {
    auto relative = path.lexically_relative(base);
    return !relative.empty() && *relative.begin() != ".." && relative != ".";
  }


  Writer::Writer(const fs::path& db, const std::string& output) : database(normal(db)) {
    if (output.empty()) root = TemporaryDirectory(fs::temp_directory_path(), "recover-vdb", "", true).get_path();
    else {
      root = output;
      fs::create_directories(root);
    }
    root = normal(root);
  }


  fs::path Writer::rewrite(const fs::path& package) const {
    fs::path relative;
    if (package.is_absolute()) {
      // IE /var/db/pkg/dev-perl/XML-Parser -> dev-perl/XML-Parser
      auto absolute = normal(package);
      if (!within(database, absolute))
        throw std::runtime_error("Refusing to rewrite path outside of " + database.string() + ": " + package.string());
      relative = absolute.lexically_relative(database);
    }
    else relative = package;

    auto target = (root / relative).lexically_normal();

    // Quick sanity check!
    if (!within(root, target))
      throw std::runtime_error("Trying to write with non-prefixed path: " + target.string());
    return target;
  }


  fs::path Writer::write(const fs::path& package, const std::string& name, const std::string& content) const {
    if (content.empty())
      throw empty_record("Refusing to write empty " + name + " for " + package.string());

    auto target = (rewrite(package) / name).lexically_normal();
    if (!within(root, target))
      throw std::runtime_error("Trying to write with non-prefixed path: " + target.string());

    // Create the parts above the files we're creating, IE dev-perl/ and dev-perl/XML-Parser
    fs::create_directories(target.parent_path());

    auto file = std::ofstream(target);
    if (!file.is_open()) throw std::runtime_error("Failed to open " + target.string());
    file << content;
    file.close();
    if (file.fail()) throw std::runtime_error("Failed to write " + target.string());

    log({"Wrote", target.string()}, "debug");
    return target;
  }
}
