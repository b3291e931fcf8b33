#include <fstream>

#include "linkage.hpp"
#include "arguments.hpp"

using namespace shared;
using namespace exec;
namespace fs = std::filesystem;

namespace linkage {

  // scanelf prints "  -  " for fields it has no value for.
  std::string field(const std::string& value) {
    auto trimmed = trim(value, ' ');
    return trimmed == "-" ? "" : trimmed;
  }


  std::optional<scanned> parse(const std::string& line) {
    auto fields = shared::fields(line, ';');
    if (fields.size() < 5) return std::nullopt;

    scanned s = {
      .arch = field(fields[0]),
      .path = field(fields[1]),
      .soname = field(fields[2]),
      .rpath = field(fields[3]),
      .needed = field(fields[4]),
    };
    if (s.arch.starts_with("EM_")) s.arch.erase(0, 3);
    if (s.path.empty()) return std::nullopt;
    return s;
  }


  bool write(const fs::path& work, const vector& lines, probe::ContentProbe& probe) {
    std::vector<scanned> objects;
    for (const auto& line : lines) {
      if (trim(line, ' ').empty()) continue;
      auto object = parse(line);
      if (!object) {
        log({"Ignoring unexpected scanelf output:", line});
        continue;
      }

      // Infer implicit soname from basename (bug 715162).
      if (object->soname.empty()) {
        try {
          if (probe::sb_shared_object(probe.describe(object->path)))
            object->soname = fs::path(object->path).filename().string();
        }
        catch (const std::exception& e) {
          warning({"Failed to probe", object->path, ":", e.what()});
        }
      }
      objects.emplace_back(std::move(*object));
    }
    if (objects.empty()) return false;

    const auto dir = build_info(work);
    fs::create_directories(dir);
    auto needed = std::ofstream(dir / "NEEDED");
    auto elf2 = std::ofstream(dir / "NEEDED.ELF.2");
    if (!needed.is_open() || !elf2.is_open())
      throw std::runtime_error("Failed to write to " + dir.string());

    for (const auto& object : objects) {
      needed << object.needed_line() << '\n';
      elf2 << object.elf2_line() << '\n';
    }
    return true;
  }


  void Scanelf::extract(const fs::path& work, const vector& binaries) {
    if (binaries.empty()) return;

    vector command = {"scanelf", "-yRBF", "%a;%p;%S;%r;%n"};
    extend(command, binaries);
    write(work, execute<vector>(command, vectorize, {.cap = STDOUT, .verbose = arg::at("verbose") >= "debug"}), probe);
  }
}
