#include <regex>

#include "manifest.hpp"

using namespace shared;
using namespace exec;

namespace manifest {

  const std::regex so_pattern(R"(.*\.so($|\..*))");


  kind to_kind(const std::string_view& name) {
    if (name == "obj") return kind::obj;
    if (name == "dir") return kind::dir;
    if (name == "sym") return kind::sym;
    if (name == "dev") return kind::dev;
    if (name == "fif") return kind::fif;
    return kind::unknown;
  }


  record parse(const std::string_view& line) {
    record r;

    auto space = line.find(' ');
    if (space == std::string_view::npos) return r;

    r.type = to_kind(line.substr(0, space));
    auto residue = std::string(line.substr(space + 1));
    while (!residue.empty() && (residue.back() == '\n' || residue.back() == '\r')) residue.pop_back();

    switch (r.type) {

      // obj PATH MD5 MTIME
      case kind::obj: {
        auto m = residue.rfind(' ');
        auto d = m == std::string::npos || m == 0 ? std::string::npos : residue.rfind(' ', m - 1);
        if (d == std::string::npos) {
          // Not well formed, but the path is what we care about.
          r.path = residue;
          break;
        }
        r.path = residue.substr(0, d);
        r.md5 = residue.substr(d + 1, m - d - 1);
        r.mtime = residue.substr(m + 1);
        break;
      }

      // sym PATH -> TARGET MTIME
      case kind::sym: {
        auto arrow = residue.find(" -> ");
        if (arrow == std::string::npos) {
          r.path = residue;
          break;
        }
        r.path = residue.substr(0, arrow);
        r.target = residue.substr(arrow + 4);
        auto m = r.target.rfind(' ');
        if (m != std::string::npos) {
          r.mtime = r.target.substr(m + 1);
          r.target.erase(m);
        }
        break;
      }

      case kind::unknown: break;
      default: r.path = residue; break;
    }
    return r;
  }


  contents_t read(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
      throw std::runtime_error("No such manifest: " + path.string());

    contents_t contents;
    for (const auto& line : file::parse<vector>(path.string(), vectorize)) {
      if (line.empty()) continue;
      auto r = parse(line);
      if (r.type == kind::unknown || r.path.empty()) {
        log({"Ignoring malformed CONTENTS line in", path.string(), ":", line}, "debug");
        continue;
      }
      contents.emplace_back(std::move(r));
    }
    return contents;
  }


  bool soname_like(const std::string_view& path) {
    return std::regex_match(path.begin(), path.end(), so_pattern);
  }


  bool bin_like(const std::string_view& path) {
    return path.contains("bin") || path.contains("libexec");
  }
}
