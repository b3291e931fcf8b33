#include <algorithm>

#include "soname.hpp"

using namespace shared;
using namespace exec;
namespace fs = std::filesystem;

namespace soname {

  std::optional<arch> parse_arch(const std::string_view& tag) {
    for (const auto& info : architectures) {
      if (info.tag == tag) return info.id;
    }
    return std::nullopt;
  }


  std::string multilib_category(const std::string_view& tag) {
    auto id = parse_arch(tag);
    if (!id) return std::string(tag);
    for (const auto& info : architectures) {
      if (info.id == *id) return std::string(info.category);
    }
    return std::string(tag);
  }


  // Split a list field, dropping empty members.
  vector members(const std::string& field, const char& delim) {
    if (field.empty()) return {};
    auto split = container::init<vector>(container::split<vector, char>, field, delim, false);
    std::erase_if(split, [](const std::string& x) {return x.empty();});
    return split;
  }


  entry entry::parse(const std::string_view& line) {
    auto fields = shared::fields(line, ';');
    if (fields.size() < 5)
      throw parse_error("Wrong number of fields in NEEDED.ELF.2: " + std::string(line));

    entry e;
    e.arch = fields[0];
    e.filename = fields[1];
    e.soname = fields[2];
    e.runpaths = members(fields[3], ':');
    e.needed = members(fields[4], ',');

    // Extra fields may exist, for future extensions.
    if (fields.size() > 5 && !fields[5].empty()) e.multilib_category = fields[5];
    return e;
  }


  entries_t parse(const std::string& contents) {
    entries_t entries;
    std::stringstream in(contents);
    for (std::string line; std::getline(in, line);) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.empty()) continue;
      entries.emplace_back(entry::parse(line));
    }
    return entries;
  }


  std::string deps_t::record(const soname_map& map) {
    std::stringstream out;
    for (const auto& [category, sonames] : map) {
      if (sonames.empty()) continue;
      out << category << ": " << join(sonames, ' ') << '\n';
    }
    return out.str();
  }


  // Normalize a path for comparison, IE /usr/lib64/../lib/ -> /usr/lib
  std::string normalize(const std::string& path) {
    auto normal = fs::path(path).lexically_normal().string();
    while (normal.length() > 1 && normal.ends_with('/')) normal.pop_back();
    return normal;
  }


  // Expand $ORIGIN and ${ORIGIN} in a runpath.
  std::string expand_origin(std::string runpath, const std::string& origin) {
    for (const auto& variable : {"${ORIGIN}", "$ORIGIN"}) {
      const std::string_view v = variable;
      for (auto pos = runpath.find(v); pos != std::string::npos; pos = runpath.find(v, pos + origin.length()))
        runpath.replace(pos, v.length(), origin);
    }
    return normalize(runpath);
  }


  deps_t synthesize(entries_t entries) {
    deps_t deps;

    // category -> needed soname -> the runpaths of each object that needs it.
    // An object without a runpath contributes an empty set.
    std::map<std::string, std::map<std::string, std::set<set>>> needed;

    for (auto& e : entries) {
      // We copy Portage's detection logic from LinkageMapELF to fill in the gap.
      if (!e.multilib_category) e.multilib_category = multilib_category(e.arch);
      const auto& category = *e.multilib_category;

      if (!e.soname.empty()) deps.provides[category].emplace(e.soname);

      const auto origin = normalize(fs::path(e.filename).parent_path().string());
      set runpaths;
      for (const auto& runpath : e.runpaths)
        runpaths.emplace(expand_origin(runpath, origin));
      for (const auto& lib : e.needed)
        needed[category][lib].emplace(runpaths);
    }

    for (auto& [category, sonames] : needed) {
      auto& required = deps.requires_[category];

      // Nothing provided in this category, so nothing can satisfy a requirement internally.
      const auto provided = deps.provides.find(category);
      if (provided == deps.provides.end()) {
        for (const auto& [lib, runpaths] : sonames) required.emplace(lib);
        continue;
      }

      for (auto& [lib, runpaths] : sonames) {
        if (provided->second.contains(lib)) continue;

        // An object named lib satisfies every requirer whose runpaths include its directory.
        for (const auto& e : entries) {
          if (*e.multilib_category != category || fs::path(e.filename).filename() != lib) continue;
          const auto dir = normalize(fs::path(e.filename).parent_path().string());
          std::erase_if(runpaths, [&dir](const set& r) {return r.contains(dir);});
        }
        if (!runpaths.empty()) required.emplace(lib);
      }
    }
    std::erase_if(deps.requires_, [](const auto& x) {return x.second.empty();});
    return deps;
  }


  void verify(const deps_t& deps, const bool& shared_libs, const std::string& cpf) {
    // It's fine if we didn't install any libraries, since packages with just dynamically
    // linked executables usually won't have a PROVIDES.
    if (shared_libs && deps.provides.empty())
      throw synthesis_error(cpf + " installed dynamic libraries(?) but no PROVIDES generated!");
  }
}
