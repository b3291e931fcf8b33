#include <algorithm>

#include "vdb.hpp"

using namespace shared;
namespace fs = std::filesystem;

namespace vdb {

  std::string_view to_string(const verdict& v) {
    switch (v) {
      case verdict::fine: return "fine";
      case verdict::broken: return "broken";
      case verdict::ambiguous: return "ambiguous";
    }
    return "unknown";
  }


  records_t records(const fs::path& dir) {
    return {
      .needed = fs::exists(dir / "NEEDED"),
      .needed_elf2 = fs::exists(dir / "NEEDED.ELF.2"),
      .provides = fs::exists(dir / "PROVIDES"),
      .requires_ = fs::exists(dir / "REQUIRES"),
    };
  }


  bool package::soname_like() const {
    return std::any_of(binaries.begin(), binaries.end(), [](const std::string& path) {return manifest::soname_like(path);});
  }


  std::string package::facts() const {
    auto yes = [](const bool& b) {return b ? "yes" : "no";};
    std::stringstream out;
    out << cpf << " (" << path.string() << ")\n"
        << "  NEEDED:        " << yes(records.needed) << '\n'
        << "  NEEDED.ELF.2:  " << yes(records.needed_elf2) << '\n'
        << "  PROVIDES:      " << yes(records.provides) << '\n'
        << "  REQUIRES:      " << yes(records.requires_) << '\n'
        << "  shared libs:   " << yes(shared_libs) << '\n'
        << "  executables:   " << yes(executables) << '\n'
        << "  verdict:       " << to_string(status) << '\n';
    for (const auto& binary : binaries)
      out << "  binary:        " << binary << '\n';
    return out.str();
  }


  bool matches(const match& m, const bool& value) {
    return m == match::any || (m == match::yes) == value;
  }


  verdict decide(const records_t& r, const bool& shared_libs, const bool& executables) {
    for (const auto& row : table) {
      if (
        matches(row.needed, r.needed) &&
        matches(row.provides, r.provides) &&
        matches(row.requires_, r.requires_) &&
        matches(row.shared_libs, shared_libs) &&
        matches(row.executables, executables)
      ) return row.result;
    }
    return verdict::ambiguous;
  }


  bool candidate(const std::string_view& cpf) {
    auto slash = cpf.find('/');
    if (slash == std::string_view::npos) return false;
    auto category = cpf.substr(0, slash), name = cpf.substr(slash + 1);

    if (category == "virtual" || category.starts_with("acct-")) return false;
    if (name.contains("-MERGING-")) return false;
    if (name.contains(".portage_lockfile")) return false;
    return !name.empty();
  }


  std::vector<std::pair<std::string, fs::path>> discover(const fs::path& root) {
    if (!fs::is_directory(root)) throw std::runtime_error("Not a VDB: " + root.string());

    std::vector<std::pair<std::string, fs::path>> found;
    for (const auto& category : fs::directory_iterator(root)) {
      if (!category.is_directory()) continue;
      for (const auto& entry : fs::directory_iterator(category.path())) {
        if (!entry.is_directory()) continue;
        auto cpf = category.path().filename().string() + "/" + entry.path().filename().string();
        if (candidate(cpf)) found.emplace_back(cpf, entry.path());
        else log({"Ignoring", cpf}, "debug");
      }
    }
    std::sort(found.begin(), found.end());
    return found;
  }


  package classify(const fs::path& dir, const std::string& cpf, const bool& deep, probe::ContentProbe& probe) {
    package pkg = {.cpf = cpf, .path = dir, .records = records(dir)};

    // If they have a PROVIDES and a NEEDED entry they're not affected by the bug.
    if (pkg.records.needed && pkg.records.provides) {
      log({"Skipping", cpf});
      pkg.status = decide(pkg.records, false, false);
      return pkg;
    }

    const auto manifest_path = dir / "CONTENTS";
    if (!fs::exists(manifest_path)) throw missing_manifest(cpf + " has no CONTENTS file!");
    const auto contents = manifest::read(manifest_path);

    for (const auto& record : contents) {
      if (record.type != manifest::kind::obj) continue;
      const auto& path = record.path;

      // If it's not .so-like, we'll still consider it if there's *bin* or *libexec*
      // in the path, to allow for packages which only install executables.
      if (!deep && !manifest::soname_like(path) && !manifest::bin_like(path)) continue;

      // Skip false positives where possible
      if (path.starts_with("/usr/share/") || path.starts_with("/usr/include/")) continue;

      std::string description;
      try {
        description = probe.describe(path);
      }
      catch (const std::exception& e) {
        warning({"Failed to probe", path, "for", cpf, ":", e.what()});
        continue;
      }

      auto kind = probe::classify(description);
      if (kind == probe::kind::none) {
        log({"Skipping", cpf + "'s", path, "because file says not a dynamically linked ELF object"});
        continue;
      }

      if (kind == probe::kind::shared_object) pkg.shared_libs = true;
      else pkg.executables = true;
      pkg.binaries.emplace_back(path);
    }

    pkg.status = decide(pkg.records, pkg.shared_libs, pkg.executables);

    switch (pkg.status) {
      case verdict::broken:
        // Dynamically linked executables alone aren't worth warning about.
        if (pkg.soname_like())
          notice({"!!!", cpf, "installed a dynamic library (or dyn. linked executable) with missing ELF metadata!"});
        else log({cpf, "is missing ELF metadata"});
        break;
      case verdict::ambiguous:
        warning({"Unable to decide whether", cpf, "is broken, it needs attention:\n" + pkg.facts()}, true);
        break;
      case verdict::fine:
        log({cpf, "is fine"}, "debug");
        break;
    }
    return pkg;
  }
}
