#include "repair.hpp"
#include "soname.hpp"

#include <array>

using namespace shared;
using namespace exec;
namespace fs = std::filesystem;

namespace repair {

  vector scan_t::broken() const {
    vector ret;
    for (const auto& pkg : packages) {
      if (pkg.status == vdb::verdict::broken) ret.emplace_back(pkg.cpf);
    }
    return ret;
  }


  scan_t scan(const fs::path& root, const bool& deep, probe::ContentProbe& probe) {
    scan_t result;
    for (const auto& [cpf, dir] : vdb::discover(root)) {
      auto pkg = vdb::classify(dir, cpf, deep, probe);
      if (pkg.status == vdb::verdict::ambiguous) ++result.ambiguous;
      result.packages.emplace_back(std::move(pkg));
    }
    return result;
  }


  outcome fix(const vdb::package& pkg, linkage::Extractor& extractor, const staging::Writer& writer) {
    notice({">>> Fixing VDB for", pkg.cpf});

    // 1) We create NEEDED, NEEDED.ELF.2.
    std::string needed, elf2;
    {
      auto work = TemporaryDirectory(fs::temp_directory_path(), "recover-vdb");
      extractor.extract(work.get_path(), pkg.binaries);

      const auto info = linkage::build_info(work.get_path());
      if (!fs::exists(info / "NEEDED") || fs::is_empty(info / "NEEDED")) {
        // Not an interesting binary.
        notice({">>> Nothing to fix for", pkg.cpf + ", blank NEEDED"});
        return outcome::nothing;
      }

      needed = file::parse<std::string>((info / "NEEDED").string(), dump);
      if (fs::exists(info / "NEEDED.ELF.2"))
        elf2 = file::parse<std::string>((info / "NEEDED.ELF.2").string(), dump);
    }

    // 2) We now generate PROVIDES, REQUIRES.
    auto deps = soname::synthesize(soname::parse(elf2));
    soname::verify(deps, pkg.shared_libs, pkg.cpf);

    const std::array<std::pair<std::string, std::string>, 4> records = {{
      {"NEEDED", needed},
      {"NEEDED.ELF.2", elf2},
      {"PROVIDES", deps.provides_record()},
      {"REQUIRES", deps.requires_record()},
    }};

    for (const auto& [name, content] : records) {
      // No libraries, no PROVIDES. Don't try to write it out.
      if (name == "PROVIDES" && content.empty() && !pkg.shared_libs) continue;

      log({"File:", name});
      log({"Value:", content});

      try {
        writer.write(pkg.path, name, content);
      }
      catch (const staging::empty_record& e) {
        log({e.what(), "(likely harmless, skipping)"});
      }
    }

    notice({">>> Generated fixed VDB files for", pkg.cpf});
    return outcome::written;
  }


  report_t run(const scan_t& scan, linkage::Extractor& extractor, const staging::Writer& writer) {
    if (scan.ambiguous != 0)
      throw std::runtime_error("Refusing to repair with " + std::to_string(scan.ambiguous) + " ambiguous package(s) in the VDB");

    report_t report;
    for (const auto& pkg : scan.packages) {
      if (pkg.status != vdb::verdict::broken) continue;
      try {
        if (fix(pkg, extractor, writer) == outcome::written) ++report.written;
        else ++report.nothing;
      }
      catch (const std::exception& e) {
        warning({"Failed to fix", pkg.cpf, ":", e.what()}, true);
        report.failed.emplace_back(pkg.cpf);
      }
    }
    return report;
  }
}
