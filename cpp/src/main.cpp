#include "arguments.hpp"
#include "linkage.hpp"
#include "probe.hpp"
#include "repair.hpp"
#include "shared.hpp"
#include "staging.hpp"
#include "vdb.hpp"

#include <iostream>
#include <memory>

using namespace shared;
namespace fs = std::filesystem;


// Main
int main(int argc, char* argv[]) {

  // Parse those args.
  arg::args = vector(argv + 1, argv + argc);
  try {
    if (!arg::parse_args()) return 0;
  }
  catch (std::runtime_error& e) {
    warning({"Failed to parse arguments:", e.what()}, true);
    return 1;
  }

  const auto vdb_path = fs::path(arg::get("vdb"));
  auto file = probe::FileProbe();

  // Phase one: look at everything, and write nothing.
  repair::scan_t scan;
  try {
    scan = repair::scan(vdb_path, arg::at("deep") >= "true", file);
  }
  catch (const vdb::missing_manifest& e) {
    warning({"!!!", e.what()}, true);
    return 1;
  }
  catch (const std::runtime_error& e) {
    warning({"Failed to scan", vdb_path.string(), ":", e.what()}, true);
    return 1;
  }

  if (scan.ambiguous != 0) {
    warning({std::to_string(scan.ambiguous), "package(s) could not be classified. Refusing to write anything until they have been looked at."}, true);
    return 1;
  }

  const auto broken = scan.broken();
  if (arg::at("list") >= "true") {
    // Give exact versions suitable for emerge.
    for (const auto& cpf : broken) std::cout << '=' << cpf << '\n';
    return 0;
  }

  if (broken.empty()) {
    notice({">>> No broken packages found in", vdb_path.string()});
    return 0;
  }

  // Phase two: regenerate the metadata into the staging tree.
  std::unique_ptr<staging::Writer> writer;
  try {
    writer = std::make_unique<staging::Writer>(vdb_path, arg::get("output"));
  }
  catch (const std::exception& e) {
    warning({"Failed to create output directory:", e.what()}, true);
    return 1;
  }

  std::cout << std::endl;
  notice({">> Writing to output directory:", writer->get_root().string()});

  auto scanelf = linkage::Scanelf(file);
  const auto report = repair::run(scan, scanelf, *writer);

  notice({">>> Written to output directory:", writer->get_root().string()});
  log({
    std::to_string(report.written), "fixed,",
    std::to_string(report.nothing), "with nothing to fix,",
    std::to_string(report.failed.size()), "failed"
  });
  if (!report.failed.empty())
    warning({"Failed to regenerate metadata for:", join(report.failed, ' ')}, true);
  return 0;
}
