#pragma once
/**
 * @brief VDB Repair
 * Repair is done in two phases. The scan classifies every package in the VDB, and only
 * if none of them were ambiguous does the repair regenerate the ELF metadata of the
 * broken ones into the staging tree. That way an operator sees the whole picture before
 * anything is written.
 */

#include "shared.hpp"
#include "linkage.hpp"
#include "probe.hpp"
#include "staging.hpp"
#include "vdb.hpp"

namespace repair {

  /**
   * @brief The result of the first phase.
   */
  struct scan_t {
    std::vector<vdb::package> packages;
    size_t ambiguous = 0;

    /**
     * @brief ${CATEGORY}/${PF} of every broken package.
     */
    shared::vector broken() const;
  };


  /**
   * @brief Classify every package in the VDB.
   * @param root: The VDB.
   * @param deep: Probe every installed object.
   * @param probe: The content probe.
   * @returns Every package, and the number that were ambiguous.
   * @throws vdb::missing_manifest if a package has no CONTENTS.
   */
  scan_t scan(const std::filesystem::path& root, const bool& deep, probe::ContentProbe& probe);


  // What happened to a single package.
  enum struct outcome {written, nothing};


  /**
   * @brief Regenerate NEEDED, NEEDED.ELF.2, PROVIDES and REQUIRES for a broken package.
   * @param pkg: The package.
   * @param extractor: Where linkage facts come from.
   * @param writer: Where the records go.
   * @returns outcome::nothing if the extractor had nothing to say about the binaries,
   * such as for statically linked or stripped objects.
   * @throws soname::parse_error, soname::synthesis_error, or std::runtime_error if the
   * records could not be generated or written.
   */
  outcome fix(const vdb::package& pkg, linkage::Extractor& extractor, const staging::Writer& writer);


  /**
   * @brief A summary of the second phase.
   */
  struct report_t {
    size_t written = 0, nothing = 0;
    shared::vector failed;
  };


  /**
   * @brief Fix every broken package.
   * @param scan: The scan.
   * @param extractor: Where linkage facts come from.
   * @param writer: Where the records go.
   * @returns What happened. A package that fails does not stop the others.
   * @throws std::runtime_error if the scan found ambiguous packages.
   */
  report_t run(const scan_t& scan, linkage::Extractor& extractor, const staging::Writer& writer);
}
