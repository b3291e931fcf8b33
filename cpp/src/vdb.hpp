#pragma once
/**
 * @brief VDB Corruption Classification
 * Portage records NEEDED, NEEDED.ELF.2, PROVIDES and REQUIRES for every package that
 * installs ELF objects. A bug left some packages without them, which breaks soname
 * dependency resolution. This header contains the package model and the logic that
 * walks the database and decides, per package, whether the records are missing.
 *
 * Classification is presence based: which of the four records exist, and whether the
 * package installs shared objects and/or dynamically linked executables, is run through
 * a fixed decision table. Combinations the table does not cover are reported as
 * ambiguous and never repaired automatically.
 */

#include "shared.hpp"
#include "manifest.hpp"
#include "probe.hpp"

#include <array>

namespace vdb {

  enum struct verdict {fine, broken, ambiguous};

  /**
   * @brief Name a verdict.
   */
  std::string_view to_string(const verdict& v);


  /**
   * @brief Which ELF metadata records a package directory carries.
   */
  struct records_t {
    bool needed = false, needed_elf2 = false, provides = false, requires_ = false;
  };


  /**
   * @brief Look for the metadata records in a package directory.
   * @param dir: The package directory.
   */
  records_t records(const std::filesystem::path& dir);


  /**
   * @brief An installed package, as the VDB sees it.
   */
  struct package {

    // ${CATEGORY}/${PF}, IE net-misc/openssh-8.6_p1-r2
    std::string cpf;

    // Absolute path to the package directory.
    std::filesystem::path path;

    records_t records;

    // What the installed ELF objects turned out to be.
    bool shared_libs = false, executables = false;

    verdict status = verdict::fine;

    // Dynamically linked objects that need to be rescanned to fix the package.
    shared::vector binaries;

    /**
     * @brief Whether any of the binaries looks like a shared library by name.
     */
    bool soname_like() const;

    /**
     * @brief A dump of everything known about the package, for reporting.
     */
    std::string facts() const;
  };


  /**
   * @brief Thrown when a package directory has no CONTENTS.
   * That is corruption of its own, and not something this tool can fix.
   */
  class missing_manifest : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
  };


  // One column of the decision table.
  enum struct match {no, yes, any};

  /**
   * @brief One row of the decision table.
   */
  struct rule {
    match needed, provides, requires_, shared_libs, executables;
    verdict result;
  };

  // Rows are checked in order. Anything that falls through is ambiguous.
  constexpr std::array<rule, 6> table = {{
    // Both present: the only cheap success path.
    {match::yes, match::yes, match::any, match::any, match::any, verdict::fine},

    // Nothing of interest installed.
    {match::any, match::any, match::any, match::no, match::no, verdict::fine},

    // NEEDED without PROVIDES is normal for packages that only install executables.
    {match::yes, match::no, match::any, match::no, match::yes, verdict::fine},
    {match::yes, match::no, match::any, match::yes, match::any, verdict::broken},

    // PROVIDES without NEEDED is never legitimate.
    {match::no, match::yes, match::any, match::any, match::any, verdict::broken},

    // Nothing recorded at all, yet something was installed.
    {match::no, match::no, match::no, match::any, match::any, verdict::broken},
  }};


  /**
   * @brief Run the decision table.
   * @param r: The records present.
   * @param shared_libs: Whether the package installs ELF shared objects.
   * @param executables: Whether the package installs dynamically linked executables.
   * @returns The verdict.
   */
  verdict decide(const records_t& r, const bool& shared_libs, const bool& executables);


  /**
   * @brief Whether a ${CATEGORY}/${PF} is a real installed package.
   * @param cpf: The category and directory name.
   * @returns false for virtuals, accounts, in-progress merges and lock files.
   */
  bool candidate(const std::string_view& cpf);


  /**
   * @brief Find every candidate package directory.
   * @param root: The VDB.
   * @returns ${CATEGORY}/${PF} paired with the absolute directory, sorted.
   * @throws std::runtime_error if root is not a directory.
   */
  std::vector<std::pair<std::string, std::filesystem::path>> discover(const std::filesystem::path& root);


  /**
   * @brief Classify a single package.
   * @param dir: The package directory.
   * @param cpf: ${CATEGORY}/${PF}
   * @param deep: Probe every obj in CONTENTS, rather than just those that look like
   * libraries or live under bin/libexec.
   * @param probe: The content probe.
   * @returns The package, with its verdict.
   * @throws missing_manifest if CONTENTS needs to be read, but doesn't exist.
   * @note Probe failures are logged and the offending file skipped.
   */
  package classify(const std::filesystem::path& dir, const std::string& cpf, const bool& deep, probe::ContentProbe& probe);
}
