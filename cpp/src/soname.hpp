#pragma once
/**
 * @brief Soname Dependency Synthesis
 * PROVIDES and REQUIRES are derived from NEEDED.ELF.2, which has one line per ELF
 * object in the package:
 *
 *   ARCH;PATH;SONAME;RUNPATH1:RUNPATH2;NEEDED1,NEEDED2[;MULTILIB_CATEGORY]
 *
 * Each object contributes its soname to PROVIDES, and its NEEDED entries to REQUIRES,
 * keyed by multilib category so that identically named libraries of different ABIs
 * stay apart. Requirements satisfied by the package itself are dropped, as Portage
 * does when it writes these records on merge.
 *
 * scanelf does not report a multilib category, so one is approximated from the
 * architecture the same way Portage's linkage map does it.
 */

#include "shared.hpp"

#include <array>
#include <map>
#include <optional>

namespace soname {

  // Architectures that have a known multilib category.
  enum struct arch {
    i386, m68k, aarch64, alpha, arm, ia_64, mips, parisc,
    ppc, ppc64, s390, sh, sparc, sparc32plus, sparcv9, x86_64
  };

  struct arch_info {
    arch id;
    std::string_view tag;
    std::string_view category;
  };

  // scanelf's %a, with EM_ stripped, to multilib category.
  constexpr std::array<arch_info, 16> architectures = {{
    {arch::i386, "386", "x86_32"},
    {arch::m68k, "68K", "m68k_32"},
    {arch::aarch64, "AARCH64", "arm_64"},
    {arch::alpha, "ALPHA", "alpha_64"},
    {arch::arm, "ARM", "arm_32"},
    {arch::ia_64, "IA_64", "ia64_64"},
    {arch::mips, "MIPS", "mips_o32"},
    {arch::parisc, "PARISC", "hppa_64"},
    {arch::ppc, "PPC", "ppc_32"},
    {arch::ppc64, "PPC64", "ppc_64"},
    {arch::s390, "S390", "s390_64"},
    {arch::sh, "SH", "sh_32"},
    {arch::sparc, "SPARC", "sparc_32"},
    {arch::sparc32plus, "SPARC32PLUS", "sparc_32"},
    {arch::sparcv9, "SPARCV9", "sparc_64"},
    {arch::x86_64, "X86_64", "x86_64"},
  }};


  /**
   * @brief Look up an architecture tag.
   * @param tag: The tag, IE X86_64
   * @returns The architecture, if it's in the table.
   */
  std::optional<arch> parse_arch(const std::string_view& tag);


  /**
   * @brief Approximate the multilib category of an architecture.
   * @param tag: The architecture tag.
   * @returns The category, or the tag itself if the architecture is unknown.
   * @note This is a best-effort approximation, not real ABI detection.
   */
  std::string multilib_category(const std::string_view& tag);


  /**
   * @brief A malformed NEEDED.ELF.2 line.
   */
  class parse_error : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
  };


  /**
   * @brief A package that installs shared libraries, but provides nothing.
   */
  class synthesis_error : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
  };


  /**
   * @brief One line of NEEDED.ELF.2
   */
  struct entry {
    std::string arch, filename, soname;
    shared::vector runpaths, needed;
    std::optional<std::string> multilib_category;

    /**
     * @brief Parse a line.
     * @param line: The line, without a trailing newline.
     * @returns The entry.
     * @throws parse_error if there are fewer than five fields.
     */
    static entry parse(const std::string_view& line);
  };

  using entries_t = std::vector<entry>;


  /**
   * @brief Parse an entire NEEDED.ELF.2 file.
   * @param contents: The file contents.
   * @returns The entries. Blank lines are skipped.
   * @throws parse_error on the first malformed line.
   */
  entries_t parse(const std::string& contents);


  // multilib category -> sonames. Ordered, so output is stable.
  using soname_map = std::map<std::string, shared::set>;


  /**
   * @brief The synthesized soname dependencies of a package.
   */
  struct deps_t {
    soname_map provides, requires_;

    /**
     * @brief Render a map the way Portage writes PROVIDES and REQUIRES.
     * @param map: The map.
     * @returns One "category: soname soname" line per category, or an empty string.
     */
    static std::string record(const soname_map& map);

    std::string provides_record() const {return record(provides);}
    std::string requires_record() const {return record(requires_);}

    bool operator==(const deps_t&) const = default;
  };


  /**
   * @brief Synthesize PROVIDES and REQUIRES.
   * @param entries: The NEEDED.ELF.2 entries of one package. Entries missing a multilib
   * category have one filled in.
   * @returns The dependency sets.
   */
  deps_t synthesize(entries_t entries);


  /**
   * @brief Ensure the synthesized dependencies make sense for the package.
   * @param deps: The dependencies.
   * @param shared_libs: Whether the package installs shared libraries.
   * @param cpf: The package, for the error.
   * @throws synthesis_error if the package installs shared libraries but provides nothing.
   */
  void verify(const deps_t& deps, const bool& shared_libs, const std::string& cpf);
}
