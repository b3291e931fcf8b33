#pragma once
/**
 * @brief Linkage Fact Extraction
 * Regenerates the raw NEEDED and NEEDED.ELF.2 records for a set of binaries, in the
 * same format Portage's install_qa_check writes into build-info/ during a merge.
 */

#include "shared.hpp"
#include "probe.hpp"

#include <optional>

namespace linkage {

  /**
   * @brief Where extracted records end up.
   * @param work: The working directory handed to the extractor.
   */
  inline std::filesystem::path build_info(const std::filesystem::path& work) {return work / "build-info";}


  /**
   * @brief Something that can extract linkage facts from binaries.
   */
  class Extractor {
    public:
      virtual ~Extractor() = default;

      /**
       * @brief Extract linkage facts.
       * @param work: A working directory. Records are written to build_info(work).
       * @param binaries: Absolute paths to the binaries.
       * @note If there is nothing to report, build_info(work)/NEEDED is not created.
       */
      virtual void extract(const std::filesystem::path& work, const shared::vector& binaries) = 0;
  };


  /**
   * @brief One object, as reported by scanelf -F '%a;%p;%S;%r;%n'
   */
  struct scanned {
    std::string arch, path, soname, rpath, needed;

    // The NEEDED line: PATH NEEDED
    std::string needed_line() const {return path + ' ' + needed;}

    // The NEEDED.ELF.2 line: ARCH;PATH;SONAME;RPATH;NEEDED
    std::string elf2_line() const {return arch + ';' + path + ';' + soname + ';' + rpath + ';' + needed;}
  };


  /**
   * @brief Parse a line of scanelf output.
   * @param line: The line.
   * @returns The object, or nothing if the line is malformed.
   */
  std::optional<scanned> parse(const std::string& line);


  /**
   * @brief Write scanelf output into build_info(work) as NEEDED and NEEDED.ELF.2.
   * @param work: The working directory.
   * @param lines: Output of scanelf -F '%a;%p;%S;%r;%n'. Malformed lines are skipped.
   * @param probe: Asked about objects without a soname, so one can be inferred.
   * @returns Whether anything was written. Nothing is created if there were no objects.
   */
  bool write(const std::filesystem::path& work, const shared::vector& lines, probe::ContentProbe& probe);


  /**
   * @brief An Extractor backed by scanelf.
   */
  class Scanelf : public Extractor {
    private:

      // Used to infer implicit sonames.
      probe::ContentProbe& probe;

    public:
      explicit Scanelf(probe::ContentProbe& p) : probe(p) {}
      void extract(const std::filesystem::path& work, const shared::vector& binaries) override;
  };
}
