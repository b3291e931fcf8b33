#pragma once
/**
 * @brief Installed-file manifests.
 * Every package in the VDB carries a CONTENTS file listing what it installed, one
 * record per line:
 *
 *   dir /usr/lib64
 *   obj /usr/lib64/libfoo.so.1.2.3 d41d8cd98f00b204e9800998ecf8427e 1700000000
 *   sym /usr/lib64/libfoo.so.1 -> libfoo.so.1.2.3 1700000000
 *
 * Paths may contain spaces, so the trailing fields are split off from the right.
 */

#include "shared.hpp"

namespace manifest {

  // Record types found in CONTENTS.
  enum struct kind {obj, dir, sym, dev, fif, unknown};

  /**
   * @brief One installed file.
   */
  struct record {
    kind type = kind::unknown;
    std::string path;

    // obj only.
    std::string md5, mtime;

    // sym only.
    std::string target;
  };

  using contents_t = std::vector<record>;


  /**
   * @brief Parse a single CONTENTS line.
   * @param line: The line.
   * @returns The record, with kind::unknown if the line could not be understood.
   */
  record parse(const std::string_view& line);


  /**
   * @brief Read a CONTENTS file.
   * @param path: Path to the file.
   * @returns Every record, in file order. Blank and unparseable lines are dropped.
   * @throws std::runtime_error if the file does not exist.
   */
  contents_t read(const std::filesystem::path& path);


  /**
   * @brief Whether a path looks like a shared library: .so, or .so.VERSION
   */
  bool soname_like(const std::string_view& path);


  /**
   * @brief Whether a path looks like it holds executables.
   */
  bool bin_like(const std::string_view& path);
}
