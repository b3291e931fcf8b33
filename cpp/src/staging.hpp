#pragma once
/**
 * @brief Staging output.
 * Regenerated records are never written into the live VDB. They go into a staging
 * tree with the same ${CATEGORY}/${PF} layout, which can be reviewed and copied over.
 */

#include "shared.hpp"

namespace staging {

  /**
   * @brief Thrown when asked to write an empty record.
   * Executable-only packages legitimately produce some empty records, so this is
   * usually harmless.
   */
  class empty_record : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
  };


  /**
   * @brief Writes records into the staging tree.
   */
  class Writer {
    private:

      // The live VDB, which absolute paths are rewritten from.
      std::filesystem::path database;

      // Where everything ends up.
      std::filesystem::path root;

    public:

      /**
       * @brief Construct a writer.
       * @param db: The VDB.
       * @param output: The staging root. If empty, a new temporary directory is
       * created, and left behind for review.
       */
      Writer(const std::filesystem::path& db, const std::string& output = "");

      /**
       * @brief Return the staging root.
       */
      const std::filesystem::path& get_root() const {return root;}

      /**
       * @brief Rewrite a package path into the staging tree.
       * @param package: An absolute path under the VDB, or a relative ${CATEGORY}/${PF}.
       * @returns The equivalent path under the staging root.
       * @throws std::runtime_error if the result would fall outside the staging root.
       */
      std::filesystem::path rewrite(const std::filesystem::path& package) const;

      /**
       * @brief Write a record.
       * @param package: An absolute path under the VDB, or a relative ${CATEGORY}/${PF}.
       * @param name: The record, IE PROVIDES.
       * @param content: What to write.
       * @returns The path written.
       * @throws empty_record if content is empty.
       * @throws std::runtime_error if the path falls outside the staging root, or
       * cannot be written.
       */
      std::filesystem::path write(const std::filesystem::path& package, const std::string& name, const std::string& content) const;
  };
}
