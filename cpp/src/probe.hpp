#pragma once
/**
 * @brief Content-type probing.
 * Deciding whether an installed file is an ELF shared object or a dynamically
 * linked executable is delegated to file(1). The probe is an interface so that the
 * classifier can be driven by canned descriptions.
 */

#include "shared.hpp"

namespace probe {

  // What a file turned out to be.
  enum struct kind {none, shared_object, executable};


  /**
   * @brief Something that can describe the contents of a file.
   */
  class ContentProbe {
    public:
      virtual ~ContentProbe() = default;

      /**
       * @brief Describe a file.
       * @param path: The absolute path to the file.
       * @returns A human readable description, in the style of file(1).
       * @throws std::exception if the file could not be examined.
       */
      virtual std::string describe(const std::string& path) = 0;
  };


  /**
   * @brief A ContentProbe backed by file(1).
   */
  class FileProbe : public ContentProbe {
    public:
      std::string describe(const std::string& path) override;
  };


  /**
   * @brief Classify a description.
   * @param description: The output of a ContentProbe.
   * @returns kind::none unless the file is both ELF and dynamically linked.
   */
  kind classify(const std::string_view& description);


  /**
   * @brief Whether the description is of a shared object, as scanelf's
   * implicit soname inference understands it.
   */
  inline bool sb_shared_object(const std::string_view& description) {return description.contains("SB shared object");}
}
