#pragma once
/**
 * @brief Shared functionality.
 * Console output, scratch directories, and the handful of string helpers every
 * module leans on.
 */


#include <filesystem>
#include <set>
#include <random>
#include <sstream>
#include <exec.hpp>

namespace shared {

  // $HOME, and where configuration lives ($XDG_CONFIG_HOME, or ~/.config)
  extern const std::string home, config;

  using set = std::set<std::string>;
  using vector = std::vector<std::string>;
  using list = std::initializer_list<std::string_view>;


  /**
   * @brief A uniquely named scratch directory.
   * The directory is created on construction, and removed along with everything in it
   * when the object is destroyed, unless it was asked to persist.
   */
  class TemporaryDirectory {
    private:
      static std::mt19937_64 prng;

      std::string path;
      bool persist;

    public:

      /**
       * @brief Create a directory named PREFIX-HEX-SUFFIX.
       * @param parent: Where to create it.
       * @param prefix: Put before the random part of the name, if not empty.
       * @param suffix: Put after the random part of the name, if not empty.
       * @param keep: Leave the directory behind when the object is destroyed.
       * @throws std::filesystem::filesystem_error if the directory cannot be created.
       */
      TemporaryDirectory(
        const std::string& parent = std::filesystem::temp_directory_path(),
        const std::string_view& prefix = "", const std::string_view& suffix = "",
        const bool& keep = false
      );

      TemporaryDirectory(const TemporaryDirectory&) = delete;
      TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

      ~TemporaryDirectory();

      const std::string& get_path() const {return path;}
  };


  /**
   * @brief Print to stdout, if --verbose is at least level.
   * @param msg: Fragments, printed separated by spaces.
   * @param level: log or debug.
   */
  void log(const list& msg, const std::string& level="log");


  /**
   * @brief Print a progress line to stdout, whatever the verbosity.
   */
  void notice(const list& msg);


  /**
   * @brief Report a problem on stderr.
   * @param msg: Fragments, printed separated by spaces.
   * @param error: Prefix with ERROR rather than WARN.
   */
  void warning(const list& msg, const bool& error = false);


  /**
   * @brief Append the contents of a container.
   * @tparam T: list or vector.
   */
  template <class T = list> void extend(vector& dest, T source);


  /**
   * @brief Join a container of strings.
   * @tparam T: vector or set.
   * @param list: What to join.
   * @param joiner: Placed between each member.
   */
  template <class T = vector> std::string join(const T& list, const char& joiner =  ' ');


  /**
   * @brief Remove leading and trailing characters.
   * @tparam T: char, or a string_view of characters to remove.
   */
  template <typename T = char> std::string trim(const std::string& in, const T& to_strip);


  /**
   * @brief Split a delimited record into its fields.
   * @param line: The record.
   * @param delim: The field separator.
   * @returns Every field, including empty ones, so positions are preserved.
   */
  vector fields(const std::string_view& line, const char& delim);
}
