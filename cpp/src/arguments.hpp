#pragma once
/**
 * @brief Command-line switches.
 * Every switch holds a string value. Switches with a list of levels, such as
 * --verbose {false,log,debug}, can be stepped through by repeating them (-vv), and
 * compared by level. Values can be given as --key=value, --key value, or -k value.
 * Defaults can be overridden by a configuration file before the command line is read.
 */

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include "shared.hpp"


namespace arg {

  // Whether a switch with levels accepts values outside of them.
  enum struct custom_policy {FALSE, TRUE};


  /**
   * @brief The definition of a switch.
   */
  struct config {
    std::string l_name;
    std::string s_name = "";
    std::string def = "false";

    // Levels after the default. Empty for free-form switches.
    shared::vector levels = {};
    custom_policy custom = custom_policy::FALSE;
    std::string help;
  };


  /**
   * @brief A command-line switch.
   */
  class Arg {
    private:
      config conf;
      std::string value;

      // The default first, then conf.levels.
      shared::vector order;

      // Applied to every value before it is stored.
      std::function<std::string(const std::string_view&)> parser;

      bool known(const std::string_view& val) const {return std::find(order.begin(), order.end(), val) != order.end();}

      /**
       * @brief Store a value given for this switch.
       * @param key: The switch as written. Ignored unless it names this switch.
       * @param val: The value. "!" restores the default.
       * @returns Whether key named this switch.
       * @throws std::runtime_error if the value is not one of the levels.
       */
      bool assign(const std::string_view& key, const std::string_view& val) {
        if (key.empty() || (key != conf.l_name && key != conf.s_name)) return false;
        if (val == "!") value = parser(conf.def);
        else if (order.size() == 1 || conf.custom == custom_policy::TRUE || known(val)) value = parser(val);
        else throw std::runtime_error("Invalid value for " + conf.l_name + ": " + std::string(val));
        return true;
      }

      // Move to the next level, staying put at the last one.
      void step() {
        if (level() + 1u < order.size()) value = order[level() + 1];
        else std::cerr << conf.l_name << ": Already at highest level!" << std::endl;
      }

      uint_fast8_t rank(const std::string_view& val) const {return std::find(order.begin(), order.end(), val) - order.begin();}


    public:

      /**
       * @brief Construct a switch.
       * @param c: The definition.
       * @param handler: Normalizes values, IE stripping trailing slashes from paths.
       */
      Arg(
        config c,
        std::function<std::string(const std::string_view&)> handler = [](const std::string_view& v){return std::string(v);}
      ) : conf(std::move(c)), parser(std::move(handler)) {
        value = parser(conf.def);
        order = {conf.def};
        for (const auto& v : conf.levels) {
          if (v != conf.def) order.emplace_back(v);
        }
      }


      /**
       * @brief Try to consume the argument at args[x].
       * @param args: The command line.
       * @param x: The position. Advanced past the value if `--key value` was consumed.
       * @returns Whether the argument belonged to this switch.
       * @throws std::runtime_error("Help!") for -h/--help, std::runtime_error("Version")
       * for -V/--version, and std::runtime_error for bad or missing values.
       */
      bool digest(const shared::vector& args, size_t& x) {
        const auto& key = args[x];

        if (key == "--help" || key == "-h") throw std::runtime_error("Help!");
        if (key == "--version" || key == "-V") throw std::runtime_error("Version");

        // --key=value
        if (key.starts_with("--") && key.contains('=')) {
          auto split = key.find('=');
          return assign(std::string_view(key).substr(0, split), std::string_view(key).substr(split + 1));
        }

        // Chained short switches, IE -vvd. These never take values.
        if (key.length() > 2 && key[0] == '-' && key[1] != '-') {
          if (conf.s_name.length() != 2) return false;
          auto found = std::count(key.begin() + 1, key.end(), conf.s_name[1]);
          for (auto i = 0; i < found; ++i) step();
          return found != 0;
        }

        if (key.empty() || (key != conf.l_name && key != conf.s_name)) return false;

        // --key value, so long as the value isn't another switch.
        const auto has_value = x + 1 < args.size() && !args[x + 1].empty() && args[x + 1][0] != '-';
        if (has_value && (conf.custom == custom_policy::TRUE || known(args[x + 1])))
          return assign(key, args[++x]);

        // A bare --key steps a switch with levels.
        if (order.size() > 1) {
          step();
          return true;
        }
        throw std::runtime_error("Argument requires a value: " + conf.l_name);
      }


      /**
       * @brief One entry of --help.
       */
      std::string get_help() const {
        std::stringstream out;
        out << conf.l_name;
        if (!conf.s_name.empty()) out << '/' << conf.s_name;
        out << ' ';
        if (order.size() > 1) out << '{' << shared::join(order, ',') << '}';
        else if (conf.custom == custom_policy::TRUE) out << "VAL";
        out << "\n\t" << conf.help << '\n';
        return out.str();
      }


      auto&& get(this auto&& self) {return self.value;}


      /**
       * @brief Set the value as if --key=val were given.
       * @throws std::runtime_error if the value is invalid.
       */
      void emplace(const std::string& val) {assign(conf.l_name, val);}


      /**
       * @brief The position of the current value among the levels. The default is 0.
       */
      uint_fast8_t level() const {return rank(value);}

      // Whether the switch is above its default.
      operator bool() const {return level() != 0;}

      bool operator < (const std::string_view& val) const {return level() < rank(val);}
      bool operator >= (const std::string_view& val) const {return level() >= rank(val);}
  };


  // Every switch, by name.
  extern std::map<std::string, arg::Arg> switches;

  // Arguments no switch consumed.
  extern shared::vector unknown;

  // The command line, without argv[0].
  extern shared::vector args;


  inline Arg& at(const std::string& key) {
    if (!switches.contains(key)) throw std::runtime_error("Invalid argument: " + key);
    return switches.at(key);
  }
  inline const std::string& get(const std::string& key) {return at(key).get();}
  inline void emplace(const std::string& key, const std::string& val) {at(key).emplace(val);}


  /**
   * @brief Parse a configuration file of key=value defaults.
   * @param path: The file. A missing file is not an error.
   */
  void parse_config(const std::filesystem::path& path);


  // $XDG_CONFIG_HOME/recover-vdb/recover-vdb.conf
  std::filesystem::path config_file();


  /**
   * @brief Parse command line arguments.
   * @param conf: Configuration read before the command line.
   * @returns Whether the program should continue. --help and --version return false.
   * @throws std::runtime_error on malformed or unrecognized arguments.
   */
  bool parse_args(const std::filesystem::path& conf = config_file());
}
