#include "arguments.hpp"


#ifndef VERSION
#define VERSION "Unknown"
#endif

using namespace shared;
using namespace exec;

namespace arg {

  vector unknown = {}, args;


  // Strip trailing slashes, so paths compare and rewrite cleanly.
  std::string directory(const std::string_view& v) {
    auto path = std::string(v);
    while (path.length() > 1 && path.ends_with('/')) path.pop_back();
    return path;
  }


  std::map<std::string, arg::Arg> switches = {
    {"help", arg::config{.l_name = "--help", .s_name = "-h", .help = "Print this message"}},
    {"version", arg::config{.l_name = "--version", .s_name = "-V", .help = "Print the version"}},
    {"verbose", arg::config{
      .l_name = "--verbose", .s_name = "-v",
      .levels = {"log", "debug"},
      .help = "Print verbose information. log includes the contents of each file written, debug every command run",
    }},

    {"deep", arg::config{
      .l_name = "--deep", .s_name = "-d",
      .levels = {"true"},
      .help = "Probe every installed object, not just .so-like files and those under bin/libexec",
    }},
    {"list", arg::config{
      .l_name = "--list", .s_name = "-l",
      .levels = {"true"},
      .help = "Print broken packages as =category/PF atoms suitable for emerge, and exit without repairing",
    }},

    {"vdb", {arg::config{
      .l_name = "--vdb",
      .def = "/var/db/pkg",
      .custom = custom_policy::TRUE,
      .help = "Path to Portage's VDB",
    }, directory}},
    {"output", {arg::config{
      .l_name = "--output", .s_name = "-o",
      .def = "",
      .custom = custom_policy::TRUE,
      .help = "Where to write the regenerated files (default is a new temporary directory)",
    }, directory}},
  };


  void parse_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return;
    log({"Reading configuration from", path.string()}, "debug");

    for (const auto& raw : file::parse<vector>(path.string(), vectorize)) {
      auto line = trim<std::string_view>(raw, " \t");
      if (line.empty() || line.starts_with('#')) continue;

      auto split = line.find('=');
      if (split == std::string::npos) {
        warning({"Invalid configuration:", line});
        continue;
      }

      auto key = trim<std::string_view>(line.substr(0, split), " \t"), value = trim<std::string_view>(line.substr(split + 1), " \t");
      std::transform(key.begin(), key.end(), key.begin(), ::tolower);

      if (!switches.contains(key) || key == "help" || key == "version") {
        warning({"Unrecognized configuration:", line});
        continue;
      }

      try {emplace(key, value);}
      catch (const std::runtime_error& e) {warning({"Invalid configuration for", key, ":", e.what()});}
    }
  }


  std::filesystem::path config_file() {return std::filesystem::path(shared::config) / "recover-vdb" / "recover-vdb.conf";}


  bool parse_args(const std::filesystem::path& conf) {
    parse_config(conf);

    for (size_t x = 0; x < args.size(); ++x) {

      // Chained short switches can belong to more than one switch.
      const auto chained = args[x].length() > 2 && args[x][0] == '-' && args[x][1] != '-';
      bool consumed = false;

      for (auto& [key, value] : switches) {
        try {
          if (value.digest(args, x)) {
            consumed = true;
            if (!chained) break;
          }
        }
        catch (const std::runtime_error& e) {
          const auto what = std::string(e.what());
          if (what == "Help!") {
            std::cout << "recover-vdb v" << VERSION << '\n'
                      << "Find packages in Portage's VDB with missing ELF metadata, and regenerate it\n";
            for (const auto& [name, sw] : switches) std::cout << sw.get_help();
          }
          else if (what == "Version") std::cout << VERSION << '\n';
          else throw;
          return false;
        }
      }
      if (!consumed) unknown.emplace_back(args[x]);
    }

    if (!unknown.empty()) throw std::runtime_error("Unrecognized arguments: " + join(unknown, ' '));

    if (at("verbose") >= "debug") {
      std::cout << "Arguments:" << std::endl;
      for (const auto& [key, value] : switches)
        std::cout << key << ": " << value.get() << std::endl;
    }
    return true;
  }
}
