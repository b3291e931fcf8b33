#include "probe.hpp"
#include "arguments.hpp"

using namespace shared;
using namespace exec;

namespace probe {

  std::string FileProbe::describe(const std::string& path) {
    // -b so the path itself can never be mistaken for part of the description.
    return execute<std::string>({"file", "-b", path}, one_line, {.cap = STDOUT, .verbose = arg::at("verbose") >= "debug"});
  }


  kind classify(const std::string_view& description) {
    if (!description.contains("ELF") || !description.contains("dynamically linked"))
      return kind::none;
    if (description.contains("shared object")) return kind::shared_object;
    if (description.contains("executable")) return kind::executable;
    return kind::none;
  }
}
