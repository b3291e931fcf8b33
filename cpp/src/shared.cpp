#include <cstdlib>
#include <iostream>

#include "shared.hpp"
#include "arguments.hpp"

namespace shared {

  std::mt19937_64 TemporaryDirectory::prng(std::random_device{}());


  const std::string
    home = std::getenv("HOME") == nullptr ? "/root" : std::getenv("HOME"),
    config = std::getenv("XDG_CONFIG_HOME") == nullptr ? home + "/.config/" : std::getenv("XDG_CONFIG_HOME");


  TemporaryDirectory::TemporaryDirectory(const std::string& parent, const std::string_view& prefix, const std::string_view& suffix, const bool& keep) : persist(keep) {
    do {
      std::stringstream name;
      if (!prefix.empty()) name << prefix << '-';
      name << std::hex << prng();
      if (!suffix.empty()) name << '-' << suffix;
      path = (std::filesystem::path(parent) / name.str()).string();
    } while (std::filesystem::exists(path));
    std::filesystem::create_directories(path);
  }


  TemporaryDirectory::~TemporaryDirectory() {
    if (persist) return;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }


  // Space separated, one line.
  void print(std::ostream& out, const list& msg) {
    for (const auto& x : msg) out << x << ' ';
    out << std::endl;
  }

  void log(const list& msg, const std::string& level) {
    if (arg::at("verbose") >= level) print(std::cout, msg);
  }

  void notice(const list& msg) {print(std::cout, msg);}

  void warning(const list& msg, const bool& error) {
    std::cerr << (error ? "ERROR: " : "WARN: ");
    print(std::cerr, msg);
  }


  bool strippable(const char& c, const char& d) {return c == d;}
  bool strippable(const char& c, const std::string_view& d) {return d.contains(c);}


  template <class T> std::string join(const T& list, const char& joiner) {
    std::string ret;
    for (const auto& x : list) {
      if (!ret.empty()) ret += joiner;
      ret += x;
    }
    return ret;
  }
  template std::string join(const vector&, const char&);
  template std::string join(const set&, const char&);


  template <typename T> std::string trim(const std::string& in, const T& to_strip) {
    size_t l = 0, r = in.length();
    while (l < r && strippable(in[l], to_strip)) ++l;
    while (r > l && strippable(in[r - 1], to_strip)) --r;
    return in.substr(l, r - l);
  }
  template std::string trim(const std::string&, const char&);
  template std::string trim(const std::string&, const std::string_view&);


  template <class T> void extend(vector& dest, T source) {
    dest.reserve(dest.size() + source.size());
    for (auto& x : source) dest.emplace_back(std::move(x));
  }
  template void extend(vector&, list);
  template void extend(vector&, vector);


  vector fields(const std::string_view& line, const char& delim) {
    vector ret;
    size_t start = 0;
    for (auto end = line.find(delim); end != std::string_view::npos; end = line.find(delim, start)) {
      ret.emplace_back(line.substr(start, end - start));
      start = end + 1;
    }
    ret.emplace_back(line.substr(start));
    return ret;
  }
}
