// Copyright 2017 Global Phasing Ltd.
//
// Utilities.

#ifndef FFPARM_UTIL_HPP_
#define FFPARM_UTIL_HPP_

#include <algorithm>  // for equal, find
#include <cctype>     // for tolower
#include <iterator>   // for begin, end
#include <string>
#include <vector>

namespace ffparm {

// Case-insensitive version. Assumes the suffix is lowercase and ascii.
inline bool iends_with(const std::string& str, const std::string& suffix) {
  size_t sl = suffix.length();
  return str.length() >= sl &&
         std::equal(std::begin(suffix), std::end(suffix), str.end() - sl,
                    [](char c1, char c2) { return c1 == std::tolower(c2); });
}

inline std::string to_upper(std::string str) {
  for (char& c : str)
    if (c >= 'a' && c <= 'z')
      c &= ~0x20;
  return str;
}

inline std::string trim_str(const std::string& str) {
  std::string ws = " \r\n\t";
  std::string::size_type first = str.find_first_not_of(ws);
  if (first == std::string::npos)
    return std::string{};
  std::string::size_type last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

// Splits on any of the separator characters, skipping empty fields.
inline std::vector<std::string> split_str_multi(const std::string& str,
                                                const char* seps=" \t") {
  std::vector<std::string> result;
  size_t pos = str.find_first_not_of(seps);
  while (pos != std::string::npos) {
    size_t end = str.find_first_of(seps, pos);
    result.emplace_back(str, pos, end - pos);
    pos = str.find_first_not_of(seps, end);
  }
  return result;
}

template<typename T, typename S, typename F>
std::string join_str(const T& iterable, const S& sep, const F& getter) {
  std::string r;
  bool first = true;
  for (const auto& item : iterable) {
    if (!first)
      r += sep;
    r += getter(item);
    first = false;
  }
  return r;
}

template<typename T, typename S>
std::string join_str(const T& iterable, const S& sep) {
  return join_str(iterable, sep, [](const std::string& t) { return t; });
}

template <class T>
bool in_vector(const T& x, const std::vector<T>& v) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

namespace impl {
inline void add_to_string(std::string&) {}

inline void add_to_string_one(std::string& out, const std::string& s) { out += s; }
inline void add_to_string_one(std::string& out, const char* s) { out += s; }
inline void add_to_string_one(std::string& out, char c) { out += c; }
inline void add_to_string_one(std::string& out, int n) { out += std::to_string(n); }
inline void add_to_string_one(std::string& out, size_t n) { out += std::to_string(n); }

template <typename T, typename... Args>
void add_to_string(std::string& out, const T& value, Args const&... args) {
  add_to_string_one(out, value);
  add_to_string(out, args...);
}
} // namespace impl

/// Concatenates strings, characters and integers.
template <class... Args>
std::string cat(Args const&... args) {
  std::string out;
  impl::add_to_string(out, args...);
  return out;
}

} // namespace ffparm
#endif
