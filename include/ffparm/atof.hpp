// Copyright 2020 Global Phasing Ltd.
//
// Functions that convert string to floating-point number ignoring locale.
// Wrappers around https://github.com/fastfloat/fast_float/

#ifndef FFPARM_ATOF_HPP_
#define FFPARM_ATOF_HPP_

#include <system_error>  // for errc
#include <string>
#include <fast_float/fast_float.h>
#include "atox.hpp"   // for is_space

namespace ffparm {

using fast_float::from_chars_result;

inline from_chars_result fast_from_chars(const char* start, const char* end, double& d) {
  while (start < end && is_space(*start))
    ++start;
  if (start < end && *start == '+')
    ++start;
  return fast_float::from_chars(start, end, d);
}

/// Parses the whole word as a number; returns false if it is not a number.
inline bool parse_number(const std::string& word, double& d) {
  const char* end = word.c_str() + word.size();
  auto result = fast_from_chars(word.c_str(), end, d);
  return result.ec == std::errc() && result.ptr == end;
}

} // namespace ffparm
#endif
