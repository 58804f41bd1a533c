// Copyright 2018 Global Phasing Ltd.
//
// File-related utilities.

#ifndef FFPARM_FILEUTIL_HPP_
#define FFPARM_FILEUTIL_HPP_

#include <cstdio>    // for FILE, fopen, fclose
#include <memory>    // for unique_ptr
#include <string>
#include "fail.hpp"  // for sys_fail

namespace ffparm {

// file operations

/// deleter for fileptr_t
struct needs_fclose {
  bool use_fclose;
  void operator()(std::FILE* f) const noexcept {
    if (use_fclose)
      std::fclose(f);
  }
};

typedef std::unique_ptr<std::FILE, needs_fclose> fileptr_t;

inline fileptr_t file_open(const char* path, const char* mode) {
  std::FILE* file;
  if ((file = std::fopen(path, mode)) == nullptr)
    sys_fail(std::string("Failed to open ") + path +
             (*mode == 'w' ? " for writing" : ""));
  return fileptr_t(file, needs_fclose{true});
}

// helper function for treating "-" as stdin or stdout
inline fileptr_t file_open_or(const char* path, const char* mode,
                              std::FILE* dash_stream) {
  if (path[0] == '-' && path[1] == '\0')
    return fileptr_t(dash_stream, needs_fclose{false});
  return file_open(path, mode);
}

} // namespace ffparm
#endif
