// Copyright 2018 Global Phasing Ltd.
//
// Input abstraction.
// Used to decouple file reading and decompression.

#ifndef FFPARM_INPUT_HPP_
#define FFPARM_INPUT_HPP_

#include <cstdio>  // for FILE, fgets, fgetc
#include <cstring> // for memchr, memcpy
#include <memory>  // for unique_ptr
#include <string>
#include "fileutil.hpp"  // for fileptr_t

namespace ffparm {

// base class for FileStream, MemoryStream and GzStream
struct AnyStream {
  virtual ~AnyStream() = default;

  virtual char* gets(char* line, int size) = 0;
  virtual int getc() = 0;

};

struct FileStream final : public AnyStream {
  FileStream(std::FILE* f_) : f(f_, needs_fclose{false}) {}
  FileStream(const char* path, const char* mode) : f(file_open_or(path, mode, stdin)) {}

  char* gets(char* line, int size) override { return std::fgets(line, size, f.get()); }
  int getc() override { return std::fgetc(f.get()); }

private:
  fileptr_t f;
};

struct MemoryStream final : public AnyStream {
  MemoryStream(const char* start_, size_t size)
    : end(start_ + size), cur(start_) {}

  char* gets(char* line, int size) override {
    --size; // fgets reads in at most one less than size characters
    if (cur >= end)
      return nullptr;
    if (size > end - cur)
      size = int(end - cur);
    const char* nl = (const char*) std::memchr(cur, '\n', size);
    size_t len = nl ? nl - cur + 1 : size;
    std::memcpy(line, cur, len);
    line[len] = '\0';
    cur += len;
    return line;
  }
  int getc() override { return cur < end ? *cur++ : EOF; }

private:
  const char* const end;
  const char* cur;
};

class BasicInput {
public:
  explicit BasicInput(const std::string& path) : path_(path) {}

  const std::string& path() const { return path_; }
  const std::string& basepath() const { return path_; }

  // Does the path stands for stdin?
  bool is_stdin() const { return path() == "-"; }

  // providing the same interface as MaybeGzipped
  bool is_compressed() const { return false; }

  std::unique_ptr<AnyStream> create_stream() {
    return std::unique_ptr<AnyStream>(new FileStream(path().c_str(), "rb"));
  }

private:
  std::string path_;
};

} // namespace ffparm
#endif
