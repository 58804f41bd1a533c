// Copyright 2017 Global Phasing Ltd.
//
// Functions for transparent reading of gzipped files. Uses zlib.

#ifndef FFPARM_GZ_HPP_
#define FFPARM_GZ_HPP_
#include <memory>
#include <string>
#include "fail.hpp"     // FFPARM_DLL
#include "input.hpp"    // BasicInput
#include "util.hpp"     // iends_with

namespace ffparm {

FFPARM_DLL extern const char* const zlib_description;

// the same interface as FileStream and MemoryStream
struct FFPARM_DLL GzStream final : public AnyStream {
  GzStream(void* f_) : f(f_) {}
  char* gets(char* line, int size) override;
  int getc() override;
private:
  void* f;  // implementation detail
};

class FFPARM_DLL MaybeGzipped : public BasicInput {
public:
  explicit MaybeGzipped(const std::string& path);
  ~MaybeGzipped();
  MaybeGzipped(const MaybeGzipped&) = delete;
  MaybeGzipped& operator=(const MaybeGzipped&) = delete;
  bool is_compressed() const { return iends_with(path(), ".gz"); }
  std::string basepath() const {
    return is_compressed() ? path().substr(0, path().size() - 3) : path();
  }

  std::unique_ptr<AnyStream> create_stream();

private:
  void* file_ = nullptr;
};

} // namespace ffparm

#endif
