// Copyright Global Phasing Ltd.

#include <ffparm/gz.hpp>
#if USE_ZLIB_NG
# define WITH_GZFILEOP 1
# include <zlib-ng.h>
# define GG(name) zng_ ## name
#else
# include <zlib.h>
# define GG(name) name
#endif

namespace ffparm {

const char* const zlib_description =
#if USE_ZLIB_NG
  "zlib-ng " ZLIBNG_VERSION;
#else
  "zlib " ZLIB_VERSION;
#endif

char* GzStream::gets(char* line, int size) {
  return GG(gzgets)((gzFile)f, line, size);
}

int GzStream::getc() {
  return GG(gzgetc)((gzFile)f);
}


MaybeGzipped::MaybeGzipped(const std::string& path) : BasicInput(path) {}

static void close_gzfile(void* file) {
#if USE_ZLIB_NG || (ZLIB_VERNUM >= 0x1235)
  GG(gzclose_r)((gzFile)file);
#else
  gzclose((gzFile)file);
#endif
}

MaybeGzipped::~MaybeGzipped() {
  if (file_)
    close_gzfile(file_);
}

std::unique_ptr<AnyStream> MaybeGzipped::create_stream() {
  if (is_compressed()) {
    if (file_)
      close_gzfile(file_);
    file_ = GG(gzopen)(path().c_str(), "rb");
    if (!file_)
      sys_fail("Failed to gzopen " + path());
#if ZLIB_VERNUM >= 0x1235
    GG(gzbuffer)((gzFile)file_, 64*1024);
#endif
    return std::unique_ptr<AnyStream>(new GzStream(file_));
  }
  return BasicInput::create_stream();
}

} // namespace ffparm
