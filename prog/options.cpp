// Copyright 2018 Global Phasing Ltd.

#define FFPARM_PROG na
#include "options.h"
#include <cstdio>   // for fprintf
#include <cstdlib>  // for exit
#include <cstring>  // for strstr, strlen
#include <ffparm/gz.hpp>       // for zlib_description
#include <ffparm/logger.hpp>   // for Logger
#include <ffparm/version.hpp>  // for FFPARM_VERSION

using std::fprintf;

const option::Descriptor CommonUsage[] = {
  { 0, 0, 0, 0, 0, 0 }, // this makes CommonUsage[Help] return Help item, etc
  { Help, 0, "h", "help", Arg::None, "  -h, --help  \tPrint usage and exit." },
  { Version, 0, "V", "version", Arg::None,
    "  -V, --version  \tPrint version and exit." },
  { Verbose, 0, "v", "verbose", Arg::None,
    "  -v, --verbose  \tVerbose output." }
};

option::ArgStatus Arg::Required(const option::Option& option, bool msg) {
  if (option.arg != nullptr)
    return option::ARG_OK;
  if (msg)
    fprintf(stderr, "Option '%s' requires an argument\n", option.name);
  return option::ARG_ILLEGAL;
}

option::ArgStatus Arg::AtomTypes(const option::Option& option, bool msg) {
  if (Required(option, msg) == option::ARG_ILLEGAL)
    return option::ARG_ILLEGAL;
  const char* arg = option.arg;
  if (arg[0] != '\0' && arg[0] != '-' && std::strstr(arg, "--") == nullptr &&
      arg[std::strlen(arg) - 1] != '-')
    return option::ARG_OK;
  if (msg)
    fprintf(stderr, "Option '%.*s' requires dash-separated atom types,\n"
                    " for example: %.*s=CT1-C-N\n",
                    option.namelen, option.name, option.namelen, option.name);
  return option::ARG_ILLEGAL;
}

// we wrap fwrite because passing it directly may cause warning
// "ignoring attributes on template argument" [-Wignored-attributes]
static
size_t write_func(const void *ptr, size_t size, size_t nmemb, FILE *stream) {
  return fwrite(ptr, size, nmemb, stream);
}

void OptParser::simple_parse(int argc, char** argv,
                             const option::Descriptor usage[]) {
  if (argc < 1)
    std::exit(2);
  option::Stats stats(/*reordering*/true, usage, argc-1, argv+1);
  options.resize(stats.options_max);
  buffer.resize(stats.buffer_max);
  parse(usage, argc-1, argv+1, options.data(), buffer.data());
  if (error())
    std::exit(2);
  if (options[Help]) {
    option::printUsage(write_func, stdout, usage);
    std::exit(0);
  }
  if (options[Version]) {
    print_version(program_name, options[Verbose]);
    std::exit(0);
  }
  if (options[NoOp]) {
    fprintf(stderr, "Invalid option.\n");
    option::printUsage(write_func, stderr, usage);
    std::exit(2);
  }
}

void OptParser::print_try_help_and_exit(const char* msg) const {
  fprintf(stderr, "%s\nTry '%s --help' for more information.\n",
                  msg, program_name);
  std::exit(2);
}

void OptParser::require_positional_args(int n) {
  if (nonOptionsCount() != n) {
    fprintf(stderr, "%s requires %d arguments but got %d.",
                    program_name, n, nonOptionsCount());
    print_try_help_and_exit("");
  }
}

void OptParser::require_input_files_as_args(int other_args) {
  if (nonOptionsCount() <= other_args)
    print_try_help_and_exit("No input files. Nothing to do.");
}

ffparm::Logger make_logger(bool verbose) {
  ffparm::Logger logger;
  logger.callback = ffparm::Logger::to_stderr;
  logger.threshold = verbose ? 8 : 3;
  return logger;
}

void print_version(const char* program_name, bool verbose) {
  std::printf("%s " FFPARM_VERSION
#ifdef FFPARM_VERSION_INFO
         " (" FFPARM_XSTRINGIZE(FFPARM_VERSION_INFO) ")"
#endif
         "\n", program_name);
  if (verbose) {
    std::printf("Using %s\n", ffparm::zlib_description);
#if defined(_MSC_VER)
    std::printf("Compiler: MSVC %d (C++ %ld)\n", _MSC_FULL_VER, _MSVC_LANG);
#else
#  if defined(__clang__)
    std::printf("Compiler: Clang %d.%d.%d (C++ %ld)\n",
                __clang_major__, __clang_minor__, __clang_patchlevel__, __cplusplus);
#  elif defined(__GNUC__)
    std::printf("Compiler: GCC %d.%d.%d (C++ %ld)\n",
                __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__, __cplusplus);
#  endif
#endif
  }
}
