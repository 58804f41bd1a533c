// Copyright 2017 Global Phasing Ltd.

// Thin, leaky wrapper around The Lean Mean C++ Option Parser.

#pragma once

#include <vector>
#include <string>
#include <optionparser.h>

#ifndef FFPARM_PROG
# error "define FFPARM_PROG before including options.h"
#endif

#define FFPARM_XSTRINGIZE(s) FFPARM_STRINGIZE(s)
#define FFPARM_STRINGIZE(s) #s
#define FFPARM_XCONCAT(a, b) FFPARM_CONCAT(a, b)
#define FFPARM_CONCAT(a, b) a##b
#ifdef FFPARM_ALL_IN_ONE  // FFPARM_MAIN=foo_main EXE_NAME="ffparm foo"
# define FFPARM_MAIN FFPARM_XCONCAT(FFPARM_PROG, _main)
# define EXE_NAME "ffparm " FFPARM_XSTRINGIZE(FFPARM_PROG)
#else                     // FFPARM_MAIN=main     EXE_NAME="ffparm-foo"
# define FFPARM_MAIN main
# define EXE_NAME "ffparm-" FFPARM_XSTRINGIZE(FFPARM_PROG)
#endif

#if defined(_MSC_VER) && _MSC_VER+0 <= 1900
// warning C4800: 'option::Option *': forcing value to bool 'true' or 'false'
#pragma warning(disable: 4800)
#endif

enum { NoOp=0, Help=1, Version=2, Verbose=3 };

extern const option::Descriptor CommonUsage[];

struct Arg: public option::Arg {
  static option::ArgStatus Required(const option::Option& option, bool msg);
  static option::ArgStatus AtomTypes(const option::Option& option, bool msg);
};

struct OptParser : option::Parser {
  const char* program_name;
  std::vector<option::Option> options;
  std::vector<option::Option> buffer;

  explicit OptParser(const char* prog) : program_name(prog) {}
  void simple_parse(int argc, char** argv, const option::Descriptor usage[]);
  void require_positional_args(int n);
  void require_input_files_as_args(int other_args=0);
  [[noreturn]] void print_try_help_and_exit(const char* msg) const;
};

// Sets logger.callback to Logger::to_stderr; -v also shows notes and debug.
namespace ffparm { struct Logger; }
ffparm::Logger make_logger(bool verbose);

void print_version(const char* program_name, bool verbose=false);
