// Copyright 2017 Global Phasing Ltd.
//
// fail(), sys_fail() and unreachable()

#ifndef FFPARM_FAIL_HPP_
#define FFPARM_FAIL_HPP_

#include <cerrno>        // for errno
#include <stdexcept>     // for runtime_error
#include <system_error>  // for system_error
#include <string>
#include <utility>       // for forward

#if defined(__GNUG__) && !defined(__clang__)
# define FFPARM_COLD __attribute__((cold))
#elif defined(__has_attribute)
# if __has_attribute(cold)
#  define FFPARM_COLD __attribute__((cold))
# else
#  define FFPARM_COLD __attribute__((noinline))
# endif
#else
# define FFPARM_COLD __attribute__((noinline))
#endif

#if defined(_WIN32)
# if defined(FFPARM_SHARED)
#  if defined(FFPARM_BUILD)
#   define FFPARM_DLL __declspec(dllexport)
#  else
#   define FFPARM_DLL __declspec(dllimport)
#  endif
# else
#  define FFPARM_DLL
# endif
#else
# define FFPARM_DLL __attribute__((visibility("default")))
#endif

namespace ffparm {

[[noreturn]]
inline void fail(const std::string& msg) { throw std::runtime_error(msg); }

template<typename T, typename... Args> [[noreturn]]
void fail(std::string&& str, T&& arg1, Args&&... args) {
  str += arg1;
  fail(std::move(str), std::forward<Args>(args)...);
}
template<typename T, typename... Args> [[noreturn]]
void fail(const std::string& str, T&& arg1, Args&&... args) {
  fail(str + arg1, std::forward<Args>(args)...);
}

[[noreturn]]
inline FFPARM_COLD void fail(const char* msg) { throw std::runtime_error(msg); }

[[noreturn]]
inline FFPARM_COLD void sys_fail(const std::string& msg) {
  throw std::system_error(errno, std::system_category(), msg);
}
[[noreturn]]
inline FFPARM_COLD void sys_fail(const char* msg) {
  throw std::system_error(errno, std::system_category(), msg);
}

// unreachable() is used to silence GCC -Wreturn-type and hint the compiler
[[noreturn]] inline void unreachable() {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

} // namespace ffparm
#endif
