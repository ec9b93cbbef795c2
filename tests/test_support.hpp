#pragma once

// Test support helpers.
//
// Release builds usually define NDEBUG, which would compile <cassert>'s
// assert() away and silently turn tests into no-ops. Tests include this header
// and keep writing assert(expr); the macro is replaced by an always-on check
// that fails fast with a clear message on stderr.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdlib>
#include <iostream>

namespace iatscore_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

} // namespace iatscore_test

#ifndef IATSCORE_TEST_ASSERT
#define IATSCORE_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::iatscore_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) IATSCORE_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) IATSCORE_TEST_ASSERT(expr)
#endif
