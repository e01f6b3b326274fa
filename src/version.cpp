#include "version.hpp"

#include <sstream>
#include <omp.h>

// CMake passes these in for version.cpp only. Fall back to placeholders so
// other builds still work.
#ifndef KMPFIND_VERSION
    #define KMPFIND_VERSION "unknown"
#endif
#ifndef KMPFIND_COMPILER
    #define KMPFIND_COMPILER "unknown compiler"
#endif
#ifndef KMPFIND_OS
    #define KMPFIND_OS "unknown OS"
#endif

// Stringify the value of a macro, not its name
#define QUOTE(arg) #arg
#define STR(macro) QUOTE(macro)

#if defined(_LIBCPP_VERSION)
    #define KMPFIND_STANDARD_LIBRARY ("libc++ " STR(_LIBCPP_VERSION))
#elif defined(__GLIBCXX__)
    #define KMPFIND_STANDARD_LIBRARY ("libstdc++ " STR(__GLIBCXX__))
#else
    #define KMPFIND_STANDARD_LIBRARY "unknown standard library"
#endif

namespace kmpfind {

const string Version::VERSION = KMPFIND_VERSION;
const string Version::COMPILER = KMPFIND_COMPILER;
const string Version::STANDARD_LIBRARY = KMPFIND_STANDARD_LIBRARY;
const string Version::OS = KMPFIND_OS;

string Version::get_short() {
    return "v" + VERSION;
}

string Version::get_long() {
    stringstream s;
    s << "kmpfind " << get_short() << endl
      << "compiler: " << COMPILER << endl
      << "standard library: " << STANDARD_LIBRARY << endl
      << "OS: " << OS << endl
      // _OPENMP is the yyyymm date of the OpenMP specification supported
      << "OpenMP: " << STR(_OPENMP);
    return s.str();
}

}
