#ifndef KMPFIND_VERSION_HPP_INCLUDED
#define KMPFIND_VERSION_HPP_INCLUDED

// version.hpp: what kmpfind build this is and what it was built with.

#include <string>

namespace kmpfind {

using namespace std;

class Version {
public:
    /// Release number, like 1.0.0
    const static string VERSION;
    /// Compiler ID and version
    const static string COMPILER;
    const static string STANDARD_LIBRARY;
    /// OS we were built for
    const static string OS;

    /// Get the version with a leading "v", like v1.0.0. No whitespace.
    static string get_short();

    /// Get the version together with the build environment, one fact per
    /// line, with no terminating newline.
    static string get_long();
private:
    Version() = delete;
};

}

#endif
