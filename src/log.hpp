#ifndef KMPFIND_LOG_HPP_INCLUDED
#define KMPFIND_LOG_HPP_INCLUDED

#include <string>
#include <sstream>
#include <iostream>
#include <cstdlib>

/** \file
 * log.hpp: messages to standard error in one format for all of kmpfind.
 *
 *     [kmpfind find] searching 10 texts        <- logging::info
 *     warning[kmpfind find] odd bytes          <- logging::warn
 *     error[kmpfind find] no such file         <- logging::error
 *
 * Each function returns a cerrWrapper, which is streamed into like cerr.
 * Lines after the first are indented to line up with the message text. When
 * the wrapper from error() is destroyed, at the end of the statement, the
 * program exits with EXIT_FAILURE.
 *
 * A Logger holds a context string so a subcommand doesn't have to repeat it.
 */

namespace kmpfind {

class cerrWrapper {
private:
    bool exit_on_destruct;
    // How far to indent continuation lines
    size_t indent_length;
    // Should we indent before the next character?
    bool at_start_of_line;

    /// Write text to cerr, indenting every line after the first.
    void write(const std::string& text);

public:
    cerrWrapper(const std::string& prefix, bool exit_on_destruct);

    // Only one wrapper may own a message
    cerrWrapper(const cerrWrapper& other) = delete;
    cerrWrapper& operator=(const cerrWrapper& other) = delete;

    template <typename T>
    cerrWrapper& operator<<(const T& t) {
        std::stringstream formatted;
        formatted << t;
        write(formatted.str());
        return *this;
    }

    cerrWrapper& operator<<(std::ostream& (*manip)(std::ostream&));

    ~cerrWrapper();
};

namespace logging {

/// Progress and other information. "context" names the caller, e.g.
/// "kmpfind find".
cerrWrapper info(const std::string& context);
cerrWrapper warn(const std::string& context);
/// The program exits when the returned wrapper is destroyed.
cerrWrapper error(const std::string& context);

}

/// Logging functions bound to one context
class Logger {
private:
    std::string context;

public:
    Logger(const std::string& context) : context(context) {}

    inline cerrWrapper info() const {
        return logging::info(context);
    }
    inline cerrWrapper warn() const {
        return logging::warn(context);
    }
    inline cerrWrapper error() const {
        return logging::error(context);
    }
};

}

#endif
