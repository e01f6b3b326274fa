#include "log.hpp"

namespace kmpfind {

cerrWrapper::cerrWrapper(const std::string& prefix, bool exit_on_destruct) :
    exit_on_destruct(exit_on_destruct), indent_length(prefix.size()), at_start_of_line(false) {
    std::cerr << prefix;
}

void cerrWrapper::write(const std::string& text) {
    for (char c : text) {
        if (at_start_of_line) {
            std::cerr << std::string(indent_length, ' ');
            at_start_of_line = false;
        }
        std::cerr << c;
        if (c == '\n') {
            at_start_of_line = true;
        }
    }
}

cerrWrapper& cerrWrapper::operator<<(std::ostream& (*manip)(std::ostream&)) {
    if (manip == static_cast<std::ostream& (*)(std::ostream&)>(std::endl)) {
        // endl ends our line too
        std::cerr << manip;
        at_start_of_line = true;
    } else {
        std::cerr << manip;
    }
    return *this;
}

cerrWrapper::~cerrWrapper() {
    if (exit_on_destruct) {
        std::cerr.flush();
        exit(EXIT_FAILURE);
    }
}

namespace logging {

cerrWrapper info(const std::string& context) {
    return cerrWrapper("[" + context + "] ", false);
}

cerrWrapper warn(const std::string& context) {
    return cerrWrapper("warning[" + context + "] ", false);
}

cerrWrapper error(const std::string& context) {
    return cerrWrapper("error[" + context + "] ", true);
}

}

}
