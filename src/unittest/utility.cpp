/// \file utility.cpp
///
/// Unit tests for utility functions and the logging format
///

#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <omp.h>
#include "../utility.hpp"
#include "../log.hpp"
#include <catch2/catch.hpp>

namespace kmpfind {
namespace unittest {
using namespace std;

/// Capture everything written to cerr while it is alive.
class CaptureCerr {
public:
    CaptureCerr() : old_buffer(cerr.rdbuf(captured.rdbuf())) {}
    ~CaptureCerr() {
        cerr.rdbuf(old_buffer);
    }
    string str() const {
        return captured.str();
    }
private:
    stringstream captured;
    streambuf* old_buffer;
};

TEST_CASE("Pseudo-random sequences are reproducible", "[utility]") {
    REQUIRE(pseudo_random_sequence(50, 12) == pseudo_random_sequence(50, 12));
    REQUIRE(pseudo_random_sequence(50, 12) != pseudo_random_sequence(50, 13));
    REQUIRE(pseudo_random_sequence(0, 12).empty());

    string seq = pseudo_random_sequence(200, 3, "xy");
    REQUIRE(seq.size() == 200);
    REQUIRE(seq.find_first_not_of("xy") == string::npos);
}

TEST_CASE("Integers parse only when the whole argument is a number", "[utility]") {
    int signed_value = 0;
    REQUIRE(parse<int>("-12", signed_value));
    REQUIRE(signed_value == -12);
    REQUIRE_FALSE(parse<int>("12abc", signed_value));
    REQUIRE_FALSE(parse<int>("99999999999", signed_value));
    REQUIRE(signed_value == -12);

    int untouched = 7;
    REQUIRE_FALSE(parse<int>("3 4", untouched));
    REQUIRE_FALSE(parse<int>("-99999999999x", untouched));
    REQUIRE(untouched == 7);
    REQUIRE_THROWS(parse<int>("", signed_value));
}

TEST_CASE("The thread count is taken from OMP_NUM_THREADS when it can be read", "[utility]") {
    const char* old_value = getenv("OMP_NUM_THREADS");
    bool had_value = old_value != nullptr;
    string saved = had_value ? old_value : "";
    int old_max = omp_get_max_threads();

    SECTION("A nested list uses its first entry") {
        setenv("OMP_NUM_THREADS", "4,2", 1);
        choose_good_thread_count();
        REQUIRE(omp_get_max_threads() == 4);
    }

    SECTION("Trailing whitespace is ignored") {
        setenv("OMP_NUM_THREADS", "3 ", 1);
        choose_good_thread_count();
        REQUIRE(omp_get_max_threads() == 3);
    }

    SECTION("A value that is not a count is skipped with a warning") {
        CaptureCerr capture;
        setenv("OMP_NUM_THREADS", "lots", 1);
        choose_good_thread_count();
        REQUIRE(omp_get_max_threads() >= 1);
        REQUIRE(capture.str().find("warning[kmpfind] ignoring OMP_NUM_THREADS value \"lots\"") != string::npos);
    }

    if (had_value) {
        setenv("OMP_NUM_THREADS", saved.c_str(), 1);
    } else {
        unsetenv("OMP_NUM_THREADS");
    }
    omp_set_num_threads(old_max);
}

TEST_CASE("Log messages are prefixed with their context", "[log]") {

    SECTION("info and warn use different prefixes") {
        CaptureCerr capture;
        logging::info("kmpfind find") << "searching " << 3 << " texts" << endl;
        logging::warn("kmpfind find") << "odd bytes" << endl;
        REQUIRE(capture.str() == "[kmpfind find] searching 3 texts\nwarning[kmpfind find] odd bytes\n");
    }

    SECTION("A Logger remembers its context") {
        CaptureCerr capture;
        Logger logger("kmpfind table");
        logger.warn() << "careful" << endl;
        REQUIRE(capture.str() == "warning[kmpfind table] careful\n");
    }

    SECTION("Continuation lines line up under the first line") {
        CaptureCerr capture;
        logging::warn("x") << "first\nsecond" << endl;
        REQUIRE(capture.str() == "warning[x] first\n           second\n");
    }
}

}
}
