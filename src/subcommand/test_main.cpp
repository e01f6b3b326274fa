/** \file test_main.cpp
 *
 * Defines the "kmpfind test" subcommand, which runs unit tests.
 */

#include "subcommand.hpp"
#include "../unittest/driver.hpp"

using namespace std;
using namespace kmpfind;
using namespace kmpfind::subcommand;

// No help_test is necessary because the unit testing library takes care of
// complaining about missing options.

int main_test(int argc, char** argv){
    // Forward arguments along to the main unit test driver
    return unittest::run_unit_tests(argc, argv);
}

// Register subcommand
static Subcommand kmpfind_test("test", "run unit tests", DEVELOPMENT, main_test);
