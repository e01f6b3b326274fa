#ifndef KMPFIND_UNITTEST_DRIVER_HPP_INCLUDED
#define KMPFIND_UNITTEST_DRIVER_HPP_INCLUDED

namespace kmpfind {
namespace unittest {

/**
 * Take the original argc and argv from a `kmpfind test` command-line call and
 * run the unit tests. This lives in its own CPP/HPP to keep the unit test
 * library out of the code that the other subcommands use.
 *
 * Everything after the subcommand name is passed along to Catch, so the usual
 * Catch options (test name patterns, [tags], -s, --list-tests) work.
 *
 * Returns exit code 0 on success, other codes on failure.
 */
int run_unit_tests(int argc, char** argv);

}
}

#endif
