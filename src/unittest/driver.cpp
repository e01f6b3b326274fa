#include "driver.hpp"

#include <string>
#include <vector>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

namespace kmpfind {
namespace unittest {

using namespace std;

int run_unit_tests(int argc, char** argv) {
    // argc and argv have both the command and the subcommand, but Catch
    // expects just a program name. Glue them into one program name with a
    // space in it.
    string program_name = argc >= 2 ? string(argv[0]) + " " + string(argv[1]) : string(argv[0]);

    vector<char*> catch_argv;
    catch_argv.push_back(&program_name[0]);
    for (int i = 2; i < argc; ++i) {
        catch_argv.push_back(argv[i]);
    }

    Catch::Session session;

    int return_code = session.applyCommandLine((int) catch_argv.size(), catch_argv.data());
    if (return_code != 0) {
        // Complain the user didn't specify good arguments
        return return_code;
    }

    // Actually run the tests
    return session.run();
}

}
}
