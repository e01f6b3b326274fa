/// \file subcommand.cpp
///
/// Unit tests for the subcommand registry and the find subcommand
///

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "../subcommand/subcommand.hpp"
#include <catch2/catch.hpp>

// Defined in find_main.cpp
int main_find(int argc, char** argv);

namespace kmpfind {
namespace unittest {
using namespace std;
using namespace kmpfind::subcommand;

TEST_CASE("Subcommands are listed by priority within their category", "[subcommand]") {

    vector<string> search_names;
    Subcommand::for_each(SEARCH, [&](const Subcommand& command) {
        REQUIRE(command.get_category() == SEARCH);
        search_names.push_back(command.get_name());
    });
    REQUIRE(search_names == vector<string>{"find", "table", "help"});

    vector<string> developer_names;
    Subcommand::for_each(DEVELOPMENT, [&](const Subcommand& command) {
        developer_names.push_back(command.get_name());
    });
    REQUIRE(developer_names == vector<string>{"test"});
}

TEST_CASE("The find subcommand reads standard input when no file is named", "[subcommand]") {

    stringstream input("xxab\nnothing here\nab\n");
    stringstream output;
    streambuf* old_in = cin.rdbuf(input.rdbuf());
    streambuf* old_out = cout.rdbuf(output.rdbuf());

    vector<string> args {"kmpfind", "find", "-p", "ab", "-u", "bytes"};
    vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    int status = main_find(args.size(), argv.data());

    cin.rdbuf(old_in);
    cout.rdbuf(old_out);

    REQUIRE(status == 0);
    REQUIRE(output.str() == "1\t2\n2\t-1\n3\t0\n");
}

}
}
