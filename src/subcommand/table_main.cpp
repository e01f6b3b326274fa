/** \file table_main.cpp
 *
 * Defines the "kmpfind table" subcommand, which prints the prefix-suffix
 * table of a pattern.
 */

#include <unistd.h>
#include <getopt.h>

#include <iostream>

#include "subcommand.hpp"

#include "../kmp.hpp"
#include "../units.hpp"
#include "../log.hpp"

using namespace std;
using namespace kmpfind;
using namespace kmpfind::subcommand;

void help_table(char** argv) {
    cerr << "usage: " << argv[0] << " table [options] PATTERN" << endl
         << "Print the Knuth-Morris-Pratt prefix-suffix table of PATTERN: for each" << endl
         << "position, the length of the longest proper prefix of the pattern up to" << endl
         << "there that is also a suffix of it." << endl
         << endl
         << "options:" << endl
         << "  -u, --units NAME       split the pattern into bytes or codepoints [codepoints]" << endl
         << "  -h, --help             print this help message to stderr and exit" << endl;
}

int main_table(int argc, char** argv) {

    if (argc == 2) {
        help_table(argv);
        return 1;
    }

    UnitPolicy policy = CODE_POINTS;

    int c;
    optind = 2; // force optind past command positional argument
    while (true) {
        static struct option long_options[] =
        {
            {"units", required_argument, 0, 'u'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
        };

        int option_index = 0;
        c = getopt_long (argc, argv, "u:h?",
                long_options, &option_index);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c)
        {
        case 'u':
            policy = parse<UnitPolicy>(optarg);
            break;
        case 'h':
        case '?':
        default:
            help_table(argv);
            exit(1);
        }
    }

    if (optind + 1 != argc) {
        logging::error("kmpfind table") << "expected exactly one pattern" << endl;
    }
    string pattern = argv[optind];

    size_t malformed = 0;
    auto table = make_prefix_suffix_table(split_units(pattern, policy, &malformed));
    if (malformed != 0) {
        logging::warn("kmpfind table") << "pattern has " << malformed << " bytes that are not valid UTF-8" << endl;
    }

    for (size_t i = 0; i < table.size(); ++i) {
        if (i != 0) {
            cout << " ";
        }
        cout << table[i];
    }
    cout << endl;

    return 0;
}

// Register subcommand
static Subcommand kmpfind_table("table", "show the prefix-suffix table of a pattern", SEARCH, 20, main_table);
