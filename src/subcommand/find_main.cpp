/** \file find_main.cpp
 *
 * Defines the "kmpfind find" subcommand, which finds the first occurrence of
 * a pattern in each line of a file.
 */

#include <omp.h>
#include <unistd.h>
#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>

#include "subcommand.hpp"

#include "../kmp.hpp"
#include "../units.hpp"
#include "../utility.hpp"
#include "../log.hpp"

using namespace std;
using namespace kmpfind;
using namespace kmpfind::subcommand;

void help_find(char** argv) {
    cerr << "usage: " << argv[0] << " find [options] -p PATTERN [FILE|-] >positions.tsv" << endl
         << "Find the first occurrence of PATTERN in every line of FILE (or standard input)." << endl
         << "Prints the line number and the index of the match, counted in units, or -1" << endl
         << "if the line does not contain the pattern." << endl
         << endl
         << "options:" << endl
         << "  -p, --pattern TEXT     pattern to search for [required]" << endl
         << "  -T, --text TEXT        search this text instead of the lines of a file" << endl
         << "  -u, --units NAME       compare bytes or codepoints [codepoints]" << endl
         << "  -t, --threads N        number of threads to use" << endl
         << "  -P, --progress         show progress" << endl
         << "  -h, --help             print this help message to stderr and exit" << endl;
}

int main_find(int argc, char** argv) {

    if (argc == 2) {
        help_find(argv);
        return 1;
    }

    Logger logger("kmpfind find");

    string pattern;
    bool have_pattern = false;
    string literal_text;
    bool have_literal_text = false;
    UnitPolicy policy = CODE_POINTS;
    bool show_progress = false;

    int c;
    optind = 2; // force optind past command positional argument
    while (true) {
        static struct option long_options[] =
        {
            {"pattern", required_argument, 0, 'p'},
            {"text", required_argument, 0, 'T'},
            {"units", required_argument, 0, 'u'},
            {"threads", required_argument, 0, 't'},
            {"progress", no_argument, 0, 'P'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
        };

        int option_index = 0;
        c = getopt_long (argc, argv, "p:T:u:t:Ph?",
                long_options, &option_index);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c)
        {
        case 'p':
            pattern = optarg;
            have_pattern = true;
            break;
        case 'T':
            literal_text = optarg;
            have_literal_text = true;
            break;
        case 'u':
            policy = parse<UnitPolicy>(optarg);
            break;
        case 't':
        {
            int num_threads = parse<int>(optarg);
            if (num_threads <= 0) {
                logger.error() << "thread count (-t) set to " << num_threads << ", must set to a positive integer." << endl;
            }
            omp_set_num_threads(num_threads);
            break;
        }
        case 'P':
            show_progress = true;
            break;
        case 'h':
        case '?':
        default:
            help_find(argv);
            exit(1);
        }
    }

    if (!have_pattern) {
        logger.error() << "a pattern (-p) is required" << endl;
    }

    vector<string> texts;
    if (have_literal_text) {
        if (have_input_file(optind, argc, argv)) {
            logger.error() << "cannot search both a text (-T) and a file" << endl;
        }
        texts.push_back(literal_text);
    } else {
        // With no file named, read standard input
        string file_name = have_input_file(optind, argc, argv) ? string(argv[optind++]) : string("-");
        get_input_file(file_name, [&](istream& in) {
            string line;
            while (getline(in, line)) {
                texts.push_back(line);
            }
        });
    }

    if (optind < argc) {
        logger.error() << "unexpected argument \"" << argv[optind] << "\"" << endl;
    }

    size_t pattern_malformed = 0;
    KMPMatcher<unit_t> matcher(split_units(pattern, policy, &pattern_malformed));
    if (pattern_malformed != 0) {
        logger.warn() << "pattern has " << pattern_malformed << " bytes that are not valid UTF-8" << endl;
    }

    if (show_progress) {
        logger.info() << "searching " << texts.size() << " texts for a pattern of " << matcher.size()
                      << " " << policy << " using " << get_thread_count() << " threads" << endl;
    }

    // Every text gets its own result slot, and the matcher is only read.
    vector<size_t> positions(texts.size(), string::npos);
    vector<size_t> malformed(texts.size(), 0);
#pragma omp parallel for schedule(dynamic, 64)
    for (size_t i = 0; i < texts.size(); ++i) {
        positions[i] = matcher.find(split_units(texts[i], policy, &malformed[i]));
    }

    size_t malformed_texts = 0;
    size_t found = 0;
    for (size_t i = 0; i < texts.size(); ++i) {
        cout << (i + 1) << "\t";
        if (positions[i] == string::npos) {
            cout << -1;
        } else {
            cout << positions[i];
            ++found;
        }
        cout << "\n";
        if (malformed[i] != 0) {
            ++malformed_texts;
        }
    }
    cout.flush();

    if (malformed_texts != 0) {
        logger.warn() << malformed_texts << " texts contain bytes that are not valid UTF-8; "
                      << "those bytes only match themselves" << endl;
    }

    if (show_progress) {
        logger.info() << "found the pattern in " << found << " of " << texts.size() << " texts" << endl;
    }

    return 0;
}

// Register subcommand
static Subcommand kmpfind_find("find", "find the first occurrence of a pattern in each line", SEARCH, 10, main_find);
