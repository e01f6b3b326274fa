/** \file help_main.cpp
 *
 * Defines the "kmpfind help" subcommand, which describes subcommands.
 */

#include <iostream>

#include "subcommand.hpp"
#include "../version.hpp"

using namespace std;
using namespace kmpfind;
using namespace kmpfind::subcommand;

int main_help(int argc, char** argv){

    cerr << "kmpfind: exact substring search, version " << Version::get_short() << endl
         << endl
         << "usage: " << argv[0] << " <command> [options]" << endl
         << endl;

    for (auto category : {SEARCH, DEVELOPMENT}) {

        cerr << category << ":" << endl;

        Subcommand::for_each(category, [](const Subcommand& command) {
            // Pad all the names so the descriptions line up
            string name = command.get_name();
            name.resize(14, ' ');
            cerr << "  -- " << name << command.get_description() << endl;
        });

        cerr << endl;
    }

    return 0;
}

// Register subcommand
static Subcommand kmpfind_help("help", "show all subcommands", SEARCH, 100, main_help);
