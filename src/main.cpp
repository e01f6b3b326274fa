#include <iostream>
#include <string>

#include "version.hpp"
#include "utility.hpp"

// Subcommands register themselves; main doesn't need their headers
#include "subcommand/subcommand.hpp"

using namespace std;
using namespace kmpfind;
using namespace kmpfind::subcommand;

void kmpfind_help(char** argv) {
    cerr << "kmpfind: exact substring search, version " << Version::get_short() << endl
         << endl
         << "usage: " << argv[0] << " <command> [options]" << endl
         << "       " << argv[0] << " --version" << endl
         << endl
         << SEARCH << ":" << endl;

    Subcommand::for_each(SEARCH, [](const Subcommand& command) {
        // Pad all the names so the descriptions line up
        string name = command.get_name();
        name.resize(14, ' ');
        cerr << "  -- " << name << command.get_description() << endl;
    });

    cerr << endl << "For more commands, type `kmpfind help`." << endl << endl;
}

int main(int argc, char *argv[]) {

    if (argc == 1) {
        kmpfind_help(argv);
        return 1;
    }

    string command = argv[1];
    if (command == "--version" || command == "-V") {
        cout << Version::get_long() << endl;
        return 0;
    }

    // Determine a sensible default number of threads and apply it.
    choose_good_thread_count();

    auto* subcommand = Subcommand::get(argc, argv);
    if (subcommand == nullptr) {
        cerr << "error:[kmpfind] command " << command << " not found" << endl;
        kmpfind_help(argv);
        return 1;
    }

    return (*subcommand)(argc, argv);
}
