#ifndef KMPFIND_SUBCOMMAND_SUBCOMMAND_HPP_INCLUDED
#define KMPFIND_SUBCOMMAND_SUBCOMMAND_HPP_INCLUDED

/** \file
 * subcommand.hpp: registry of the "kmpfind <name>" commands.
 *
 * Each subcommand lives in its own *_main.cpp file in this directory and
 * registers itself with a static Subcommand object:
 *
 *     int main_frobnicate(int argc, char** argv) {
 *         return 0;
 *     }
 *
 *     static Subcommand kmpfind_frobnicate("frobnicate", "frobnicate patterns",
 *         SEARCH, main_frobnicate);
 *
 * Those files must be compiled into the executable itself. If they were put
 * in a static library, nothing would reference them and the linker would
 * leave them, and their registrations, out.
 *
 * The main function gets the whole argv, including "kmpfind" and the
 * subcommand name, and prints its own usage.
 */

#include <map>
#include <functional>
#include <string>
#include <iostream>

namespace kmpfind {
namespace subcommand {

/// Groups of subcommands for the help listing
enum CommandCategory {
    /// Searching texts and inspecting patterns
    SEARCH,
    /// Only of interest when working on kmpfind
    DEVELOPMENT
};

/// Print the heading for a category
std::ostream& operator<<(std::ostream& out, const CommandCategory& category);

class Subcommand {

public:

    /// Register a subcommand. Within a category, lower priorities are listed
    /// first.
    Subcommand(std::string name, std::string description,
        CommandCategory category, int priority,
        std::function<int(int, char**)> main_function);

    /// Register a subcommand listed after all the prioritized ones.
    Subcommand(std::string name, std::string description,
        CommandCategory category,
        std::function<int(int, char**)> main_function);

    const std::string& get_name() const;

    const std::string& get_description() const;

    const CommandCategory& get_category() const;

    const int& get_priority() const;

    /// Run the subcommand and return its exit code.
    int operator()(int argc, char** argv) const;

    /// Look up the subcommand named by argv[1], or nullptr if there is none.
    static const Subcommand* get(int argc, char** argv);

    /// Visit the subcommands of one category, by priority and then by name.
    static void for_each(CommandCategory category, const std::function<void(const Subcommand&)>& lambda);

private:
    /// Subcommands register from static initializers in other files, so the
    /// registry is a function-local static that exists as soon as it is
    /// first asked for.
    static std::map<std::string, Subcommand*>& get_registry();

    std::string name;
    std::string description;
    CommandCategory category;
    int priority;
    std::function<int(int, char**)> main_function;
};

}
}

#endif
