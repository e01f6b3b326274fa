// subcommand.cpp: subcommand registry

#include "subcommand.hpp"

#include <algorithm>
#include <vector>
#include <limits>

namespace kmpfind {
namespace subcommand {

std::ostream& operator<<(std::ostream& out, const CommandCategory& category) {
    switch(category) {
    case SEARCH:
        out << "search commands";
        break;
    case DEVELOPMENT:
        out << "developer commands";
        break;
    }
    return out;
}

Subcommand::Subcommand(std::string name, std::string description,
    CommandCategory category, int priority,
    std::function<int(int, char**)> main_function) : name(name),
    description(description), category(category), priority(priority),
    main_function(main_function) {

    get_registry()[name] = this;
}

Subcommand::Subcommand(std::string name, std::string description,
    CommandCategory category,
    std::function<int(int, char**)> main_function) :
    Subcommand(name, description, category, std::numeric_limits<int>::max(), main_function) {
    // Nothing to do!
}

const std::string& Subcommand::get_name() const {
    return name;
}

const std::string& Subcommand::get_description() const {
    return description;
}

const CommandCategory& Subcommand::get_category() const {
    return category;
}

const int& Subcommand::get_priority() const {
    return priority;
}

int Subcommand::operator()(int argc, char** argv) const {
    return main_function(argc, argv);
}

const Subcommand* Subcommand::get(int argc, char** argv) {
    if (argc < 2) {
        return nullptr;
    }
    auto found = get_registry().find(argv[1]);
    return found == get_registry().end() ? nullptr : found->second;
}

void Subcommand::for_each(CommandCategory category, const std::function<void(const Subcommand&)>& lambda) {

    // The registry is ordered by name, so a stable sort on priority keeps
    // ties alphabetical.
    std::vector<const Subcommand*> in_category;
    for (auto& kv : get_registry()) {
        if (kv.second->get_category() == category) {
            in_category.push_back(kv.second);
        }
    }
    std::stable_sort(in_category.begin(), in_category.end(), [](const Subcommand* a, const Subcommand* b) {
        return a->get_priority() < b->get_priority();
    });

    for (auto* command : in_category) {
        lambda(*command);
    }
}

std::map<std::string, Subcommand*>& Subcommand::get_registry() {
    static std::map<std::string, Subcommand*> registry;
    return registry;
}

}
}
