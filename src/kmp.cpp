#include "kmp.hpp"

#include <string>

namespace kmpfind {

vector<size_t> make_prefix_suffix_table(const char* pattern, size_t len) {
    return make_prefix_suffix_table<char>(pattern, len);
}

vector<size_t> make_prefix_suffix_table(const string& pattern) {
    return make_prefix_suffix_table<char>(pattern.c_str(), pattern.size());
}

size_t kmp_search(const char* text, size_t text_len,
                  const char* pattern, size_t pattern_len,
                  const vector<size_t>& prefix_suffix_table) {
    return kmp_search<char>(text, text_len, pattern, pattern_len, prefix_suffix_table);
}

size_t kmp_find(const string& text, const string& pattern) {
    auto table = make_prefix_suffix_table(pattern);
    return kmp_search(text.c_str(), text.size(), pattern.c_str(), pattern.size(), table);
}

}
