#ifndef KMPFIND_KMP_HPP_INCLUDED
#define KMPFIND_KMP_HPP_INCLUDED

// kmp.hpp: Knuth-Morris-Pratt algorithm

#include <vector>
#include <string>
#include <stdexcept>

#ifdef debug_kmp
#include <iostream>
#endif

namespace kmpfind {

using namespace std;

/// Preprocess a search pattern of any unit type with operator==. Entry k of
/// the result is the length of the longest proper prefix of pattern[0..k]
/// that is also a suffix of it.
template<typename Unit>
vector<size_t> make_prefix_suffix_table(const Unit* pattern, size_t len);

template<typename Unit>
vector<size_t> make_prefix_suffix_table(const vector<Unit>& pattern);

// byte strings
vector<size_t> make_prefix_suffix_table(const char* pattern, size_t len);
vector<size_t> make_prefix_suffix_table(const string& pattern);

/// Return index of first match or string::npos if there is no match. The
/// empty pattern matches at 0. The table must have come from
/// make_prefix_suffix_table on this same pattern; a table of the wrong length
/// throws invalid_argument.
template<typename Unit>
size_t kmp_search(const Unit* text, size_t text_len,
                  const Unit* pattern, size_t pattern_len,
                  const vector<size_t>& prefix_suffix_table);

size_t kmp_search(const char* text, size_t text_len,
                  const char* pattern, size_t pattern_len,
                  const vector<size_t>& prefix_suffix_table);

/// Build the table for the pattern and search the text with it.
template<typename Unit>
size_t kmp_find(const vector<Unit>& text, const vector<Unit>& pattern);

/// Byte-wise search of a string, same result as text.find(pattern).
size_t kmp_find(const string& text, const string& pattern);

/**
 * A pattern with its prefix-suffix table already computed, so that the same
 * table can be used to search any number of texts. Searching does not modify
 * the matcher, so one matcher can be shared between threads.
 */
template<typename Unit>
class KMPMatcher {
public:

    KMPMatcher() = default;

    /// Copy the pattern and build its table.
    KMPMatcher(const vector<Unit>& pattern);

    KMPMatcher(const Unit* pattern, size_t len);

    /// Index of the first occurrence of the pattern in the text, or
    /// string::npos.
    size_t find(const Unit* text, size_t text_len) const;

    size_t find(const vector<Unit>& text) const;

    /// Get the pattern we match.
    const vector<Unit>& pattern() const;

    /// Get the prefix-suffix table for the pattern.
    const vector<size_t>& table() const;

    /// Length of the pattern, in units.
    size_t size() const;

private:

    vector<Unit> pattern_units;
    vector<size_t> prefix_suffix_table;
};


/////////////
// Template implementations
/////////////

template<typename Unit>
vector<size_t> make_prefix_suffix_table(const Unit* pattern, size_t len) {

    vector<size_t> table(len, 0);

    // j is the length of the longest proper prefix-suffix of pattern[0..i)
    for (size_t i = 1, j = 0; i < len;) {
        if (pattern[i] == pattern[j]) {
            ++j;
            table[i] = j;
            ++i;
        }
        else {
            if (j != 0) {
                // fall back to the next shorter prefix that is also a suffix
                j = table[j - 1];
#ifdef debug_kmp
                cerr << "[kmp] table mismatch at " << i << ", fall back to prefix of length " << j << endl;
#endif
            }
            else {
                table[i] = 0;
                ++i;
            }
        }
    }

    return table;
}

template<typename Unit>
vector<size_t> make_prefix_suffix_table(const vector<Unit>& pattern) {
    return make_prefix_suffix_table(pattern.data(), pattern.size());
}

template<typename Unit>
size_t kmp_search(const Unit* text, size_t text_len,
                  const Unit* pattern, size_t pattern_len,
                  const vector<size_t>& prefix_suffix_table) {

    if (prefix_suffix_table.size() != pattern_len) {
        throw invalid_argument("prefix-suffix table of length " + to_string(prefix_suffix_table.size())
                               + " does not belong to a pattern of length " + to_string(pattern_len));
    }

    if (pattern_len == 0) {
        // the empty pattern occurs at the start of any text
        return 0;
    }

    if (text_len >= pattern_len) {
        // i - j is where the current partial match starts, and a match can't
        // start after last
        for (size_t i = 0, j = 0, last = text_len - pattern_len; i - j <= last;) {
            if (text[i] == pattern[j]) {
                ++i;
                ++j;
                if (j == pattern_len) {
                    return i - pattern_len;
                }
            }
            else {
                if (j != 0) {
                    j = prefix_suffix_table[j - 1];
#ifdef debug_kmp
                    cerr << "[kmp] text mismatch at " << i << ", keep " << j << " matched units" << endl;
#endif
                }
                else {
                    ++i;
                }
            }
        }
    }
    return string::npos;
}

template<typename Unit>
size_t kmp_find(const vector<Unit>& text, const vector<Unit>& pattern) {
    auto table = make_prefix_suffix_table(pattern);
    return kmp_search(text.data(), text.size(), pattern.data(), pattern.size(), table);
}

template<typename Unit>
KMPMatcher<Unit>::KMPMatcher(const vector<Unit>& pattern) :
    pattern_units(pattern), prefix_suffix_table(make_prefix_suffix_table(pattern)) {

    // Nothing to do!
}

template<typename Unit>
KMPMatcher<Unit>::KMPMatcher(const Unit* pattern, size_t len) :
    pattern_units(pattern, pattern + len), prefix_suffix_table(make_prefix_suffix_table(pattern, len)) {

    // Nothing to do!
}

template<typename Unit>
size_t KMPMatcher<Unit>::find(const Unit* text, size_t text_len) const {
    return kmp_search(text, text_len, pattern_units.data(), pattern_units.size(), prefix_suffix_table);
}

template<typename Unit>
size_t KMPMatcher<Unit>::find(const vector<Unit>& text) const {
    return find(text.data(), text.size());
}

template<typename Unit>
const vector<Unit>& KMPMatcher<Unit>::pattern() const {
    return pattern_units;
}

template<typename Unit>
const vector<size_t>& KMPMatcher<Unit>::table() const {
    return prefix_suffix_table;
}

template<typename Unit>
size_t KMPMatcher<Unit>::size() const {
    return pattern_units.size();
}

}

#endif
