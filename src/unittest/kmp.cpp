/// \file kmp.cpp
///
/// Unit tests for the Knuth-Morris-Pratt table builder, scanner and matcher
///

#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <algorithm>
#include <tuple>
#include <omp.h>
#include "../kmp.hpp"
#include "../units.hpp"
#include "../utility.hpp"
#include <catch2/catch.hpp>


namespace kmpfind {
namespace unittest {
using namespace std;

/// Longest proper prefix of pattern[0..k] that is also a suffix of it, by
/// trying every length.
template<typename Unit>
static vector<size_t> brute_force_table(const vector<Unit>& pattern) {
    vector<size_t> table(pattern.size(), 0);
    for (size_t k = 0; k < pattern.size(); ++k) {
        for (size_t len = k; len > 0; --len) {
            if (equal(pattern.begin(), pattern.begin() + len, pattern.begin() + (k + 1 - len))) {
                table[k] = len;
                break;
            }
        }
    }
    return table;
}

/// Try every start position in order.
template<typename Unit>
static size_t brute_force_find(const vector<Unit>& text, const vector<Unit>& pattern) {
    if (pattern.size() > text.size()) {
        return string::npos;
    }
    for (size_t start = 0; start + pattern.size() <= text.size(); ++start) {
        if (equal(pattern.begin(), pattern.end(), text.begin() + start)) {
            return start;
        }
    }
    return string::npos;
}

static vector<char> as_chars(const string& str) {
    return vector<char>(str.begin(), str.end());
}

TEST_CASE("Prefix-suffix tables are correct for known patterns", "[kmp]") {

    REQUIRE(make_prefix_suffix_table(string("abaab")) == vector<size_t>{0, 0, 1, 1, 2});
    REQUIRE(make_prefix_suffix_table(string("aaaab")) == vector<size_t>{0, 1, 2, 3, 0});
    REQUIRE(make_prefix_suffix_table(string("aabaaa")) == vector<size_t>{0, 1, 0, 1, 2, 2});
    REQUIRE(make_prefix_suffix_table(string("abcdabd")) == vector<size_t>{0, 0, 0, 0, 1, 2, 0});
    REQUIRE(make_prefix_suffix_table(string("hello world")) == vector<size_t>(11, 0));

    SECTION("Degenerate patterns have trivial tables") {
        REQUIRE(make_prefix_suffix_table(string()).empty());
        REQUIRE(make_prefix_suffix_table(string("x")) == vector<size_t>{0});
        REQUIRE(make_prefix_suffix_table(string("xxxx")) == vector<size_t>{0, 1, 2, 3});
    }

    SECTION("Tables can be built for any unit type") {
        vector<int> pattern{7, 1, 7, 1, 7, 2, 7};
        REQUIRE(make_prefix_suffix_table(pattern) == vector<size_t>{0, 0, 1, 2, 3, 0, 1});
    }
}

TEST_CASE("Prefix-suffix tables count whole characters under the code point policy", "[kmp][units]") {

    REQUIRE(make_prefix_suffix_table(split_units("天苍苍野茫茫", CODE_POINTS)) == vector<size_t>(6, 0));
    REQUIRE(make_prefix_suffix_table(split_units("上海自来水来自海上", CODE_POINTS)) ==
            vector<size_t>{0, 0, 0, 0, 0, 0, 0, 0, 1});

    SECTION("A repeating phrase overlaps itself by whole characters") {
        REQUIRE(make_prefix_suffix_table(split_units("天苍苍天苍苍", CODE_POINTS)) ==
                vector<size_t>{0, 0, 0, 1, 2, 3});
    }

    SECTION("The same phrase as bytes has a table over bytes") {
        auto table = make_prefix_suffix_table(split_units("天苍苍天苍苍", BYTES));
        REQUIRE(table.size() == 18);
        REQUIRE(table.back() == 9);
    }
}

TEST_CASE("Prefix-suffix tables match a brute force computation", "[kmp]") {

    for (size_t i = 0; i < 200; ++i) {
        // small alphabets give lots of self-overlap
        string pattern = pseudo_random_sequence(1 + i % 17, 7919 * i + 13, i % 2 ? "ab" : "abc");
        auto table = make_prefix_suffix_table(pattern);

        REQUIRE(table.size() == pattern.size());
        REQUIRE(table[0] == 0);
        for (size_t k = 0; k < table.size(); ++k) {
            REQUIRE(table[k] <= k);
        }
        REQUIRE(table == brute_force_table(as_chars(pattern)));
    }
}

TEST_CASE("Knuth-Morris-Pratt implementation produces correct results", "[kmp]") {

    vector<pair<string, string>> searches;
    searches.emplace_back("ONIONIONSPL", "ONIONS");
    searches.emplace_back("QABCGABCABCD", "ABCD");
    searches.emplace_back("AAAAAAAAD", "AAAD");
    searches.emplace_back("TRAILTRAIN", "TRAIN");
    searches.emplace_back("ABCABC", "XYZ");
    searches.emplace_back("AABAAAC", "AAB");
    searches.emplace_back("AABAAAC", "AAC");
    for (size_t i = 0; i < 100; ++i) {
        searches.emplace_back(pseudo_random_sequence(20, i),
                              pseudo_random_sequence(5, 230897 * i + 98712));
        searches.emplace_back(searches.back().first, searches.back().first.substr(6, 10));
    }

    for (auto& search : searches) {

        string text, pattern;
        tie(text, pattern) = search;

        auto table = make_prefix_suffix_table(pattern.c_str(), pattern.size());
        size_t result = kmp_search(text.c_str(), text.size(),
                                   pattern.c_str(), pattern.size(),
                                   table);

        REQUIRE(result == text.find(pattern));
        REQUIRE(kmp_find(text, pattern) == text.find(pattern));
    }
}

TEST_CASE("Knuth-Morris-Pratt search agrees with a forward substring search", "[kmp]") {

    string s = "ababbbabbbabaababaaabaaaaabababaabcdabdbabab";

    for (string keyword : {"abaab", "aaaab", "aabaaa", "abcdabd"}) {
        REQUIRE(kmp_find(s, keyword) == s.find(keyword));
        REQUIRE(kmp_find(as_chars(s), as_chars(keyword)) == brute_force_find(as_chars(s), as_chars(keyword)));
    }

    SECTION("Random texts and patterns over a small alphabet agree with brute force") {
        for (size_t i = 0; i < 500; ++i) {
            string text = pseudo_random_sequence(i % 60, 31 * i + 5, "ab");
            string pattern = pseudo_random_sequence(1 + i % 6, 17 * i + 3, "ab");
            REQUIRE(kmp_find(text, pattern) == brute_force_find(as_chars(text), as_chars(pattern)));
        }
    }
}

TEST_CASE("Code point search agrees with brute force on multi-byte text", "[kmp][units]") {

    // Spell a sequence over "abc" with characters of different byte widths
    auto widen = [](const string& letters) {
        string wide;
        for (char letter : letters) {
            wide += (letter == 'a' ? "天" : (letter == 'b' ? "苍" : "x"));
        }
        return wide;
    };

    for (size_t i = 0; i < 300; ++i) {
        string text = widen(pseudo_random_sequence(i % 40, 7 * i + 1, "abc"));
        string pattern = widen(pseudo_random_sequence(1 + i % 5, 11 * i + 2, "abc"));

        size_t expected = brute_force_find(split_units(text, CODE_POINTS), split_units(pattern, CODE_POINTS));
        REQUIRE(find_units(text, pattern, CODE_POINTS) == expected);

        // In valid UTF-8 the first byte match is the first character match
        if (expected == string::npos) {
            REQUIRE(text.find(pattern) == string::npos);
        } else {
            REQUIRE(unit_byte_offsets(text, CODE_POINTS)[expected] == text.find(pattern));
        }
    }
}

TEST_CASE("Knuth-Morris-Pratt search handles edge cases", "[kmp]") {

    SECTION("The empty pattern matches at the start") {
        REQUIRE(kmp_find(string("abc"), string()) == 0);
        REQUIRE(kmp_find(string(), string()) == 0);
        REQUIRE(kmp_find(vector<int>{1, 2}, vector<int>()) == 0);
    }

    SECTION("A pattern longer than the text is not found") {
        REQUIRE(kmp_find(string("abc"), string("abcd")) == string::npos);
        REQUIRE(kmp_find(string(), string("a")) == string::npos);
    }

    SECTION("A pattern equal to the text is found at 0") {
        REQUIRE(kmp_find(string("abcab"), string("abcab")) == 0);
    }

    SECTION("Matches at the very start and very end are found") {
        REQUIRE(kmp_find(string("abxxxx"), string("ab")) == 0);
        REQUIRE(kmp_find(string("xxxxab"), string("ab")) == 4);
        REQUIRE(kmp_find(string("ab"), string("b")) == 1);
        REQUIRE(kmp_find(string("aaaab"), string("aab")) == 2);
    }

    SECTION("A pattern that never occurs is not found") {
        REQUIRE(kmp_find(string("aaaaaaaa"), string("aab")) == string::npos);
        REQUIRE(kmp_find(string("abababab"), string("abba")) == string::npos);
    }

    SECTION("Only the first of several matches is reported") {
        REQUIRE(kmp_find(string("xabyab"), string("ab")) == 1);
        REQUIRE(kmp_find(string("aaaaa"), string("aa")) == 0);
    }

    SECTION("Searching within part of a buffer uses only that part") {
        string text = "abcabcabc";
        auto table = make_prefix_suffix_table(string("cab"));
        REQUIRE(kmp_search(text.c_str() + 3, 3, "cab", 3, table) == string::npos);
        REQUIRE(kmp_search(text.c_str() + 3, 5, "cab", 3, table) == 2);
    }
}

TEST_CASE("Knuth-Morris-Pratt search rejects a table built for another pattern", "[kmp]") {

    string text = "abcabd";
    auto table = make_prefix_suffix_table(string("abd"));
    REQUIRE_THROWS_AS(kmp_search(text.c_str(), text.size(), "abda", 4, table), invalid_argument);
    REQUIRE_THROWS_AS(kmp_search(text.c_str(), text.size(), "", 0, table), invalid_argument);
    REQUIRE(kmp_search(text.c_str(), text.size(), "abd", 3, table) == 3);
}

TEST_CASE("A KMPMatcher can be reused across texts", "[kmp][matcher]") {

    KMPMatcher<char> matcher(as_chars("abcdabd"));

    REQUIRE(matcher.size() == 7);
    REQUIRE(matcher.table() == vector<size_t>{0, 0, 0, 0, 1, 2, 0});
    REQUIRE(matcher.pattern() == as_chars("abcdabd"));

    REQUIRE(matcher.find(as_chars("abc abcdab abcdabcdabde")) == 15);
    REQUIRE(matcher.find(as_chars("abcdab")) == string::npos);
    REQUIRE(matcher.find(as_chars("abcdabd")) == 0);

    SECTION("A default matcher has the empty pattern") {
        KMPMatcher<char> empty;
        REQUIRE(empty.size() == 0);
        REQUIRE(empty.find(as_chars("anything")) == 0);
    }

    SECTION("A matcher can be made from a buffer") {
        string buffer = "xyzabd";
        KMPMatcher<char> from_buffer(buffer.c_str() + 3, 3);
        REQUIRE(from_buffer.pattern() == as_chars("abd"));
        REQUIRE(from_buffer.find(buffer.c_str(), buffer.size()) == 3);
    }
}

TEST_CASE("A shared KMPMatcher gives the same answers from many threads", "[kmp][matcher]") {

    vector<unit_t> pattern = split_units("GATTACA", BYTES);
    KMPMatcher<unit_t> matcher(pattern);

    vector<vector<unit_t>> texts;
    for (size_t i = 0; i < 400; ++i) {
        string text = pseudo_random_sequence(300, 104729 * i + 1);
        if (i % 3 == 0) {
            // make sure plenty of texts have a match
            text.replace(i % 290, 7, "GATTACA");
        }
        texts.push_back(split_units(text, BYTES));
    }

    vector<size_t> parallel_results(texts.size(), string::npos);
#pragma omp parallel for num_threads(4)
    for (size_t i = 0; i < texts.size(); ++i) {
        parallel_results[i] = matcher.find(texts[i]);
    }

    for (size_t i = 0; i < texts.size(); ++i) {
        REQUIRE(parallel_results[i] == brute_force_find(texts[i], pattern));
        if (i % 3 == 0) {
            REQUIRE(parallel_results[i] != string::npos);
        }
    }
}

}
}
