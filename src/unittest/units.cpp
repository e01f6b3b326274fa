/// \file units.cpp
///
/// Unit tests for splitting strings into bytes and code points
///

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "../units.hpp"
#include "../kmp.hpp"
#include <catch2/catch.hpp>


namespace kmpfind {
namespace unittest {
using namespace std;

TEST_CASE("UTF-8 lead bytes give their sequence lengths", "[units]") {
    REQUIRE(utf8_sequence_length('a') == 1);
    REQUIRE(utf8_sequence_length(0x00) == 1);
    REQUIRE(utf8_sequence_length(0xC3) == 2);
    REQUIRE(utf8_sequence_length(0xE5) == 3);
    REQUIRE(utf8_sequence_length(0xF0) == 4);

    // continuation bytes, overlong leads, and leads past U+10FFFF
    REQUIRE(utf8_sequence_length(0x80) == 0);
    REQUIRE(utf8_sequence_length(0xBF) == 0);
    REQUIRE(utf8_sequence_length(0xC0) == 0);
    REQUIRE(utf8_sequence_length(0xC1) == 0);
    REQUIRE(utf8_sequence_length(0xF5) == 0);
    REQUIRE(utf8_sequence_length(0xFF) == 0);
}

TEST_CASE("Strings split into units", "[units]") {

    SECTION("ASCII is the same under both policies") {
        vector<unit_t> expected{'h', 'i', '!'};
        REQUIRE(split_units("hi!", BYTES) == expected);
        REQUIRE(split_units("hi!", CODE_POINTS) == expected);
        REQUIRE(split_units("", CODE_POINTS).empty());
    }

    SECTION("Multi-byte characters are one code point each") {
        // U+00E9, U+5929, U+1F600
        string text = "\xC3\xA9\xE5\xA4\xA9\xF0\x9F\x98\x80";
        REQUIRE(split_units(text, CODE_POINTS) == vector<unit_t>{0xE9, 0x5929, 0x1F600});
        REQUIRE(split_units(text, BYTES).size() == 9);
        REQUIRE(split_units(text, BYTES)[0] == 0xC3);
    }

    SECTION("Malformed bytes become units of their own") {
        size_t invalid = 0;

        // lone continuation byte
        REQUIRE(split_units("a\x80" "b", CODE_POINTS, &invalid) ==
                vector<unit_t>{'a', MALFORMED_BYTE_BASE + 0x80, 'b'});
        REQUIRE(invalid == 1);

        // truncated sequence at the end
        REQUIRE(split_units("a\xE5\xA4", CODE_POINTS, &invalid) ==
                vector<unit_t>{'a', MALFORMED_BYTE_BASE + 0xE5, MALFORMED_BYTE_BASE + 0xA4});
        REQUIRE(invalid == 2);

        // bad continuation byte; the following ASCII still decodes
        REQUIRE(split_units("\xC3z", CODE_POINTS, &invalid) == vector<unit_t>{MALFORMED_BYTE_BASE + 0xC3, 'z'});
        REQUIRE(invalid == 1);

        // overlong encoding of '/'
        REQUIRE(split_units("\xE0\x80\xAF", CODE_POINTS, &invalid).size() == 3);
        REQUIRE(invalid == 3);

        // UTF-16 surrogate
        REQUIRE(split_units("\xED\xA0\x80", CODE_POINTS, &invalid).size() == 3);
        REQUIRE(invalid == 3);

        // bytes are never malformed
        split_units("\xFF\xFE", BYTES, &invalid);
        REQUIRE(invalid == 0);
    }
}

TEST_CASE("Unit byte offsets mark where each unit starts", "[units]") {
    string text = "a\xC3\xA9\xE5\xA4\xA9" "b";
    REQUIRE(unit_byte_offsets(text, CODE_POINTS) == vector<size_t>{0, 1, 3, 6, 7});
    REQUIRE(unit_byte_offsets(text, BYTES) == vector<size_t>{0, 1, 2, 3, 4, 5, 6, 7});
    REQUIRE(unit_byte_offsets("", CODE_POINTS) == vector<size_t>{0});
    REQUIRE(unit_byte_offsets("\x80" "a", CODE_POINTS) == vector<size_t>{0, 1, 2});
}

TEST_CASE("Searches count positions in units", "[units][kmp]") {

    string text = "白日依山尽，黄河入海流";

    REQUIRE(find_units(text, "黄河", CODE_POINTS) == 6);
    REQUIRE(find_units(text, "黄河", BYTES) == 18);
    REQUIRE(find_units(text, "白日", CODE_POINTS) == 0);
    REQUIRE(find_units(text, "海流", CODE_POINTS) == 9);
    REQUIRE(find_units(text, "长江", CODE_POINTS) == string::npos);
    REQUIRE(find_units(text, "", CODE_POINTS) == 0);

    SECTION("A byte pattern straddling two characters only matches as bytes") {
        // end of U+00E9 followed by the start of U+00E4
        string accents = "\xC3\xA9\xC3\xA4";
        string straddle = "\xA9\xC3";
        REQUIRE(find_units(accents, straddle, BYTES) == 1);
        REQUIRE(find_units(accents, straddle, CODE_POINTS) == string::npos);
    }

    SECTION("Code point results agree with byte results through the offsets") {
        string mixed = "naïve café, naïve résumé";
        string pattern = "café";
        size_t unit_index = find_units(mixed, pattern, CODE_POINTS);
        REQUIRE(unit_index != string::npos);
        REQUIRE(unit_byte_offsets(mixed, CODE_POINTS)[unit_index] == mixed.find(pattern));
    }
}

TEST_CASE("Unit policies print and parse by name", "[units]") {
    stringstream s;
    s << BYTES << " " << CODE_POINTS;
    REQUIRE(s.str() == "bytes codepoints");

    UnitPolicy policy = BYTES;
    REQUIRE(parse<UnitPolicy>("codepoints", policy));
    REQUIRE(policy == CODE_POINTS);
    REQUIRE(parse<UnitPolicy>("bytes", policy));
    REQUIRE(policy == BYTES);
    REQUIRE(parse<UnitPolicy>("chars", policy));
    REQUIRE(policy == CODE_POINTS);
    REQUIRE_FALSE(parse<UnitPolicy>("graphemes", policy));
    REQUIRE(policy == CODE_POINTS);
}

}
}
