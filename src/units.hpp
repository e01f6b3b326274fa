#ifndef KMPFIND_UNITS_HPP_INCLUDED
#define KMPFIND_UNITS_HPP_INCLUDED

/** \file units.hpp
 * Splitting of UTF-8 strings into the atomic units that patterns and texts
 * are compared by. A prefix-suffix table is only valid for the unit sequence
 * it was built from, so a pattern and the texts it is searched in must be
 * split with the same policy.
 */

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>

#include "utility.hpp"

namespace kmpfind {

using namespace std;

/// What counts as one unit of a string
enum UnitPolicy {
    /// Every byte is a unit
    BYTES,
    /// Every UTF-8 encoded code point is a unit
    CODE_POINTS
};

/// Units are code points, bytes, or malformed bytes mapped out of the
/// Unicode range.
typedef uint32_t unit_t;

/// Under CODE_POINTS, a byte that does not start a well-formed UTF-8 sequence
/// becomes the unit MALFORMED_BYTE_BASE + byte.
const unit_t MALFORMED_BYTE_BASE = 0x110000;

/// Print the name of a policy, as accepted by parse<UnitPolicy>.
ostream& operator<<(ostream& out, const UnitPolicy& policy);

/// Parse "bytes", or "codepoints" (or "chars"), into a policy.
template<>
bool parse(const string& arg, UnitPolicy& dest);

/// Length of the UTF-8 sequence introduced by the given lead byte, or 0 if
/// the byte is a continuation byte or can never appear in UTF-8.
size_t utf8_sequence_length(unsigned char lead);

/// Split a string into units. If invalid_count is set, it receives the
/// number of malformed bytes found (always 0 for BYTES).
vector<unit_t> split_units(const string& str, UnitPolicy policy, size_t* invalid_count = nullptr);

/// Get the byte offset at which each unit of the string starts, followed by
/// the length of the string.
vector<size_t> unit_byte_offsets(const string& str, UnitPolicy policy);

/// Find the first occurrence of the pattern in the text, with both split
/// under the given policy. Returns an index in units, or string::npos.
size_t find_units(const string& text, const string& pattern, UnitPolicy policy);

}

#endif
