#include "units.hpp"
#include "kmp.hpp"

//#define debug_units

namespace kmpfind {

ostream& operator<<(ostream& out, const UnitPolicy& policy) {
    switch (policy) {
    case BYTES:
        out << "bytes";
        break;
    case CODE_POINTS:
        out << "codepoints";
        break;
    }
    return out;
}

template<>
bool parse(const string& arg, UnitPolicy& dest) {
    if (arg == "bytes") {
        dest = BYTES;
    } else if (arg == "codepoints" || arg == "chars") {
        dest = CODE_POINTS;
    } else {
        return false;
    }
    return true;
}

size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    } else if (lead < 0xC2) {
        // continuation bytes, and C0/C1 which could only start overlong encodings
        return 0;
    } else if (lead < 0xE0) {
        return 2;
    } else if (lead < 0xF0) {
        return 3;
    } else if (lead < 0xF5) {
        return 4;
    }
    // would encode past U+10FFFF
    return 0;
}

/// Decode the UTF-8 sequence starting at byte i. Returns the number of bytes
/// used, or 0 if the bytes there are not a well-formed sequence.
static size_t decode_code_point(const string& str, size_t i, unit_t& code_point) {
    unsigned char lead = str[i];
    size_t length = utf8_sequence_length(lead);
    if (length == 0 || i + length > str.size()) {
        return 0;
    }

    if (length == 1) {
        code_point = lead;
        return 1;
    }

    // take the payload bits of the lead byte
    code_point = lead & (0x7F >> length);
    for (size_t k = 1; k < length; ++k) {
        unsigned char next = str[i + k];
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }

    if ((length == 3 && code_point < 0x800) || (length == 4 && code_point < 0x10000)) {
        // overlong
        return 0;
    }
    if ((code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
        return 0;
    }
    return length;
}

vector<unit_t> split_units(const string& str, UnitPolicy policy, size_t* invalid_count) {

    vector<unit_t> units;
    size_t invalid = 0;

    if (policy == BYTES) {
        units.reserve(str.size());
        for (unsigned char c : str) {
            units.push_back(c);
        }
    } else {
        for (size_t i = 0; i < str.size();) {
            unit_t code_point;
            size_t used = decode_code_point(str, i, code_point);
            if (used != 0) {
                units.push_back(code_point);
                i += used;
            } else {
                // keep the byte on its own, where it can only match itself
#ifdef debug_units
                cerr << "[units] malformed UTF-8 byte " << (int) (unsigned char) str[i] << " at " << i << endl;
#endif
                units.push_back(MALFORMED_BYTE_BASE + (unsigned char) str[i]);
                ++invalid;
                ++i;
            }
        }
    }

    if (invalid_count != nullptr) {
        *invalid_count = invalid;
    }
    return units;
}

vector<size_t> unit_byte_offsets(const string& str, UnitPolicy policy) {
    vector<size_t> offsets;
    for (size_t i = 0; i < str.size();) {
        offsets.push_back(i);
        size_t used = 1;
        if (policy == CODE_POINTS) {
            unit_t code_point;
            used = decode_code_point(str, i, code_point);
            if (used == 0) {
                used = 1;
            }
        }
        i += used;
    }
    offsets.push_back(str.size());
    return offsets;
}

size_t find_units(const string& text, const string& pattern, UnitPolicy policy) {
    if (policy == BYTES) {
        return kmp_find(text, pattern);
    }
    return kmp_find(split_units(text, policy), split_units(pattern, policy));
}

}
