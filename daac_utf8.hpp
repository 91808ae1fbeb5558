#ifndef DAAC_UTF8_H
#define DAAC_UTF8_H

#include <vector>
#include "daac_util.hpp"

// Decode the codepoint starting at str[0]. Returns the number of bytes it
// occupies. Overlong forms, surrogates, values beyond U+10FFFF and truncated
// sequences are rejected: *c is then set to DAAC_INVALID_INPUT and 1 is
// returned, so the caller always makes progress. len must be > 0.
uint32 Utf8_Decode(const unsigned char* str, uint32 len, InputTy* c);

// Return true iff str[0, len) is entirely valid UTF-8.
bool Utf8_Validate(const char* str, uint32 len);

// Maps byte offsets of a haystack to codepoint indices. Built once per search
// call; only offsets at which a codepoint starts, plus the one-past-the-end
// offset, are meaningful.
class DA_Pos_Map {
public:
    DA_Pos_Map(const char* str, uint32 len);

    uint32 Translate(uint32 ofst) const {
        ASSERT(ofst < _map.size());
        return _map[ofst];
    }

    // Number of codepoints in the haystack.
    uint32 Get_Char_Num() const { return _map.back(); }

private:
    std::vector<uint32> _map;
};

#endif //DAAC_UTF8_H
