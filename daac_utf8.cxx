#include <stddef.h>
#include "daac_utf8.hpp"

static inline bool
is_cont(unsigned char c) {
    return (c & 0xc0) == 0x80;
}

uint32
Utf8_Decode(const unsigned char* str, uint32 len, InputTy* c) {
    ASSERT(len > 0);
    unsigned char b0 = str[0];

    if (likely(b0 < 0x80)) {
        *c = b0;
        return 1;
    }

    uint32 need;
    unsigned char lo = 0x80, hi = 0xbf;   // legal range of the 2nd byte
    if (b0 >= 0xc2 && b0 <= 0xdf) {
        need = 2;
    } else if (b0 >= 0xe0 && b0 <= 0xef) {
        need = 3;
        if (b0 == 0xe0)
            lo = 0xa0;   // overlong
        else if (b0 == 0xed)
            hi = 0x9f;   // surrogates
    } else if (b0 >= 0xf0 && b0 <= 0xf4) {
        need = 4;
        if (b0 == 0xf0)
            lo = 0x90;   // overlong
        else if (b0 == 0xf4)
            hi = 0x8f;   // > U+10FFFF
    } else {
        *c = DAAC_INVALID_INPUT;
        return 1;
    }

    if (need > len || str[1] < lo || str[1] > hi) {
        *c = DAAC_INVALID_INPUT;
        return 1;
    }

    InputTy v = b0 & (0xff >> (need + 1));
    for (uint32 i = 1; i < need; i++) {
        if (!is_cont(str[i])) {
            *c = DAAC_INVALID_INPUT;
            return 1;
        }
        v = (v << 6) | (str[i] & 0x3f);
    }

    *c = v;
    return need;
}

bool
Utf8_Validate(const char* str, uint32 len) {
    const unsigned char* s = (const unsigned char*)str;
    for (uint32 i = 0; i < len; ) {
        InputTy c;
        i += Utf8_Decode(s + i, len - i, &c);
        if (c == DAAC_INVALID_INPUT)
            return false;
    }
    return true;
}

DA_Pos_Map::DA_Pos_Map(const char* str, uint32 len) :
    _map((size_t)len + 1, 0) {
    const unsigned char* s = (const unsigned char*)str;
    uint32 idx = 0;
    for (uint32 i = 0; i < len; idx++) {
        InputTy c;
        _map[i] = idx;
        i += Utf8_Decode(s + i, len - i, &c);
    }
    _map[len] = idx;
}
