// Interface functions for libdaac.so
//
#include <new>
#include <string>
#include <vector>
#include "daac_slow.hpp"
#include "daac_fast.hpp"
#include "daac_match.hpp"
#include "daac.h"

using namespace std;

// Pattern text, indexed by pattern id, for the *_as_strings() queries.
typedef vector<string> Pattern_Vect;

typedef struct {
    daac_t hdr;
    DA_Automaton* impl;
    Pattern_Vect* patterns;
} DAAC_Header;

static inline const DAAC_Header*
get_header(const daac_t* ac) {
    ASSERT(!ac || ac->magic_num == DAAC_MAGIC_NUM);
    return (const DAAC_Header*)(const void*)ac;
}

static inline void
set_status(daac_status_t* status, daac_status_t st) {
    if (status)
        *status = st;
}

static daac_t*
_create(const char** strv, const unsigned int* strlenv,
        const unsigned int* values, unsigned int vect_len, int match_kind,
        daac_status_t* status) {
    if (vect_len && !strv) {
        set_status(status, DAAC_ERR_INVALID_ARG);
        return 0;
    }
    for (unsigned int i = 0; i < vect_len; i++) {
        if (!strv[i]) {
            set_status(status, DAAC_ERR_INVALID_ARG);
            return 0;
        }
    }

    if (match_kind != DAAC_MATCH_STANDARD &&
        match_kind != DAAC_MATCH_LEFTMOST_LONGEST &&
        match_kind != DAAC_MATCH_LEFTMOST_FIRST) {
        set_status(status, DAAC_ERR_BAD_MATCH_KIND);
        return 0;
    }

    DAAC_Header* hdr = 0;
    DA_Automaton* da = 0;
    Pattern_Vect* pats = 0;
    try {
        ACS_Constructor acc;
        daac_status_t st = acc.Construct(strv, strlenv, values, vect_len);
        if (st != DAAC_OK) {
            set_status(status, st);
            return 0;
        }

        da = new DA_Automaton;
        DA_Converter cvt(acc, (DA_Match_Kind)match_kind);
        st = cvt.Convert(*da);
        if (st != DAAC_OK) {
            delete da;
            set_status(status, st);
            return 0;
        }

        pats = new Pattern_Vect;
        pats->reserve(vect_len);
        for (unsigned int i = 0; i < vect_len; i++) {
            unsigned int len = strlenv ? strlenv[i] : strlen(strv[i]);
            pats->push_back(string(strv[i], len));
        }

        hdr = new DAAC_Header;
        hdr->hdr.magic_num = DAAC_MAGIC_NUM;
        hdr->hdr.match_kind = (unsigned char)match_kind;
        hdr->impl = da;
        hdr->patterns = pats;
    } catch (const std::bad_alloc&) {
        delete da;
        delete pats;
        set_status(status, DAAC_ERR_NOMEM);
        return 0;
    }

    set_status(status, DAAC_OK);
    return &hdr->hdr;
}

extern "C" daac_t*
daac_create(const char** strv, const unsigned int* strlenv,
            unsigned int vect_len, int match_kind, daac_status_t* status) {
    return _create(strv, strlenv, 0, vect_len, match_kind, status);
}

extern "C" daac_t*
daac_create_with_values(const char** strv, const unsigned int* strlenv,
                        const unsigned int* values, unsigned int vect_len,
                        int match_kind, daac_status_t* status) {
    if (!values) {
        set_status(status, DAAC_ERR_INVALID_ARG);
        return 0;
    }
    return _create(strv, strlenv, values, vect_len, match_kind, status);
}

extern "C" unsigned int
daac_pattern_num(const daac_t* ac) {
    const DAAC_Header* hdr = get_header(ac);
    return hdr ? hdr->impl->Get_Pattern_Num() : 0;
}

extern "C" int
daac_get_match_kind(const daac_t* ac) {
    return ac ? ac->match_kind : -1;
}

static daac_status_t
_find(const daac_t* ac, DA_Find_Mode mode, const char* str, unsigned int len,
      daac_match_vect_t* result) {
    if (!result)
        return DAAC_ERR_INVALID_ARG;
    result->matches = 0;
    result->num = 0;

    if (!ac || (len && !str) || len > DAAC_MAX_HAYSTACK_LEN)
        return DAAC_ERR_INVALID_ARG;

    const DAAC_Header* hdr = get_header(ac);
    const DA_Automaton& da = *hdr->impl;
    try {
        DA_Match_Vect mv;
        daac_status_t st = DA_Find(da, mode, str, len, true, mv);
        if (st != DAAC_OK || mv.empty())
            return st;

        daac_match_t* matches = new daac_match_t[mv.size()];
        for (uint32 i = 0, e = mv.size(); i < e; i++) {
            matches[i].match_begin = mv[i].begin;
            matches[i].match_end = mv[i].end;
            matches[i].value = da.Get_Output(mv[i].pattern_id).value;
        }
        result->matches = matches;
        result->num = mv.size();
    } catch (const std::bad_alloc&) {
        return DAAC_ERR_NOMEM;
    }
    return DAAC_OK;
}

static daac_status_t
_find_strings(const daac_t* ac, DA_Find_Mode mode, const char* str,
              unsigned int len, daac_str_vect_t* result) {
    if (!result)
        return DAAC_ERR_INVALID_ARG;
    result->strs = 0;
    result->num = 0;

    if (!ac || (len && !str) || len > DAAC_MAX_HAYSTACK_LEN)
        return DAAC_ERR_INVALID_ARG;

    const DAAC_Header* hdr = get_header(ac);
    const Pattern_Vect& pats = *hdr->patterns;
    try {
        // Only the pattern ids are needed, skip the offset translation.
        DA_Match_Vect mv;
        daac_status_t st = DA_Find(*hdr->impl, mode, str, len, false, mv);
        if (st != DAAC_OK || mv.empty())
            return st;

        daac_str_t* strs = new daac_str_t[mv.size()];
        for (uint32 i = 0, e = mv.size(); i < e; i++) {
            const string& pat = pats[mv[i].pattern_id];
            strs[i].str = pat.data();
            strs[i].len = pat.size();
        }
        result->strs = strs;
        result->num = mv.size();
    } catch (const std::bad_alloc&) {
        return DAAC_ERR_NOMEM;
    }
    return DAAC_OK;
}

extern "C" daac_status_t
daac_find(const daac_t* ac, const char* str, unsigned int len,
          daac_match_vect_t* result) {
    return _find(ac, DA_FIND, str, len, result);
}

extern "C" daac_status_t
daac_find_as_strings(const daac_t* ac, const char* str, unsigned int len,
                     daac_str_vect_t* result) {
    return _find_strings(ac, DA_FIND, str, len, result);
}

extern "C" daac_status_t
daac_find_overlapping(const daac_t* ac, const char* str, unsigned int len,
                      daac_match_vect_t* result) {
    return _find(ac, DA_FIND_OVERLAPPING, str, len, result);
}

extern "C" daac_status_t
daac_find_overlapping_as_strings(const daac_t* ac, const char* str,
                                 unsigned int len, daac_str_vect_t* result) {
    return _find_strings(ac, DA_FIND_OVERLAPPING, str, len, result);
}

extern "C" daac_status_t
daac_find_overlapping_no_suffix(const daac_t* ac, const char* str,
                                unsigned int len, daac_match_vect_t* result) {
    return _find(ac, DA_FIND_OVERLAPPING_NO_SUFFIX, str, len, result);
}

extern "C" daac_status_t
daac_find_overlapping_no_suffix_as_strings(const daac_t* ac, const char* str,
                                           unsigned int len,
                                           daac_str_vect_t* result) {
    return _find_strings(ac, DA_FIND_OVERLAPPING_NO_SUFFIX, str, len, result);
}

extern "C" const char*
daac_strerror(daac_status_t st) {
    switch (st) {
    case DAAC_OK:                   return "success";
    case DAAC_ERR_NO_PATTERN:       return "patterns must not be empty";
    case DAAC_ERR_EMPTY_PATTERN:    return "a pattern must not be empty";
    case DAAC_ERR_DUP_PATTERN:      return "duplicate pattern";
    case DAAC_ERR_INVALID_UTF8:     return "a pattern is not valid UTF-8";
    case DAAC_ERR_TOO_MANY_STATES:  return "too many states";
    case DAAC_ERR_BAD_MATCH_KIND:   return "unknown match_kind";
    case DAAC_ERR_NOT_STANDARD:     return "match_kind must be STANDARD";
    case DAAC_ERR_INVALID_ARG:      return "invalid argument";
    case DAAC_ERR_NOMEM:            return "out of memory";
    }
    return "unknown error";
}

extern "C" daac_error_kind_t
daac_error_kind(daac_status_t st) {
    switch (st) {
    case DAAC_OK:
        return DAAC_NO_ERROR;

    case DAAC_ERR_NO_PATTERN:
    case DAAC_ERR_EMPTY_PATTERN:
    case DAAC_ERR_DUP_PATTERN:
    case DAAC_ERR_INVALID_UTF8:
    case DAAC_ERR_TOO_MANY_STATES:
    case DAAC_ERR_BAD_MATCH_KIND:
        return DAAC_CONSTRUCTION_ERROR;

    case DAAC_ERR_NOT_STANDARD:
        return DAAC_INVALID_CONFIGURATION;

    case DAAC_ERR_INVALID_ARG:
        return DAAC_INVALID_ARGUMENT;

    case DAAC_ERR_NOMEM:
        return DAAC_RESOURCE_ERROR;
    }
    return DAAC_INVALID_ARGUMENT;
}

extern "C" void
daac_free_matches(daac_match_vect_t* r) {
    if (!r)
        return;
    delete[] r->matches;
    r->matches = 0;
    r->num = 0;
}

extern "C" void
daac_free_strings(daac_str_vect_t* r) {
    if (!r)
        return;
    delete[] r->strs;
    r->strs = 0;
    r->num = 0;
}

extern "C" void
daac_free(daac_t* ac) {
    if (!ac)
        return;
    ASSERT(ac->magic_num == DAAC_MAGIC_NUM);
    DAAC_Header* hdr = (DAAC_Header*)(void*)ac;

    delete hdr->impl;
    delete hdr->patterns;
    delete hdr;
}
