#ifndef DAAC_MATCH_H
#define DAAC_MATCH_H

#include <vector>
#include "daac_fast.hpp"

// Offsets are in bytes while iterating; DA_Find() translates them to
// codepoints unless asked not to.
class DA_Match {
public:
    uint32 begin;
    uint32 end;
    uint32 pattern_id;

    DA_Match(): begin(0), end(0), pattern_id(DAAC_NIL) {}
    DA_Match(uint32 b, uint32 e, uint32 p): begin(b), end(e), pattern_id(p) {}
};

typedef std::vector<DA_Match> DA_Match_Vect;

// Base of all the iterators: walks the haystack one codepoint at a time.
class DA_Cursor {
public:
    DA_Cursor(const DA_Automaton& da, const char* str, uint32 len):
        _da(da), _str((const unsigned char*)str), _len(len), _pos(0) {}

protected:
    // Consume one codepoint and return the next state.
    StateID Step(StateID s);

    DA_Match Make_Match(uint32 pattern_id) const {
        return DA_Match(_pos - _da.Get_Output(pattern_id).len, _pos, pattern_id);
    }

protected:
    const DA_Automaton& _da;
    const unsigned char* _str;
    uint32 _len;
    uint32 _pos;
};

// Standard non-overlapping matches: report the longest pattern ending at the
// first position where any pattern ends, then restart at its end.
class DA_Find_Iter : public DA_Cursor {
public:
    DA_Find_Iter(const DA_Automaton& da, const char* str, uint32 len):
        DA_Cursor(da, str, len) {}

    bool Next(DA_Match& m);
};

// Leftmost matches: among the matches starting at the leftmost position,
// the longest one, or the one registered first.
class DA_Leftmost_Iter : public DA_Cursor {
public:
    DA_Leftmost_Iter(const DA_Automaton& da, const char* str, uint32 len,
                     bool longest):
        DA_Cursor(da, str, len), _longest(longest) {}

    bool Next(DA_Match& m);

private:
    bool _longest;
};

// Every match, including those nested in or overlapping others.
class DA_Overlap_Iter : public DA_Cursor {
public:
    DA_Overlap_Iter(const DA_Automaton& da, const char* str, uint32 len):
        DA_Cursor(da, str, len), _state(DAAC_ROOT_STATE), _pending(DAAC_NIL) {}

    bool Next(DA_Match& m);

private:
    StateID _state;
    uint32 _pending;
};

// Like DA_Overlap_Iter, but reports only the pattern ending exactly at the
// current state, not those inherited along the failure chain.
class DA_Overlap_NoSuffix_Iter : public DA_Cursor {
public:
    DA_Overlap_NoSuffix_Iter(const DA_Automaton& da, const char* str,
                             uint32 len):
        DA_Cursor(da, str, len), _state(DAAC_ROOT_STATE) {}

    bool Next(DA_Match& m);

private:
    StateID _state;
};

typedef enum {
    DA_FIND,
    DA_FIND_OVERLAPPING,
    DA_FIND_OVERLAPPING_NO_SUFFIX
} DA_Find_Mode;

// Run the iterator selected by "mode" and the automaton's match kind over
// str[0, len). If "to_chars" is true, the offsets of the result are
// translated to codepoint indices. On error "result" is left empty.
daac_status_t DA_Find(const DA_Automaton& da, DA_Find_Mode mode,
                      const char* str, uint32 len, bool to_chars,
                      DA_Match_Vect& result);

#endif //DAAC_MATCH_H
