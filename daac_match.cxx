#include "daac_match.hpp"
#include "daac_utf8.hpp"

using namespace std;

StateID
DA_Cursor::Step(StateID s) {
    InputTy c;
    _pos += Utf8_Decode(_str + _pos, _len - _pos, &c);
    CodeTy code = c == DAAC_INVALID_INPUT ? 0 : _da.Get_Code(c);
    return _da.Transition(s, code);
}

bool
DA_Find_Iter::Next(DA_Match& m) {
    StateID s = DAAC_ROOT_STATE;
    while (_pos < _len) {
        s = Step(s);
        uint32 p = _da.Output_Head(s);
        if (p != DAAC_NIL) {
            m = Make_Match(p);
            return true;
        }
    }
    return false;
}

bool
DA_Leftmost_Iter::Next(DA_Match& m) {
    StateID s = DAAC_ROOT_STATE;
    DA_Match best;
    bool found = false;

    while (_pos < _len) {
        s = Step(s);

        // Anything reported from now on starts after the candidate.
        if (found && _pos - _da.Get_Depth(s) > best.begin)
            break;

        for (uint32 p = _da.Output_Head(s); p != DAAC_NIL;
                p = _da.Get_Output(p).next) {
            DA_Match t = Make_Match(p);
            if (!found || t.begin < best.begin) {
                best = t;
                found = true;
            } else if (t.begin == best.begin) {
                if (_longest ? t.end > best.end : p < best.pattern_id)
                    best = t;
            }
        }
    }

    if (!found) {
        _pos = _len;
        return false;
    }

    // Resume right after the match; whatever was scanned past it is
    // scanned again from the root.
    _pos = best.end;
    m = best;
    return true;
}

bool
DA_Overlap_Iter::Next(DA_Match& m) {
    if (_pending != DAAC_NIL) {
        m = Make_Match(_pending);
        _pending = _da.Get_Output(_pending).next;
        return true;
    }

    while (_pos < _len) {
        _state = Step(_state);
        uint32 p = _da.Output_Head(_state);
        if (p != DAAC_NIL) {
            m = Make_Match(p);
            _pending = _da.Get_Output(p).next;
            return true;
        }
    }
    return false;
}

// One match per report: the longest pattern ending here, whether it ends
// at the state itself or is reached through the output links.
bool
DA_Overlap_NoSuffix_Iter::Next(DA_Match& m) {
    while (_pos < _len) {
        _state = Step(_state);
        uint32 p = _da.Output_Head(_state);
        if (p != DAAC_NIL) {
            m = Make_Match(p);
            return true;
        }
    }
    return false;
}

template<class Iter>
static void
collect(Iter& it, DA_Match_Vect& result) {
    DA_Match m;
    while (it.Next(m))
        result.push_back(m);
}

daac_status_t
DA_Find(const DA_Automaton& da, DA_Find_Mode mode, const char* str,
        uint32 len, bool to_chars, DA_Match_Vect& result) {
    result.clear();

    if (mode != DA_FIND && da.Get_Match_Kind() != DAAC_MATCH_STANDARD)
        return DAAC_ERR_NOT_STANDARD;

    switch (mode) {
    case DA_FIND:
        switch (da.Get_Match_Kind()) {
        case DAAC_MATCH_STANDARD: {
            DA_Find_Iter it(da, str, len);
            collect(it, result);
            break;
        }
        case DAAC_MATCH_LEFTMOST_LONGEST:
        case DAAC_MATCH_LEFTMOST_FIRST: {
            bool longest = da.Get_Match_Kind() == DAAC_MATCH_LEFTMOST_LONGEST;
            DA_Leftmost_Iter it(da, str, len, longest);
            collect(it, result);
            break;
        }
        }
        break;

    case DA_FIND_OVERLAPPING: {
        DA_Overlap_Iter it(da, str, len);
        collect(it, result);
        break;
    }

    case DA_FIND_OVERLAPPING_NO_SUFFIX: {
        DA_Overlap_NoSuffix_Iter it(da, str, len);
        collect(it, result);
        break;
    }
    }

    if (to_chars && !result.empty()) {
        DA_Pos_Map pos_map(str, len);
        for (DA_Match_Vect::iterator i = result.begin(), e = result.end();
                i != e; i++) {
            i->begin = pos_map.Translate(i->begin);
            i->end = pos_map.Translate(i->end);
        }
    }

    return DAAC_OK;
}
