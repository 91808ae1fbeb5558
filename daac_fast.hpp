#ifndef DAAC_FAST_H
#define DAAC_FAST_H

#include <utility>
#include <vector>
#include "daac.h"
#include "daac_util.hpp"

class ACS_Constructor;

#define DA_MAX_PROBE 16

// Maps codepoints to dense codes 1..N. The most frequent edge labels of the
// trie get the smallest codes, which keeps double-array rows short and close
// to each other. Codepoints not used by any pattern map to 0.
class DA_Code_Mapper {
public:
    DA_Code_Mapper() : _alphabet_size(0) {}

    // freq[c] is the number of trie edges labelled c.
    void Build(const std::vector<std::pair<InputTy, uint32> >& freq);

    CodeTy Get(InputTy c) const {
        return c < _table.size() ? _table[c] : 0;
    }

    uint32 Get_Alphabet_Size() const { return _alphabet_size; }

private:
    std::vector<CodeTy> _table;
    uint32 _alphabet_size;
};

typedef struct {
    uint32 value;
    uint32 len;         // in bytes
    uint32 next;        // next pattern id in the merged chain, or DAAC_NIL
} DA_Output;

typedef daac_match_kind_t DA_Match_Kind;

// The immutable double-array automaton. Every array is indexed by state;
// state 0 is the root. The goto function is
//
//   t = base[s] + code,  valid iff code != 0 && t < size && check[t] == s
//
// and Transition() falls back along fail[] when there is no such edge.
class DA_Automaton {
friend class DA_Converter;

public:
    DA_Automaton() : _match_kind(DAAC_MATCH_STANDARD), _state_num(0) {}

    StateID Goto(StateID s, CodeTy c) const {
        ASSERT(s < _base.size());
        uint32 t = _base[s] + c;
        if (likely(c != 0) && t < _check.size() && _check[t] == s)
            return t;
        return DAAC_NIL;
    }

    // Total; returns the root if nothing is left to match.
    StateID Transition(StateID s, CodeTy c) const {
        while (true) {
            StateID t = Goto(s, c);
            if (t != DAAC_NIL)
                return t;
            if (s == DAAC_ROOT_STATE)
                return s;
            s = _fail[s];
        }
    }

    CodeTy Get_Code(InputTy c) const { return _mapper.Get(c); }
    const DA_Code_Mapper& Get_Code_Mapper() const { return _mapper; }

    StateID Get_Fail(StateID s) const { return _fail[s]; }

    // Length in bytes of the path from the root to s.
    uint32 Get_Depth(StateID s) const { return _depth[s]; }

    // First pattern of the merged output chain, longest first.
    uint32 Output_Head(StateID s) const { return _output[s]; }

    // The pattern ending exactly at s, ignoring suffixes.
    uint32 Direct_Output(StateID s) const {
        return _term[s] ? _output[s] : DAAC_NIL;
    }

    const DA_Output& Get_Output(uint32 pattern_id) const {
        ASSERT(pattern_id < _outputs.size());
        return _outputs[pattern_id];
    }

    // Collect the output pattern ids of s in report order.
    void Get_Outputs(StateID s, bool merged, std::vector<uint32>& ids) const;

    uint32 Get_Pattern_Num() const { return _outputs.size(); }
    DA_Match_Kind Get_Match_Kind() const { return _match_kind; }

    // Number of array slots, used or not.
    uint32 Get_Slot_Num() const { return _base.size(); }
    uint32 Get_State_Num() const { return _state_num; }

#ifdef DEBUG
    void dump_text(const char* = "daac_da.txt") const;
#endif

private:
    std::vector<uint32> _base;
    std::vector<StateID> _check;
    std::vector<StateID> _fail;
    std::vector<uint32> _output;
    std::vector<uint32> _depth;
    std::vector<bool> _term;
    std::vector<DA_Output> _outputs;
    DA_Code_Mapper _mapper;
    DA_Match_Kind _match_kind;
    uint32 _state_num;
};

// Lays the ACS_Constructor's trie out as a double array.
class DA_Converter {
public:
    DA_Converter(const ACS_Constructor& acs, DA_Match_Kind kind);

    daac_status_t Convert(DA_Automaton& da);

    // Number of Fit() calls made by the last Convert().
    uint64 Get_Fit_Num() const { return _fit_num; }

private:
    void Build_Code_Mapper(DA_Code_Mapper& mapper);
    bool Extend(uint32 size);
    void Unlink(uint32 slot);
    void Use_Slot(uint32 slot);
    bool Fit(uint32 base, const std::vector<CodeTy>& codes);
    bool Find_Base(const std::vector<CodeTy>& codes, uint32* base);

private:
    const ACS_Constructor& _acs;
    DA_Match_Kind _match_kind;
    DA_Automaton* _da;

    std::vector<bool> _used;
    uint32 _max_used;

    // Doubly linked list of unused slots, in ascending order. A slot that
    // failed DA_MAX_PROBE placements is taken off the list, it stays unused
    // unless a later row happens to land on it.
    std::vector<uint32> _next_free;
    std::vector<uint32> _prev_free;
    std::vector<unsigned char> _probe_num;
    std::vector<bool> _listed;
    uint32 _free_head;
    uint32 _free_tail;
    uint64 _fit_num;
};

#endif //DAAC_FAST_H
