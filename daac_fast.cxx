#include <stdio.h>
#include <deque>
#include <map>
#include <algorithm>
#include "daac_fast.hpp"
#include "daac_slow.hpp"

using namespace std;

typedef pair<InputTy, uint32> FreqPair;

// Most frequent first, ties broken by codepoint so that the layout only
// depends on the pattern set.
class FreqSort {
public:
    bool operator() (const FreqPair& f1, const FreqPair& f2) const {
        if (f1.second != f2.second)
            return f1.second > f2.second;
        return f1.first < f2.first;
    }
};

typedef pair<CodeTy, const ACS_State*> KidPair;

class KidSort {
public:
    bool operator() (const KidPair& k1, const KidPair& k2) const {
        return k1.first < k2.first;
    }
};

/////////////////////////////////////////////////////////////////////////
//
//          Implementation of DA_Code_Mapper
//
/////////////////////////////////////////////////////////////////////////
//
void
DA_Code_Mapper::Build(const vector<FreqPair>& freq) {
    vector<FreqPair> v(freq);
    sort(v.begin(), v.end(), FreqSort());

    InputTy max_c = 0;
    for (vector<FreqPair>::const_iterator i = v.begin(), e = v.end();
            i != e; i++) {
        max_c = max(max_c, i->first);
    }

    _table.clear();
    if (!v.empty())
        _table.resize(max_c + 1, 0);

    for (uint32 i = 0, e = v.size(); i < e; i++)
        _table[v[i].first] = i + 1;

    _alphabet_size = v.size();
}

/////////////////////////////////////////////////////////////////////////
//
//          Implementation of DA_Automaton
//
/////////////////////////////////////////////////////////////////////////
//
void
DA_Automaton::Get_Outputs(StateID s, bool merged, vector<uint32>& ids) const {
    ids.clear();
    if (!merged) {
        uint32 p = Direct_Output(s);
        if (p != DAAC_NIL)
            ids.push_back(p);
        return;
    }

    for (uint32 p = _output[s]; p != DAAC_NIL; p = _outputs[p].next)
        ids.push_back(p);
}

#ifdef DEBUG
void
DA_Automaton::dump_text(const char* txtfile) const {
    FILE* f = fopen(txtfile, "w+");
    if (!f) {
        perror("fopen");
        return;
    }

    fprintf(f, "states:%d slots:%d patterns:%d alphabet:%d\n",
            _state_num, (int)_base.size(), (int)_outputs.size(),
            _mapper.Get_Alphabet_Size());

    for (uint32 s = 0, e = _base.size(); s < e; s++) {
        if (s != DAAC_ROOT_STATE && _check[s] == DAAC_NIL)
            continue;
        fprintf(f, "[%d] base:%d check:%d fail:%d depth:%d", s, _base[s],
                (int)_check[s], _fail[s], _depth[s]);
        if (_output[s] != DAAC_NIL) {
            fprintf(f, " output:%d%s", _output[s],
                    _term[s] ? "" : " (suffix)");
        }
        fprintf(f, "\n");
    }
    fclose(f);
}
#endif

/////////////////////////////////////////////////////////////////////////
//
//          Implementation of DA_Converter
//
/////////////////////////////////////////////////////////////////////////
//
DA_Converter::DA_Converter(const ACS_Constructor& acs, DA_Match_Kind kind):
    _acs(acs), _match_kind(kind), _da(0), _max_used(0),
    _free_head(DAAC_NIL), _free_tail(DAAC_NIL), _fit_num(0) {
}

void
DA_Converter::Build_Code_Mapper(DA_Code_Mapper& mapper) {
    map<InputTy, uint32> count;

    const vector<ACS_State*>& all_states = _acs.Get_All_States();
    for (vector<ACS_State*>::const_iterator i = all_states.begin(),
            e = all_states.end(); i != e; i++) {
        const ACS_Goto_Map& m = (*i)->Get_Goto_Map();
        for (ACS_Goto_Map::const_iterator ii = m.begin(), ee = m.end();
                ii != ee; ii++) {
            count[ii->first]++;
        }
    }

    vector<FreqPair> freq(count.begin(), count.end());
    mapper.Build(freq);
}

// Grow the arrays to hold at least "size" slots, adding the new slots to
// the tail of the free list.
bool
DA_Converter::Extend(uint32 size) {
    uint32 old_sz = _da->_base.size();
    if (size <= old_sz)
        return true;

    if (size > DAAC_MAX_STATE)
        return false;

    uint32 new_sz = old_sz * 2 > size ? old_sz * 2 : size;
    if (new_sz > DAAC_MAX_STATE)
        new_sz = DAAC_MAX_STATE;

    _da->_base.resize(new_sz, 0);
    _da->_check.resize(new_sz, DAAC_NIL);
    _da->_fail.resize(new_sz, DAAC_ROOT_STATE);
    _da->_output.resize(new_sz, DAAC_NIL);
    _da->_depth.resize(new_sz, 0);
    _da->_term.resize(new_sz, false);
    _used.resize(new_sz, false);
    _next_free.resize(new_sz, DAAC_NIL);
    _prev_free.resize(new_sz, DAAC_NIL);
    _probe_num.resize(new_sz, 0);
    _listed.resize(new_sz, true);

    for (uint32 i = old_sz; i < new_sz; i++) {
        _prev_free[i] = _free_tail;
        if (_free_tail != DAAC_NIL)
            _next_free[_free_tail] = i;
        else
            _free_head = i;
        _free_tail = i;
    }
    return true;
}

void
DA_Converter::Unlink(uint32 slot) {
    ASSERT(_listed[slot]);
    _listed[slot] = false;

    uint32 prev = _prev_free[slot];
    uint32 next = _next_free[slot];
    if (prev != DAAC_NIL)
        _next_free[prev] = next;
    else
        _free_head = next;

    if (next != DAAC_NIL)
        _prev_free[next] = prev;
    else
        _free_tail = prev;

    _prev_free[slot] = _next_free[slot] = DAAC_NIL;
}

void
DA_Converter::Use_Slot(uint32 slot) {
    ASSERT(slot < _used.size() && !_used[slot]);
    _used[slot] = true;

    if (_listed[slot])
        Unlink(slot);
    if (slot > _max_used)
        _max_used = slot;
}

bool
DA_Converter::Fit(uint32 base, const vector<CodeTy>& codes) {
    _fit_num++;
    uint32 size = _used.size();
    for (vector<CodeTy>::const_iterator i = codes.begin(), e = codes.end();
            i != e; i++) {
        uint32 t = base + *i;
        if (t < size && _used[t])
            return false;
    }
    return true;
}

// Find a base such that base + c lands on an unused slot for every c in
// "codes" (sorted ascending, all > 0), and make sure the arrays are big
// enough to hold the row.
bool
DA_Converter::Find_Base(const vector<CodeTy>& codes, uint32* base) {
    ASSERT(!codes.empty() && codes[0] > 0);
    CodeTy c0 = codes.front();
    CodeTy c_max = codes.back();

    // Every failed probe counts against the slot, so the list is walked
    // at most DA_MAX_PROBE times past any slot.
    uint32 b = DAAC_NIL;
    for (uint32 p = _free_head; p != DAAC_NIL; ) {
        uint32 next = _next_free[p];
        if (p >= c0 && Fit(p - c0, codes)) {
            b = p - c0;
            break;
        }
        if (++_probe_num[p] >= DA_MAX_PROBE)
            Unlink(p);
        p = next;
    }

    if (b == DAAC_NIL) {
        // Every free slot collides, start the row past the end.
        uint32 size = _used.size();
        b = size > c0 ? size - c0 : 0;
    }

    if ((uint64)b + c_max >= DAAC_MAX_STATE)
        return false;

    if (!Extend(b + c_max + 1))
        return false;

    *base = b;
    return true;
}

daac_status_t
DA_Converter::Convert(DA_Automaton& da) {
    _da = &da;
    da = DA_Automaton();
    da._match_kind = _match_kind;
    da._state_num = _acs.Get_State_Num();

    _used.clear();
    _next_free.clear();
    _prev_free.clear();
    _probe_num.clear();
    _listed.clear();
    _free_head = _free_tail = DAAC_NIL;
    _max_used = 0;
    _fit_num = 0;

    Build_Code_Mapper(da._mapper);
    const DA_Code_Mapper& mapper = da._mapper;

    if (!Extend(mapper.Get_Alphabet_Size() + 1))
        return DAAC_ERR_TOO_MANY_STATES;

    const ACS_State* root = _acs.Get_Root_State();
    vector<StateID> id_map(_acs.Get_Next_Node_Id(), DAAC_NIL);
    id_map[root->Get_ID()] = DAAC_ROOT_STATE;
    Use_Slot(DAAC_ROOT_STATE);

    // Place the rows in BFS order, so states close to the root, which are
    // visited most often, end up close to each other.
    deque<const ACS_State*> wl;
    wl.push_back(root);

    vector<KidPair> kids;
    vector<CodeTy> codes;
    while (!wl.empty()) {
        const ACS_State* s = wl.front();
        wl.pop_front();

        const ACS_Goto_Map& m = s->Get_Goto_Map();
        if (m.empty())
            continue;

        kids.clear();
        for (ACS_Goto_Map::const_iterator i = m.begin(), e = m.end();
                i != e; i++) {
            kids.push_back(KidPair(mapper.Get(i->first), i->second));
        }
        sort(kids.begin(), kids.end(), KidSort());

        codes.clear();
        for (vector<KidPair>::iterator i = kids.begin(), e = kids.end();
                i != e; i++) {
            codes.push_back(i->first);
        }

        uint32 base;
        if (!Find_Base(codes, &base))
            return DAAC_ERR_TOO_MANY_STATES;

        StateID sid = id_map[s->Get_ID()];
        da._base[sid] = base;
        for (vector<KidPair>::iterator i = kids.begin(), e = kids.end();
                i != e; i++) {
            StateID t = base + i->first;
            Use_Slot(t);
            da._check[t] = sid;
            id_map[i->second->Get_ID()] = t;
            wl.push_back(i->second);
        }
    }

    // Drop the unused tail.
    uint32 sz = _max_used + 1;
    da._base.resize(sz);
    da._check.resize(sz);
    da._fail.resize(sz);
    da._output.resize(sz);
    da._depth.resize(sz);
    da._term.resize(sz);

    // Failure links, outputs and depths.
    da._outputs.resize(_acs.Get_Pattern_Num());
    const vector<ACS_State*>& all_states = _acs.Get_All_States();
    for (vector<ACS_State*>::const_iterator i = all_states.begin(),
            e = all_states.end(); i != e; i++) {
        const ACS_State* s = *i;
        StateID sid = id_map[s->Get_ID()];
        ASSERT(sid != DAAC_NIL);

        da._fail[sid] = id_map[s->Get_FailLink()->Get_ID()];
        da._depth[sid] = s->Get_Byte_Depth();

        const ACS_State* ol = s->Get_OutputLink();
        uint32 suffix = ol ? ol->Get_Pattern_ID() : DAAC_NIL;

        if (s->is_Terminal()) {
            uint32 p = s->Get_Pattern_ID();
            DA_Output& o = da._outputs[p];
            o.value = _acs.Get_Pattern_Value(p);
            o.len = _acs.Get_Pattern_Len(p);
            o.next = suffix;

            da._output[sid] = p;
            da._term[sid] = true;
        } else {
            da._output[sid] = suffix;
        }
    }

    _da = 0;
    return DAAC_OK;
}
