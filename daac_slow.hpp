#ifndef DAAC_SLOW_H
#define DAAC_SLOW_H

#include <string.h>
#include <map>
#include <vector>
#include "daac.h"
#include "daac_util.hpp"

// Forward decl. the acronym "ACS" stands for "Aho-Corasick Slow implementation"
// i.e. the pointer-based trie which exists only while the automaton is being
// built. DA_Converter turns it into the compact double-array DA_Automaton.
class ACS_State;
class ACS_Constructor;

typedef std::map<InputTy, ACS_State*> ACS_Goto_Map;

class ACS_State {
friend class ACS_Constructor;

public:
    ACS_State(uint32 id): _id(id), _depth(0), _byte_depth(0),
        _pattern_id(DAAC_NIL), _fail_link(0), _output_link(0) {}
    ~ACS_State() {};

    void Set_Goto(InputTy c, ACS_State* s) { _goto_map[c] = s; }
    ACS_State *Get_Goto(InputTy c) const {
        ACS_Goto_Map::const_iterator iter = _goto_map.find(c);
        return iter != _goto_map.end() ? (*iter).second : 0;
    }

    ACS_State* Get_FailLink() const { return _fail_link; }

    // The nearest state on the failure chain, excluding this one, at which
    // a pattern ends; 0 if there is none.
    ACS_State* Get_OutputLink() const { return _output_link; }

    uint32 Get_GotoNum() const { return _goto_map.size(); }
    uint32 Get_ID() const { return _id; }
    uint32 Get_Depth() const { return _depth; }
    uint32 Get_Byte_Depth() const { return _byte_depth; }
    const ACS_Goto_Map& Get_Goto_Map(void) const { return _goto_map; }
    bool is_Terminal() const { return _pattern_id != DAAC_NIL; }
    uint32 Get_Pattern_ID() const { return _pattern_id; }

private:
    uint32 _id;
    uint32 _depth;
    uint32 _byte_depth;
    uint32 _pattern_id;
    ACS_Goto_Map _goto_map;
    ACS_State* _fail_link;
    ACS_State* _output_link;
};

class ACS_Constructor {
public:
    ACS_Constructor();
    ~ACS_Constructor();

    // Build the trie and its failure links. If strlenv is NULL the strings
    // are NUL-terminated; if values is NULL pattern i gets value i.
    daac_status_t Construct(const char** strv, const unsigned int* strlenv,
                            const unsigned int* values, unsigned int strnum);

#ifdef DEBUG
    void dump_text(const char* = "daac.txt") const;
    void dump_dot(const char* = "daac.dot") const;
#endif
    const ACS_State *Get_Root_State() const { return _root; }
    const std::vector<ACS_State*>& Get_All_States() const {
        return _all_states;
    }

    uint32 Get_Next_Node_Id() const { return _next_node_id; }
    uint32 Get_State_Num() const { return _next_node_id - 1; }

    uint32 Get_Pattern_Num() const { return _pattern_len.size(); }
    uint32 Get_Pattern_Len(uint32 id) const { return _pattern_len[id]; }
    uint32 Get_Pattern_Value(uint32 id) const { return _values[id]; }

    // Walk the trie the way the Aho-Corasick machine does: take the goto
    // edge if there is one, otherwise retry from the fail link. The result
    // is the root if nothing is left to match.
    const ACS_State* Transition(const ACS_State* s, InputTy c) const;

private:
    daac_status_t Add_String(const char* str, unsigned int str_len);
    ACS_State* new_state();
    void Propagate_faillink();

private:
    ACS_State* _root;
    std::vector<ACS_State*> _all_states;
    std::vector<uint32> _pattern_len;
    std::vector<uint32> _values;
    uint32 _next_node_id;
};

#endif
