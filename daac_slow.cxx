#include <stdio.h>
#include <deque>
#include "daac_slow.hpp"
#include "daac_utf8.hpp"

using namespace std;

ACS_Constructor::ACS_Constructor() : _root(0), _next_node_id(1) {
}

ACS_Constructor::~ACS_Constructor() {
    for (vector<ACS_State* >::iterator i =  _all_states.begin(),
            e = _all_states.end(); i != e; i++) {
        delete *i;
    }
    _all_states.clear();
}

ACS_State*
ACS_Constructor::new_state() {
    ACS_State* t = new ACS_State(_next_node_id++);
    _all_states.push_back(t);
    return t;
}

daac_status_t
ACS_Constructor::Add_String(const char* str, unsigned int str_len) {
    if (str_len == 0)
        return DAAC_ERR_EMPTY_PATTERN;

    if (!Utf8_Validate(str, str_len))
        return DAAC_ERR_INVALID_UTF8;

    const unsigned char* s = (const unsigned char*)str;
    ACS_State* state = _root;
    for (uint32 i = 0; i < str_len; ) {
        InputTy c;
        uint32 n = Utf8_Decode(s + i, str_len - i, &c);
        i += n;

        ACS_State* new_s = state->Get_Goto(c);
        if (!new_s) {
            new_s = new_state();
            new_s->_depth = state->_depth + 1;
            new_s->_byte_depth = state->_byte_depth + n;
            state->Set_Goto(c, new_s);
        }
        state = new_s;
    }

    if (state->is_Terminal())
        return DAAC_ERR_DUP_PATTERN;

    state->_pattern_id = _pattern_len.size();
    _pattern_len.push_back(str_len);
    return DAAC_OK;
}

void
ACS_Constructor::Propagate_faillink() {
    ACS_State* r = _root;
    deque<ACS_State*> wl;

    r->_fail_link = r;
    const ACS_Goto_Map& m = r->Get_Goto_Map();
    for (ACS_Goto_Map::const_iterator i = m.begin(), e = m.end(); i != e; i++) {
        ACS_State* s = i->second;
        s->_fail_link = r;
        wl.push_back(s);
    }

    // For any input c, make sure "goto(root, c)" is valid, which make the
    // fail-link propagation lot easier.
    while (!wl.empty()) {
        ACS_State* s = wl.front();
        wl.pop_front();

        ACS_State* fl = s->_fail_link;
        s->_output_link = fl->is_Terminal() ? fl : fl->_output_link;

        const ACS_Goto_Map& tran_map = s->Get_Goto_Map();
        for (ACS_Goto_Map::const_iterator ii = tran_map.begin(),
                ee = tran_map.end(); ii != ee; ii++) {
            InputTy c = ii->first;
            ACS_State *kid = ii->second;

            ACS_State* f = fl;
            ACS_State* t;
            while (!(t = f->Get_Goto(c)) && f != r)
                f = f->_fail_link;

            kid->_fail_link = t ? t : r;
            wl.push_back(kid);
        }
    }
}

daac_status_t
ACS_Constructor::Construct(const char** strv, const unsigned int* strlenv,
                           const unsigned int* values, unsigned int strnum) {
    if (strnum == 0)
        return DAAC_ERR_NO_PATTERN;

    _root = new_state();

    _pattern_len.reserve(strnum);
    for (unsigned int i = 0; i < strnum; i++) {
        unsigned int len = strlenv ? strlenv[i] : strlen(strv[i]);
        daac_status_t st = Add_String(strv[i], len);
        if (st != DAAC_OK)
            return st;
    }

    _values.resize(strnum);
    for (unsigned int i = 0; i < strnum; i++)
        _values[i] = values ? values[i] : i;

    Propagate_faillink();
    return DAAC_OK;
}

const ACS_State*
ACS_Constructor::Transition(const ACS_State* s, InputTy c) const {
    while (true) {
        if (const ACS_State* t = s->Get_Goto(c))
            return t;
        if (s == _root)
            return s;
        s = s->Get_FailLink();
    }
}

#ifdef DEBUG
void
ACS_Constructor::dump_text(const char* txtfile) const {
    FILE* f = fopen(txtfile, "w+");
    if (!f) {
        perror("fopen");
        return;
    }

    for (vector<ACS_State*>::const_iterator i = _all_states.begin(),
            e = _all_states.end(); i != e; i++) {
        ACS_State* s = *i;

        fprintf(f, "S%d depth:%d bytes:%d", s->Get_ID(), s->Get_Depth(),
                s->Get_Byte_Depth());
        if (s->is_Terminal())
            fprintf(f, " pattern:%d", s->Get_Pattern_ID());
        fprintf(f, " fail:S%d", s->Get_FailLink() ? s->Get_FailLink()->Get_ID() : 0);
        if (s->Get_OutputLink())
            fprintf(f, " output:S%d", s->Get_OutputLink()->Get_ID());
        fprintf(f, "\n");

        const ACS_Goto_Map& m = s->Get_Goto_Map();
        for (ACS_Goto_Map::const_iterator ii = m.begin(), ee = m.end();
                ii != ee; ii++) {
            fprintf(f, "  U+%04X -> S%d\n", ii->first, ii->second->Get_ID());
        }
    }
    fclose(f);
}

void
ACS_Constructor::dump_dot(const char* dotfile) const {
    FILE* f = fopen(dotfile, "w+");
    if (!f) {
        perror("fopen");
        return;
    }

    fprintf(f, "digraph G {\n");
    fprintf(f, "  S%d [shape=doublecircle];\n", _root->Get_ID());

    for (vector<ACS_State*>::const_iterator i = _all_states.begin(),
            e = _all_states.end(); i != e; i++) {
        ACS_State* s = *i;
        if (s->is_Terminal()) {
            fprintf(f, "  S%d [shape=box, label=\"S%d/P%d\"];\n",
                    s->Get_ID(), s->Get_ID(), s->Get_Pattern_ID());
        }

        const ACS_Goto_Map& m = s->Get_Goto_Map();
        for (ACS_Goto_Map::const_iterator ii = m.begin(), ee = m.end();
                ii != ee; ii++) {
            fprintf(f, "  S%d -> S%d [label=\"U+%04X\"];\n",
                    s->Get_ID(), ii->second->Get_ID(), ii->first);
        }

        ACS_State* fl = s->Get_FailLink();
        if (fl && fl != _root) {
            fprintf(f, "  S%d -> S%d [style=dotted, color=red];\n",
                    s->Get_ID(), fl->Get_ID());
        }
    }
    fprintf(f, "}\n");
    fclose(f);
}
#endif
