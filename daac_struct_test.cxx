// Tests of the building blocks: UTF-8 decoding, position map, the trie and
// its failure links, and the double-array layout.
//
#include <stdio.h>
#include <string.h>
#include <time.h>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include "daac_utf8.hpp"
#include "daac_slow.hpp"
#include "daac_fast.hpp"
#include "daac_match.hpp"

using namespace std;

static int total = 0;
static int fail = 0;

#define CHECK(c) check((c), #c, __LINE__)

static void
check(bool succ, const char* what, int line) {
    total++;
    if (!succ) {
        fail++;
        fprintf(stdout, "  line %d: %s : Fail\n", line, what);
    }
}

// Build both the trie and the double array from NUL-terminated patterns.
static bool
build(const char** strv, unsigned int num, int kind, ACS_Constructor& acs,
      DA_Automaton& da) {
    if (acs.Construct(strv, 0, 0, num) != DAAC_OK)
        return false;
    DA_Converter cvt(acs, (DA_Match_Kind)kind);
    return cvt.Convert(da) == DAAC_OK;
}

static void
utf8_test(void) {
    fprintf(stdout, ">Testing UTF-8 decoding\n");
    InputTy c;

    CHECK(Utf8_Decode((const unsigned char*)"a", 1, &c) == 1 && c == 'a');
    CHECK(Utf8_Decode((const unsigned char*)"\xc3\xa9", 2, &c) == 2 &&
          c == 0xe9);
    CHECK(Utf8_Decode((const unsigned char*)"\xe3\x83\x86", 3, &c) == 3 &&
          c == 0x30c6);
    CHECK(Utf8_Decode((const unsigned char*)"\xf0\x9d\x84\x9e", 4, &c) == 4 &&
          c == 0x1d11e);

    // overlong, surrogate, beyond U+10FFFF, truncated, stray continuation
    const char* bad[] = {"\xc0\xaf", "\xe0\x80\xaf", "\xed\xa0\x80",
                         "\xf4\x90\x80\x80", "\xe3\x83", "\x80", "\xf8"};
    for (unsigned int i = 0; i < sizeof(bad)/sizeof(bad[0]); i++) {
        uint32 n = Utf8_Decode((const unsigned char*)bad[i], strlen(bad[i]), &c);
        CHECK(n == 1 && c == DAAC_INVALID_INPUT);
        CHECK(!Utf8_Validate(bad[i], strlen(bad[i])));
    }

    CHECK(Utf8_Validate("a\xc3\xa9\xe3\x83\x86", 6));
    CHECK(Utf8_Validate("", 0));
}

static void
pos_map_test(void) {
    fprintf(stdout, ">Testing position map\n");

    // a, e-acute, katakana te, G clef, b
    const char* s = "a\xc3\xa9\xe3\x83\x86\xf0\x9d\x84\x9e" "b";
    DA_Pos_Map pm(s, strlen(s));
    CHECK(pm.Translate(0) == 0);
    CHECK(pm.Translate(1) == 1);
    CHECK(pm.Translate(3) == 2);
    CHECK(pm.Translate(6) == 3);
    CHECK(pm.Translate(10) == 4);
    CHECK(pm.Translate(11) == 5);
    CHECK(pm.Get_Char_Num() == 5);

    DA_Pos_Map empty("", 0);
    CHECK(empty.Translate(0) == 0 && empty.Get_Char_Num() == 0);

    // An invalid byte is one character.
    DA_Pos_Map inv("\xff\xc3\xa9", 3);
    CHECK(inv.Translate(1) == 1 && inv.Get_Char_Num() == 2);
}

static void
code_mapper_test(void) {
    fprintf(stdout, ">Testing code mapper\n");

    // 'a' labels three edges, the others one each.
    const char* dict[] = {"ba", "ca", "da"};
    ACS_Constructor acs;
    DA_Automaton da;
    CHECK(build(dict, 3, DAAC_MATCH_STANDARD, acs, da));

    const DA_Code_Mapper& m = da.Get_Code_Mapper();
    CHECK(m.Get_Alphabet_Size() == 4);
    CHECK(m.Get('a') == 1);
    CHECK(m.Get('b') == 2);
    CHECK(m.Get('c') == 3);
    CHECK(m.Get('d') == 4);
    CHECK(m.Get('z') == 0);
    CHECK(m.Get(0x10ffff) == 0);
}

static void
trie_test(void) {
    fprintf(stdout, ">Testing trie and failure links\n");

    const char* dict[] = {"he", "she", "his", "hers"};
    ACS_Constructor acs;
    CHECK(acs.Construct(dict, 0, 0, 4) == DAAC_OK);
    CHECK(acs.Get_Pattern_Num() == 4);
    // root, h, he, her, hers, hi, his, s, sh, she
    CHECK(acs.Get_State_Num() == 10);

    const ACS_State* r = acs.Get_Root_State();
    CHECK(r->Get_FailLink() == r);

    const ACS_State* h = r->Get_Goto('h');
    const ACS_State* he = h->Get_Goto('e');
    const ACS_State* sh = r->Get_Goto('s')->Get_Goto('h');
    const ACS_State* she = sh->Get_Goto('e');
    CHECK(sh->Get_FailLink() == h);
    CHECK(she->Get_FailLink() == he);
    CHECK(she->is_Terminal() && she->Get_Pattern_ID() == 1);
    CHECK(she->Get_OutputLink() == he);
    CHECK(he->Get_OutputLink() == 0);
    CHECK(he->Get_Depth() == 2 && he->Get_Byte_Depth() == 2);

    CHECK(acs.Transition(she, 'r') == he->Get_Goto('r'));
    CHECK(acs.Transition(she, 'x') == r);
    CHECK(acs.Transition(r, 'x') == r);

    const char* multi[] = {"\xe3\x83\x86\xe3\x82\xb9"};
    ACS_Constructor acs2;
    CHECK(acs2.Construct(multi, 0, 0, 1) == DAAC_OK);
    const ACS_State* te = acs2.Get_Root_State()->Get_Goto(0x30c6);
    CHECK(te && te->Get_Depth() == 1 && te->Get_Byte_Depth() == 3);

    const char* dup[] = {"ab", "ab"};
    const char* empty[] = {""};
    const char* bad[] = {"\xed\xa0\x80"};
    ACS_Constructor e1, e2, e3, e4;
    CHECK(e1.Construct(dup, 0, 0, 2) == DAAC_ERR_DUP_PATTERN);
    CHECK(e2.Construct(empty, 0, 0, 1) == DAAC_ERR_EMPTY_PATTERN);
    CHECK(e3.Construct(bad, 0, 0, 1) == DAAC_ERR_INVALID_UTF8);
    CHECK(e4.Construct(dup, 0, 0, 0) == DAAC_ERR_NO_PATTERN);

    unsigned int values[] = {7, 8, 9, 10};
    ACS_Constructor acs3;
    CHECK(acs3.Construct(dict, 0, values, 4) == DAAC_OK);
    CHECK(acs3.Get_Pattern_Value(2) == 9 && acs3.Get_Pattern_Len(3) == 4);

#ifdef DEBUG
    acs.dump_text();
    acs.dump_dot();
#endif
}

// Pair every trie state with its double-array state, then compare the two
// machines on every state and every symbol.
static bool
cross_check(const char** dict, unsigned int num) {
    ACS_Constructor acs;
    DA_Automaton da;
    if (!build(dict, num, DAAC_MATCH_STANDARD, acs, da))
        return false;

    map<const ACS_State*, StateID> id;
    deque<const ACS_State*> wl;
    id[acs.Get_Root_State()] = DAAC_ROOT_STATE;
    wl.push_back(acs.Get_Root_State());

    while (!wl.empty()) {
        const ACS_State* s = wl.front();
        wl.pop_front();
        const ACS_Goto_Map& m = s->Get_Goto_Map();
        for (ACS_Goto_Map::const_iterator i = m.begin(), e = m.end();
                i != e; i++) {
            StateID t = da.Goto(id[s], da.Get_Code(i->first));
            if (t == DAAC_NIL)
                return false;
            id[i->second] = t;
            wl.push_back(i->second);
        }
    }

    if (id.size() != acs.Get_State_Num() || da.Get_State_Num() != id.size())
        return false;

    // All the labels, plus one no pattern uses.
    vector<InputTy> inputs;
    inputs.push_back(0x2603);
    for (map<const ACS_State*, StateID>::iterator i = id.begin(), e = id.end();
            i != e; i++) {
        const ACS_Goto_Map& m = i->first->Get_Goto_Map();
        for (ACS_Goto_Map::const_iterator ii = m.begin(), ee = m.end();
                ii != ee; ii++)
            inputs.push_back(ii->first);
    }

    vector<uint32> ids;
    for (map<const ACS_State*, StateID>::iterator i = id.begin(), e = id.end();
            i != e; i++) {
        const ACS_State* s = i->first;
        StateID ds = i->second;

        if (da.Get_Fail(ds) != id[s->Get_FailLink()] ||
            da.Get_Depth(ds) != s->Get_Byte_Depth())
            return false;

        for (vector<InputTy>::iterator c = inputs.begin(), ce = inputs.end();
                c != ce; c++) {
            StateID expect = id[acs.Transition(s, *c)];
            if (da.Transition(ds, da.Get_Code(*c)) != expect)
                return false;
            if (s->Get_GotoNum() == 0 && da.Goto(ds, da.Get_Code(*c)) != DAAC_NIL)
                return false;
        }

        // Own pattern first, then the output links.
        vector<uint32> expect;
        for (const ACS_State* o = s->is_Terminal() ? s : s->Get_OutputLink();
                o; o = o->Get_OutputLink())
            expect.push_back(o->Get_Pattern_ID());
        da.Get_Outputs(ds, true, ids);
        if (ids != expect)
            return false;

        da.Get_Outputs(ds, false, ids);
        if (s->is_Terminal() ?
                ids.size() != 1 || ids[0] != s->Get_Pattern_ID() :
                !ids.empty())
            return false;
    }
    return true;
}

static void
layout_test(void) {
    fprintf(stdout, ">Testing double-array layout\n");

    const char* d1[] = {"he", "she", "his", "hers"};
    CHECK(cross_check(d1, 4));

    const char* d2[] = {"t", "hi", "h", "this", "\xe3\x83\x86\xe3\x82\xb9",
                        "\xe3\x83\x86\xe3\x82\xb9\xe3\x83\x88", "is a"};
    CHECK(cross_check(d2, 7));

    // Many rows sharing few symbols.
    vector<string> words;
    for (int i = 0; i < 500; i++) {
        string w;
        for (int n = i * 7919 + 13; n > 0; n /= 5)
            w += "abcde"[n % 5];
        words.push_back(w);
    }
    vector<const char*> strv;
    map<string, bool> seen;
    for (unsigned int i = 0; i < words.size(); i++) {
        if (!seen[words[i]]) {
            seen[words[i]] = true;
            strv.push_back(words[i].c_str());
        }
    }
    CHECK(cross_check(&strv[0], strv.size()));

    // Wide alphabet: every root edge has its own symbol.
    vector<string> wide;
    for (InputTy c = 0x4e00; c < 0x4e00 + 300; c++) {
        string w;
        w += (char)(0xe0 | (c >> 12));
        w += (char)(0x80 | ((c >> 6) & 0x3f));
        w += (char)(0x80 | (c & 0x3f));
        w += "x";
        wide.push_back(w);
    }
    strv.clear();
    for (unsigned int i = 0; i < wide.size(); i++)
        strv.push_back(wide[i].c_str());
    CHECK(cross_check(&strv[0], strv.size()));

    ACS_Constructor acs;
    DA_Automaton da;
    CHECK(build(d1, 4, DAAC_MATCH_STANDARD, acs, da));
    CHECK(da.Get_Pattern_Num() == 4);
    CHECK(da.Get_Slot_Num() >= da.Get_State_Num());
    CHECK(da.Transition(DAAC_ROOT_STATE, 0) == DAAC_ROOT_STATE);
    CHECK(da.Get_Fail(DAAC_ROOT_STATE) == DAAC_ROOT_STATE);
    CHECK(da.Get_Output(1).len == 3 && da.Get_Output(1).value == 1);

#ifdef DEBUG
    da.dump_text();
#endif
}

// Encode a codepoint below U+10000.
static void
append_utf8(string& s, InputTy c) {
    if (c < 0x80) {
        s += (char)c;
    } else if (c < 0x800) {
        s += (char)(0xc0 | (c >> 6));
        s += (char)(0x80 | (c & 0x3f));
    } else {
        s += (char)(0xe0 | (c >> 12));
        s += (char)(0x80 | ((c >> 6) & 0x3f));
        s += (char)(0x80 | (c & 0x3f));
    }
}

// A large dictionary over a wide, skewed alphabet. Each free slot may only
// be probed a bounded number of times, so the number of Fit() calls stays
// linear in the size of the arrays.
static void
large_dict_test(void) {
    fprintf(stdout, ">Testing large dictionary\n");

    unsigned int seed = 1234567;
    vector<string> words;
    map<string, bool> seen;
    while (words.size() < 40000) {
        string w;
        seed = seed * 1103515245 + 12345;
        int len = 2 + (seed >> 16) % 5;
        for (int i = 0; i < len; i++) {
            seed = seed * 1103515245 + 12345;
            uint32 r1 = (seed >> 16) % 2000;
            seed = seed * 1103515245 + 12345;
            uint32 r2 = (seed >> 16) % 2000;
            append_utf8(w, 0x4e00 + r1 * r2 / 2000);
        }
        if (!seen[w]) {
            seen[w] = true;
            words.push_back(w);
        }
    }

    vector<const char*> strv;
    for (unsigned int i = 0; i < words.size(); i++)
        strv.push_back(words[i].c_str());

    ACS_Constructor acs;
    CHECK(acs.Construct(&strv[0], 0, 0, strv.size()) == DAAC_OK);

    clock_t t0 = clock();
    DA_Automaton da;
    DA_Converter cvt(acs, DAAC_MATCH_STANDARD);
    CHECK(cvt.Convert(da) == DAAC_OK);
    clock_t t1 = clock();
    fprintf(stdout, "  %u states in %u slots, %lu Fit() calls, %.3f s\n",
            da.Get_State_Num(), da.Get_Slot_Num(), cvt.Get_Fit_Num(),
            (double)(t1 - t0) / CLOCKS_PER_SEC);

    // The arrays were at most twice the trimmed size, plus the alphabet
    // reserved up front; every row but the successful probe is a failure.
    uint64 slots = 2 * (uint64)da.Get_Slot_Num() +
                   da.Get_Code_Mapper().Get_Alphabet_Size() + 1;
    CHECK(cvt.Get_Fit_Num() <= DA_MAX_PROBE * slots + da.Get_State_Num());
    CHECK(da.Get_Slot_Num() >= da.Get_State_Num());

    // Every pattern is still found where it is.
    DA_Match_Vect mv;
    bool all_found = true;
    for (unsigned int i = 0; i < words.size(); i += 97) {
        const string& w = words[i];
        if (DA_Find(da, DA_FIND_OVERLAPPING, w.data(), w.size(), false,
                    mv) != DAAC_OK) {
            all_found = false;
            continue;
        }
        bool found = false;
        for (unsigned int j = 0; j < mv.size(); j++) {
            if (mv[j].begin == 0 && mv[j].end == w.size() &&
                mv[j].pattern_id == i)
                found = true;
        }
        all_found = all_found && found;
    }
    CHECK(all_found);
}

static void
find_test(void) {
    fprintf(stdout, ">Testing DA_Find\n");

    const char* dict[] = {"\xe3\x83\x86", "ab"};
    ACS_Constructor acs;
    DA_Automaton da;
    CHECK(build(dict, 2, DAAC_MATCH_STANDARD, acs, da));

    const char* s = "a\xe3\x83\x86" "ab";
    DA_Match_Vect mv;
    CHECK(DA_Find(da, DA_FIND, s, strlen(s), false, mv) == DAAC_OK);
    CHECK(mv.size() == 2 && mv[0].begin == 1 && mv[0].end == 4 &&
          mv[0].pattern_id == 0 && mv[1].begin == 4 && mv[1].end == 6);

    CHECK(DA_Find(da, DA_FIND, s, strlen(s), true, mv) == DAAC_OK);
    CHECK(mv.size() == 2 && mv[0].begin == 1 && mv[0].end == 2 &&
          mv[1].begin == 2 && mv[1].end == 4);

    ACS_Constructor acs2;
    DA_Automaton da2;
    CHECK(build(dict, 2, DAAC_MATCH_LEFTMOST_FIRST, acs2, da2));
    CHECK(da2.Get_Match_Kind() == DAAC_MATCH_LEFTMOST_FIRST);
    CHECK(DA_Find(da2, DA_FIND_OVERLAPPING, s, strlen(s), true, mv) ==
          DAAC_ERR_NOT_STANDARD && mv.empty());
    CHECK(DA_Find(da2, DA_FIND_OVERLAPPING_NO_SUFFIX, s, strlen(s), true,
                  mv) == DAAC_ERR_NOT_STANDARD && mv.empty());
    CHECK(DA_Find(da2, DA_FIND, s, strlen(s), true, mv) == DAAC_OK &&
          mv.size() == 2);

    // The iterators can be driven one match at a time.
    DA_Overlap_Iter it(da, s, strlen(s));
    DA_Match m;
    int n = 0;
    while (it.Next(m))
        n++;
    CHECK(n == 2 && !it.Next(m));
}

int
main (int argc, char** argv) {
    utf8_test();
    pos_map_test();
    code_mapper_test();
    trie_test();
    layout_test();
    large_dict_test();
    find_test();

    fprintf(stdout, "Total : %d, Fail %d\n", total, fail);
    return fail ? -1 : 0;
}
