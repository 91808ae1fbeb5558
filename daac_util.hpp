#ifndef DAAC_UTIL_H
#define DAAC_UTIL_H

#ifdef DEBUG
#include <stdio.h>   // for fprintf
#include <stdlib.h>  // for abort
#endif

typedef unsigned int uint32;
typedef unsigned long uint64;

// Unicode scalar value. Patterns and haystacks are UTF-8 on the outside.
typedef uint32 InputTy;

// Dense symbol assigned to an InputTy by DA_Code_Mapper. Code 0 is reserved
// for input which appears in no pattern.
typedef uint32 CodeTy;

typedef uint32 StateID;

#define DAAC_ROOT_STATE 0
#define DAAC_NIL        0xffffffffu
#define DAAC_MAX_STATE  0x7fffffffu

// What Utf8_Decode() yields for a byte that does not start a valid sequence.
#define DAAC_INVALID_INPUT 0xffffffffu

#ifdef DEBUG
    // Usage examples: ASSERT(a > b),  ASSERT(foo() && "Opps, foo() reutrn 0");
    #define ASSERT(c) if (!(c))\
        { fprintf(stderr, "%s:%d Assert: %s\n", __FILE__, __LINE__, #c); abort(); }
#else
    #define ASSERT(c) ((void)0)
#endif

#define likely(x)   __builtin_expect((x),1)
#define unlikely(x) __builtin_expect((x),0)

#endif //DAAC_UTIL_H
