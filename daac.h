#ifndef DAAC_H
#define DAAC_H
#ifdef __cplusplus
extern "C" {
#endif

#define DAAC_EXPORT __attribute__ ((visibility ("default")))

#define DAAC_MAGIC_NUM 0x5b

typedef enum {
    DAAC_MATCH_STANDARD = 0,
    DAAC_MATCH_LEFTMOST_LONGEST = 1,
    DAAC_MATCH_LEFTMOST_FIRST = 2
} daac_match_kind_t;

typedef enum {
    DAAC_OK = 0,

    /* Raised by daac_create*(), no automaton is created. */
    DAAC_ERR_NO_PATTERN,
    DAAC_ERR_EMPTY_PATTERN,
    DAAC_ERR_DUP_PATTERN,
    DAAC_ERR_INVALID_UTF8,
    DAAC_ERR_TOO_MANY_STATES,
    DAAC_ERR_BAD_MATCH_KIND,

    /* Overlapping query on an automaton not built with DAAC_MATCH_STANDARD */
    DAAC_ERR_NOT_STANDARD,

    DAAC_ERR_INVALID_ARG,
    DAAC_ERR_NOMEM
} daac_status_t;

typedef enum {
    DAAC_NO_ERROR = 0,
    DAAC_CONSTRUCTION_ERROR,
    DAAC_INVALID_CONFIGURATION,
    DAAC_INVALID_ARGUMENT,      /* DAAC_ERR_INVALID_ARG */
    DAAC_RESOURCE_ERROR         /* DAAC_ERR_NOMEM */
} daac_error_kind_t;

typedef struct {
    unsigned char magic_num;
    unsigned char match_kind;
} daac_t;

/* Longest haystack the daac_find*() functions accept, in bytes. */
#define DAAC_MAX_HAYSTACK_LEN 0xfffffffeu

/* Offsets are in codepoints, match_end is exclusive. */
typedef struct {
    unsigned int match_begin;
    unsigned int match_end;
    unsigned int value;
} daac_match_t;

typedef struct {
    daac_match_t* matches;
    unsigned int num;
} daac_match_vect_t;

/* Points into the copy of the pattern kept by the daac_t; valid until
 * daac_free(). Not NUL-terminated.
 */
typedef struct {
    const char* str;
    unsigned int len;
} daac_str_t;

typedef struct {
    daac_str_t* strs;
    unsigned int num;
} daac_str_vect_t;

/* Build an automaton from vect_len UTF-8 patterns. If strlenv is NULL the
 * patterns are NUL-terminated. The pattern with index i gets value i. On
 * failure NULL is returned and *status (if status is not NULL) tells why.
 */
daac_t* daac_create(const char** strv, const unsigned int* strlenv,
                    unsigned int vect_len, int match_kind,
                    daac_status_t* status) DAAC_EXPORT;

/* Same as daac_create(), except that values[i] is reported for pattern i. */
daac_t* daac_create_with_values(const char** strv,
                                const unsigned int* strlenv,
                                const unsigned int* values,
                                unsigned int vect_len, int match_kind,
                                daac_status_t* status) DAAC_EXPORT;

unsigned int daac_pattern_num(const daac_t*) DAAC_EXPORT;
int daac_get_match_kind(const daac_t*) DAAC_EXPORT;

/* Non-overlapping matches, per the match kind the automaton was built with.
 * A haystack longer than DAAC_MAX_HAYSTACK_LEN yields DAAC_ERR_INVALID_ARG.
 */
daac_status_t daac_find(const daac_t*, const char* str, unsigned int len,
                        daac_match_vect_t* result) DAAC_EXPORT;
daac_status_t daac_find_as_strings(const daac_t*, const char* str,
                                   unsigned int len,
                                   daac_str_vect_t* result) DAAC_EXPORT;

/* The following require DAAC_MATCH_STANDARD, and return
 * DAAC_ERR_NOT_STANDARD otherwise.
 */
daac_status_t daac_find_overlapping(const daac_t*, const char* str,
                                    unsigned int len,
                                    daac_match_vect_t* result) DAAC_EXPORT;
daac_status_t daac_find_overlapping_as_strings(const daac_t*, const char* str,
                                               unsigned int len,
                                               daac_str_vect_t* result)
                                               DAAC_EXPORT;
/* Only the longest match ending at each position is reported. */
daac_status_t daac_find_overlapping_no_suffix(const daac_t*, const char* str,
                                              unsigned int len,
                                              daac_match_vect_t* result)
                                              DAAC_EXPORT;
daac_status_t daac_find_overlapping_no_suffix_as_strings(const daac_t*,
                                                         const char* str,
                                                         unsigned int len,
                                                         daac_str_vect_t* r)
                                                         DAAC_EXPORT;

const char* daac_strerror(daac_status_t) DAAC_EXPORT;
daac_error_kind_t daac_error_kind(daac_status_t) DAAC_EXPORT;

void daac_free_matches(daac_match_vect_t*) DAAC_EXPORT;
void daac_free_strings(daac_str_vect_t*) DAAC_EXPORT;
void daac_free(daac_t*) DAAC_EXPORT;

#ifdef __cplusplus
}
#endif

#endif /* DAAC_H */
