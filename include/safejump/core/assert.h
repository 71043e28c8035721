#pragma once

#include <safejump/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void safejump_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

#ifdef __cplusplus
}
#endif

#define SAFEJUMP_ASSERT(expr)                                                  \
    (SAFEJUMP_LIKELY(!!(expr))                                                 \
         ? ((void)0)                                                           \
         : safejump_assertion_failed(                                          \
               #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__))

#ifdef NDEBUG
    #define SAFEJUMP_DEBUG_ASSERT(x)                                           \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define SAFEJUMP_DEBUG_ASSERT(x) SAFEJUMP_ASSERT(x)
#endif
