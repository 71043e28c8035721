#include <safejump/core/assert.h>

#include <cstdio>
#include <cstdlib>

extern "C" void safejump_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line)
{
    std::fprintf(
        stderr,
        "%s:%ld: %s: Assertion '%s' failed.\n",
        file,
        line,
        function,
        expr);
    std::abort();
}
