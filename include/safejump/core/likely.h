#pragma once

#define SAFEJUMP_LIKELY(x) __builtin_expect(!!(x), 1)
#define SAFEJUMP_UNLIKELY(x) __builtin_expect(!!(x), 0)
