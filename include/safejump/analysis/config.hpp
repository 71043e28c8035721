#pragma once

#include <safejump/config.hpp>

#define SAFEJUMP_ANALYSIS_NAMESPACE_BEGIN                                      \
    SAFEJUMP_NAMESPACE_BEGIN namespace analysis                                \
    {

#define SAFEJUMP_ANALYSIS_NAMESPACE_END                                        \
    }                                                                          \
    SAFEJUMP_NAMESPACE_END
