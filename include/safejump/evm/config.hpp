#pragma once

#include <safejump/config.hpp>

#define SAFEJUMP_EVM_NAMESPACE_BEGIN                                           \
    SAFEJUMP_NAMESPACE_BEGIN namespace evm                                     \
    {

#define SAFEJUMP_EVM_NAMESPACE_END                                             \
    }                                                                          \
    SAFEJUMP_NAMESPACE_END
