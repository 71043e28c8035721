#pragma once

#include <safejump/config.hpp>

#include <evmc/evmc.hpp>

SAFEJUMP_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

SAFEJUMP_NAMESPACE_END
