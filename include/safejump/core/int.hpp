#pragma once

#include <safejump/config.hpp>

#include <intx/intx.hpp>

SAFEJUMP_NAMESPACE_BEGIN

using uint256_t = ::intx::uint256;

SAFEJUMP_NAMESPACE_END
