#pragma once

#include <safejump/config.hpp>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/bytes.hpp>

#include <ethash/keccak.hpp>

#include <bit>

SAFEJUMP_NAMESPACE_BEGIN

inline bytes32_t keccak256(byte_string_view const data)
{
    return std::bit_cast<bytes32_t>(
        ethash::keccak256(data.data(), data.size()));
}

SAFEJUMP_NAMESPACE_END
