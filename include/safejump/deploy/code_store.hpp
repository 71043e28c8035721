#pragma once

#include <safejump/config.hpp>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/bytes.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>

SAFEJUMP_NAMESPACE_BEGIN

/**
 * Content addressed storage of accepted code, keyed by the keccak256 hash of
 * the code. Only deploy_code writes to it, and only after validation.
 */
class CodeStore
{
    ankerl::unordered_dense::segmented_map<bytes32_t, byte_string> code_;

public:
    bool contains(bytes32_t const &) const;

    std::optional<byte_string_view> get(bytes32_t const &) const;

    bool put(bytes32_t const &, byte_string_view);

    size_t size() const noexcept
    {
        return code_.size();
    }
};

SAFEJUMP_NAMESPACE_END
