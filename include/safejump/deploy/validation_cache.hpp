#pragma once

#include <safejump/config.hpp>
#include <safejump/core/bytes.hpp>
#include <safejump/validation_error.hpp>

#include <evmc/evmc.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

SAFEJUMP_NAMESPACE_BEGIN

/**
 * A verdict depends on the code and on everything that changes how it is
 * walked: the revision and the validator options.
 */
struct ValidationKey
{
    bytes32_t code_hash{};
    evmc_revision revision{EVMC_FRONTIER};
    bool implicit_stop_at_end{true};
    bool require_consistent_stack_height{false};

    bool operator==(ValidationKey const &) const = default;
};

/**
 * Bounded, thread safe LRU of validation verdicts. A verdict of
 * ValidationError::Success means the code was accepted.
 */
class ValidationCache
{
private:
    class Impl;

    std::unique_ptr<Impl> const impl_;

public:
    static constexpr size_t capacity = 1024;

    ValidationCache();
    ~ValidationCache();

    std::optional<ValidationError> get(ValidationKey const &);

    void put(ValidationKey const &, ValidationError verdict);

    // (hits, lookups)
    std::pair<size_t, size_t> hit_rate() const;

    size_t size() const;
};

SAFEJUMP_NAMESPACE_END
