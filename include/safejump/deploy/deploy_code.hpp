#pragma once

#include <safejump/analysis/control_flow_validator.hpp>
#include <safejump/config.hpp>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/bytes.hpp>
#include <safejump/core/result.hpp>
#include <safejump/deploy/code_store.hpp>
#include <safejump/deploy/deploy_error.hpp>
#include <safejump/deploy/validation_cache.hpp>
#include <safejump/evm/code.hpp>

#include <evmc/evmc.h>

#include <cstddef>

SAFEJUMP_NAMESPACE_BEGIN

// EIP-170
constexpr size_t max_code_size = 24576;

struct DeployConfig
{
    evmc_revision revision{evm::default_revision};
    size_t max_code_size{::safejump::max_code_size};
    analysis::ValidatorConfig validator{};
    // optional, shared between deployments
    ValidationCache *cache{nullptr};
};

/**
 * Validate `code` and, if it is safe, write it into `store`.
 * @return the keccak256 hash under which the code is stored. On failure the
 * store is left unchanged.
 */
Result<bytes32_t>
deploy_code(CodeStore &, byte_string_view code, DeployConfig const & = {});

SAFEJUMP_NAMESPACE_END
