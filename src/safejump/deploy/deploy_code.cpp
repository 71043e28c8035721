#include <safejump/analysis/control_flow_validator.hpp>
#include <safejump/config.hpp>
#include <safejump/core/assert.h>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/bytes.hpp>
#include <safejump/core/keccak.hpp>
#include <safejump/core/likely.h>
#include <safejump/core/result.hpp>
#include <safejump/deploy/code_store.hpp>
#include <safejump/deploy/deploy_code.hpp>
#include <safejump/deploy/deploy_error.hpp>
#include <safejump/deploy/validation_cache.hpp>
#include <safejump/evm/code.hpp>
#include <safejump/validation_error.hpp>

#include <quill/Quill.h>

#include <optional>

SAFEJUMP_NAMESPACE_BEGIN

ANONYMOUS_NAMESPACE_BEGIN

ValidationError
validate(byte_string_view const code, DeployConfig const &config)
{
    evm::Code const analysed{code, config.revision};
    analysis::ControlFlowValidator validator{analysed, config.validator};
    if (validator.validate().has_error()) {
        SAFEJUMP_ASSERT(validator.failure().has_value());
        return validator.failure()->error;
    }
    return ValidationError::Success;
}

ANONYMOUS_NAMESPACE_END

Result<bytes32_t> deploy_code(
    CodeStore &store, byte_string_view const code, DeployConfig const &config)
{
    if (SAFEJUMP_UNLIKELY(code.size() > config.max_code_size)) {
        LOG_DEBUG(
            "rejected code of {} bytes, limit is {}",
            code.size(),
            config.max_code_size);
        return DeployError::CodeSizeLimitExceeded;
    }

    auto const hash = keccak256(code);
    ValidationKey const key{
        .code_hash = hash,
        .revision = config.revision,
        .implicit_stop_at_end = config.validator.implicit_stop_at_end,
        .require_consistent_stack_height =
            config.validator.require_consistent_stack_height};

    std::optional<ValidationError> verdict;
    if (config.cache) {
        verdict = config.cache->get(key);
    }
    if (!verdict.has_value()) {
        verdict = validate(code, config);
        if (config.cache) {
            config.cache->put(key, *verdict);
        }
    }
    if (*verdict != ValidationError::Success) {
        return *verdict;
    }

    store.put(hash, code);
    LOG_DEBUG("deployed code of {} bytes", code.size());
    return hash;
}

SAFEJUMP_NAMESPACE_END
