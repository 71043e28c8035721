#pragma once

#include <safejump/core/byte_string.hpp>
#include <safejump/core/result.hpp>
#include <safejump/evm/config.hpp>
#include <safejump/evm/instruction_descriptor.hpp>

#include <evmc/evmc.h>

#include <cstddef>
#include <cstdint>
#include <vector>

SAFEJUMP_EVM_NAMESPACE_BEGIN

constexpr evmc_revision default_revision = EVMC_CANCUN;

/**
 * Immutable bytecode together with the jump destination bitmap, i.e. the
 * positions of JUMPDEST bytes that are opcodes rather than PUSH immediate
 * data. The revision decides which opcodes are defined.
 */
class Code
{
    byte_string code_;
    std::vector<bool> is_jump_dest_;
    evmc_revision rev_;

public:
    explicit Code(byte_string_view code, evmc_revision rev = default_revision);

    size_t size() const noexcept
    {
        return code_.size();
    }

    byte_string_view bytes() const noexcept
    {
        return code_;
    }

    evmc_revision revision() const noexcept
    {
        return rev_;
    }

    uint8_t at(size_t pc) const;

    bool is_jump_dest(size_t pc) const noexcept;

    Result<InstructionDescriptor const *> instruction_at(size_t pc) const;

    size_t jump_dest_count() const noexcept;
};

SAFEJUMP_EVM_NAMESPACE_END
