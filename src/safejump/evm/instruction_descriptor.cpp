#include <safejump/core/byte_string.hpp>
#include <safejump/core/int.hpp>
#include <safejump/core/likely.h>
#include <safejump/core/result.hpp>
#include <safejump/evm/config.hpp>
#include <safejump/evm/instruction_descriptor.hpp>
#include <safejump/validation_error.hpp>

#include <evmc/evmc.h>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>

SAFEJUMP_EVM_NAMESPACE_BEGIN

Result<InstructionDescriptor const *>
lookup(uint8_t const opcode, evmc_revision const rev) noexcept
{
    auto const &descriptor = descriptor_table[opcode];
    if (SAFEJUMP_UNLIKELY(
            descriptor.name == nullptr || rev < descriptor.since)) {
        return ValidationError::InvalidInstruction;
    }
    return &descriptor;
}

Result<uint256_t> immediate_value(
    byte_string_view const code, size_t const pc,
    InstructionDescriptor const &descriptor)
{
    size_t const n = descriptor.immediate_len;
    if (SAFEJUMP_UNLIKELY(pc >= code.size() || code.size() - pc - 1 < n)) {
        return ValidationError::CodeTruncated;
    }

    // right align the literal so a short push loads as a small value
    uint8_t data[sizeof(uint256_t)]{};
    std::copy_n(code.data() + pc + 1, n, data + sizeof(data) - n);
    return intx::be::load<uint256_t>(data);
}

char const *opcode_name(uint8_t const opcode) noexcept
{
    if (opcode == INVALID) {
        return "INVALID";
    }
    auto const *const name = descriptor_table[opcode].name;
    return name != nullptr ? name : "UNDEFINED";
}

SAFEJUMP_EVM_NAMESPACE_END
