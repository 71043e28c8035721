#include <safejump/core/assert.h>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/likely.h>
#include <safejump/core/result.hpp>
#include <safejump/evm/code.hpp>
#include <safejump/evm/config.hpp>
#include <safejump/evm/instruction_descriptor.hpp>
#include <safejump/evm/opcodes.hpp>

#include <evmc/evmc.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

SAFEJUMP_EVM_NAMESPACE_BEGIN

ANONYMOUS_NAMESPACE_BEGIN

std::vector<bool> find_jump_dests(byte_string_view const code)
{
    std::vector<bool> is_jump_dest(code.size());
    for (size_t i = 0; i < code.size();) {
        auto const op = code[i];
        if (is_push(op)) {
            i += 1 + static_cast<size_t>(op - PUSH0);
            continue;
        }
        if (SAFEJUMP_UNLIKELY(op == JUMPDEST)) {
            is_jump_dest[i] = true;
        }
        ++i;
    }
    return is_jump_dest;
}

ANONYMOUS_NAMESPACE_END

Code::Code(byte_string_view const code, evmc_revision const rev)
    : code_{code}
    , is_jump_dest_{find_jump_dests(code)}
    , rev_{rev}
{
}

uint8_t Code::at(size_t const pc) const
{
    SAFEJUMP_ASSERT(pc < code_.size());
    return code_[pc];
}

bool Code::is_jump_dest(size_t const pc) const noexcept
{
    return pc < is_jump_dest_.size() && is_jump_dest_[pc];
}

Result<InstructionDescriptor const *>
Code::instruction_at(size_t const pc) const
{
    return lookup(at(pc), rev_);
}

size_t Code::jump_dest_count() const noexcept
{
    return static_cast<size_t>(
        std::count(is_jump_dest_.begin(), is_jump_dest_.end(), true));
}

SAFEJUMP_EVM_NAMESPACE_END
