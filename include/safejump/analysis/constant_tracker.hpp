#pragma once

#include <safejump/analysis/config.hpp>
#include <safejump/core/int.hpp>
#include <safejump/evm/instruction_descriptor.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

SAFEJUMP_ANALYSIS_NAMESPACE_BEGIN

/**
 * Shadow of the data stack that remembers which slots hold a literal pushed
 * by a PUSH instruction. DUP and SWAP move tracked literals around; every
 * other instruction replaces its inputs with unknown outputs. There is no
 * constant folding, so `PUSH1 2 PUSH1 3 ADD` leaves an unknown slot.
 *
 * While a checkpoint is open every change is journaled, so the state at the
 * checkpoint can be restored with rollback(). Checkpoints are rolled back in
 * the reverse order they were taken.
 */
class ConstantTracker
{
    struct JournalEntry
    {
        enum class Kind : uint8_t
        {
            Push,
            Pop,
            Swap,
        };

        Kind kind;
        uint8_t n;
        // the popped slot, for Kind::Pop
        std::optional<uint256_t> value;
    };

    std::vector<std::optional<uint256_t>> slots_;
    std::vector<JournalEntry> journal_;
    size_t checkpoints_{0};

    void push_slot(std::optional<uint256_t> const &);
    std::optional<uint256_t> pop_slot();
    void swap_slots(size_t n);

public:
    ConstantTracker();

    void push_constant(uint256_t const &);
    void push_unknown();
    std::optional<uint256_t> pop();

    // copy the n-th slot from the top (1 based) onto the top
    void dup(size_t n);

    // exchange the top slot with the slot n below it
    void swap(size_t n);

    // mirror the stack effect of a non-jump instruction
    void apply(
        uint8_t opcode, evm::InstructionDescriptor const &,
        std::optional<uint256_t> const &immediate);

    std::optional<uint256_t> const &peek(size_t n = 0) const;

    /**
     * Open a checkpoint at the current state.
     * @return the mark to pass to rollback()
     */
    size_t checkpoint();

    // restore the state of the most recent open checkpoint and close it
    void rollback(size_t mark);

    size_t journal_size() const noexcept
    {
        return journal_.size();
    }

    size_t size() const noexcept
    {
        return slots_.size();
    }

    bool empty() const noexcept
    {
        return slots_.empty();
    }
};

SAFEJUMP_ANALYSIS_NAMESPACE_END
