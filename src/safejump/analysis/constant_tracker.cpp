#include <safejump/analysis/config.hpp>
#include <safejump/analysis/constant_tracker.hpp>
#include <safejump/core/assert.h>
#include <safejump/core/int.hpp>
#include <safejump/evm/instruction_descriptor.hpp>
#include <safejump/evm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

SAFEJUMP_ANALYSIS_NAMESPACE_BEGIN

ConstantTracker::ConstantTracker()
{
    slots_.reserve(evm::stack_limit);
}

void ConstantTracker::push_slot(std::optional<uint256_t> const &value)
{
    SAFEJUMP_ASSERT(slots_.size() < evm::stack_limit);
    slots_.push_back(value);
    if (checkpoints_ > 0) {
        journal_.push_back(
            JournalEntry{.kind = JournalEntry::Kind::Push, .n = 0, .value = {}});
    }
}

std::optional<uint256_t> ConstantTracker::pop_slot()
{
    SAFEJUMP_ASSERT(!slots_.empty());
    auto value = std::move(slots_.back());
    slots_.pop_back();
    if (checkpoints_ > 0) {
        journal_.push_back(JournalEntry{
            .kind = JournalEntry::Kind::Pop, .n = 0, .value = value});
    }
    return value;
}

void ConstantTracker::swap_slots(size_t const n)
{
    SAFEJUMP_ASSERT(n > 0 && n < slots_.size());
    std::swap(slots_.back(), slots_[slots_.size() - n - 1]);
    if (checkpoints_ > 0) {
        journal_.push_back(JournalEntry{
            .kind = JournalEntry::Kind::Swap,
            .n = static_cast<uint8_t>(n),
            .value = {}});
    }
}

void ConstantTracker::push_constant(uint256_t const &value)
{
    push_slot(value);
}

void ConstantTracker::push_unknown()
{
    push_slot(std::nullopt);
}

std::optional<uint256_t> ConstantTracker::pop()
{
    return pop_slot();
}

void ConstantTracker::dup(size_t const n)
{
    SAFEJUMP_ASSERT(n > 0 && n <= slots_.size());
    auto const value = slots_[slots_.size() - n];
    push_slot(value);
}

void ConstantTracker::swap(size_t const n)
{
    swap_slots(n);
}

void ConstantTracker::apply(
    uint8_t const opcode, evm::InstructionDescriptor const &descriptor,
    std::optional<uint256_t> const &immediate)
{
    using namespace evm;

    SAFEJUMP_DEBUG_ASSERT(opcode != JUMP && opcode != JUMPI);

    if (descriptor.produces_constant) {
        SAFEJUMP_ASSERT(immediate.has_value());
        push_constant(*immediate);
    }
    else if (is_dup(opcode)) {
        dup(static_cast<size_t>(opcode - DUP1) + 1);
    }
    else if (is_swap(opcode)) {
        swap(static_cast<size_t>(opcode - SWAP1) + 1);
    }
    else {
        SAFEJUMP_ASSERT(descriptor.consumes <= slots_.size());
        for (uint8_t i = 0; i < descriptor.consumes; ++i) {
            pop_slot();
        }
        for (uint8_t i = 0; i < descriptor.produces; ++i) {
            push_unknown();
        }
    }
}

std::optional<uint256_t> const &ConstantTracker::peek(size_t const n) const
{
    SAFEJUMP_ASSERT(n < slots_.size());
    return slots_[slots_.size() - 1 - n];
}

size_t ConstantTracker::checkpoint()
{
    ++checkpoints_;
    return journal_.size();
}

void ConstantTracker::rollback(size_t const mark)
{
    SAFEJUMP_ASSERT(checkpoints_ > 0);
    SAFEJUMP_ASSERT(mark <= journal_.size());
    while (journal_.size() > mark) {
        auto &entry = journal_.back();
        switch (entry.kind) {
        case JournalEntry::Kind::Push:
            SAFEJUMP_ASSERT(!slots_.empty());
            slots_.pop_back();
            break;
        case JournalEntry::Kind::Pop:
            SAFEJUMP_ASSERT(slots_.size() < evm::stack_limit);
            slots_.push_back(std::move(entry.value));
            break;
        case JournalEntry::Kind::Swap:
            std::swap(slots_.back(), slots_[slots_.size() - entry.n - 1]);
            break;
        }
        journal_.pop_back();
    }
    if (--checkpoints_ == 0) {
        journal_.clear();
    }
}

SAFEJUMP_ANALYSIS_NAMESPACE_END
