#include <safejump/analysis/config.hpp>
#include <safejump/analysis/constant_tracker.hpp>
#include <safejump/analysis/control_flow_validator.hpp>
#include <safejump/analysis/visited_table.hpp>
#include <safejump/core/assert.h>
#include <safejump/core/int.hpp>
#include <safejump/core/likely.h>
#include <safejump/core/result.hpp>
#include <safejump/evm/code.hpp>
#include <safejump/evm/instruction_descriptor.hpp>
#include <safejump/evm/opcodes.hpp>
#include <safejump/validation_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>

SAFEJUMP_ANALYSIS_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

ControlFlowValidator::ControlFlowValidator(
    evm::Code const &code, ValidatorConfig const &config)
    : code_{code}
    , config_{config}
    , visited_{code.size()}
    , stats_{}
{
}

ValidationError
ControlFlowValidator::fail(ValidationError const error, size_t const pc)
{
    std::optional<uint8_t> opcode;
    if (pc < code_.size()) {
        opcode = code_.at(pc);
    }
    failure_ = ValidationFailure{.error = error, .pc = pc, .opcode = opcode};
    LOG_DEBUG(
        "control flow validation failed at pc {} ({}): {}",
        pc,
        opcode.has_value() ? evm::opcode_name(*opcode) : "end of code",
        status_code(error).message().c_str());
    return error;
}

Result<size_t> ControlFlowValidator::resolve_jump(size_t const pc)
{
    auto const dest = tracker_.pop();
    if (SAFEJUMP_UNLIKELY(!dest.has_value())) {
        return fail(ValidationError::UnresolvedDynamicJump, pc);
    }
    if (SAFEJUMP_UNLIKELY(
            *dest >= uint256_t{code_.size()} ||
            !code_.is_jump_dest(static_cast<size_t>(*dest)))) {
        return fail(ValidationError::InvalidJumpDestination, pc);
    }
    ++stats_.jumps_resolved;
    return static_cast<size_t>(*dest);
}

Result<void> ControlFlowValidator::exit_path(Path const &path, size_t const pc)
{
    // a block may not leave fewer items than it was entered with
    if (SAFEJUMP_UNLIKELY(path.sp < path.base)) {
        return fail(ValidationError::StackUnderflow, pc);
    }
    return success();
}

Result<void> ControlFlowValidator::walk(Path &path)
{
    using namespace evm;

    ++stats_.paths_explored;

    while (true) {
        auto const pc = path.pc;
        if (pc == code_.size()) {
            if (!config_.implicit_stop_at_end) {
                return fail(ValidationError::CodeTruncated, pc);
            }
            return exit_path(path, pc);
        }
        SAFEJUMP_DEBUG_ASSERT(pc < code_.size());
        SAFEJUMP_DEBUG_ASSERT(tracker_.size() == path.sp);

        auto const opcode = code_.at(pc);
        auto const instruction = code_.instruction_at(pc);
        if (SAFEJUMP_UNLIKELY(instruction.has_error())) {
            return fail(ValidationError::InvalidInstruction, pc);
        }
        auto const &descriptor = *instruction.value();

        if (auto const &record = visited_.at(pc); record.has_value()) {
            ++stats_.revisits;
            if (config_.require_consistent_stack_height &&
                SAFEJUMP_UNLIKELY(record->height != path.sp)) {
                return fail(ValidationError::StackHeightMismatch, pc);
            }
            return success();
        }
        visited_.record(
            pc,
            VisitRecord{
                .depth = static_cast<int>(path.sp) -
                         static_cast<int>(path.base),
                .height = path.sp});
        ++stats_.instructions_visited;

        if (SAFEJUMP_UNLIKELY(path.sp < descriptor.consumes)) {
            return fail(ValidationError::StackUnderflow, pc);
        }
        auto const sp = path.sp - descriptor.consumes + descriptor.produces;
        if (SAFEJUMP_UNLIKELY(sp > stack_limit)) {
            return fail(ValidationError::StackOverflow, pc);
        }

        if (opcode == JUMP) {
            auto const dest = resolve_jump(pc);
            if (SAFEJUMP_UNLIKELY(dest.has_error())) {
                return dest.assume_error();
            }
            path.pc = dest.value();
            path.sp = sp;
            path.base = sp;
            continue;
        }

        if (opcode == JUMPI) {
            auto const dest = resolve_jump(pc);
            if (SAFEJUMP_UNLIKELY(dest.has_error())) {
                return dest.assume_error();
            }
            // the condition is never needed
            tracker_.pop();
            path.sp = sp;
            path.base = sp;
            if (visited_.contains(dest.value()) &&
                !config_.require_consistent_stack_height) {
                // the branch would end at its first instruction
                ++stats_.revisits;
            }
            else {
                pending_.push_back(Branch{
                    .pc = dest.value(),
                    .sp = sp,
                    .mark = tracker_.checkpoint()});
                stats_.max_pending =
                    std::max(stats_.max_pending, pending_.size());
            }
            path.pc = advance(pc, descriptor);
            continue;
        }

        std::optional<uint256_t> immediate;
        if (descriptor.produces_constant) {
            auto const value = immediate_value(code_.bytes(), pc, descriptor);
            if (SAFEJUMP_UNLIKELY(value.has_error())) {
                return fail(ValidationError::CodeTruncated, pc);
            }
            immediate = value.value();
        }
        tracker_.apply(opcode, descriptor, immediate);
        path.sp = sp;
        stats_.max_stack_height = std::max(stats_.max_stack_height, sp);

        if (descriptor.terminal) {
            return exit_path(path, pc);
        }
        path.pc = advance(pc, descriptor);
    }
}

Result<void> ControlFlowValidator::validate()
{
    visited_ = VisitedTable{code_.size()};
    tracker_ = ConstantTracker{};
    pending_.clear();
    stats_ = ValidationStats{};
    failure_.reset();

    Path entry{.pc = 0, .sp = 0, .base = 0};
    BOOST_OUTCOME_TRY(walk(entry));
    while (!pending_.empty()) {
        stats_.max_journal_size =
            std::max(stats_.max_journal_size, tracker_.journal_size());
        auto const branch = pending_.back();
        pending_.pop_back();
        tracker_.rollback(branch.mark);
        Path path{.pc = branch.pc, .sp = branch.sp, .base = branch.sp};
        BOOST_OUTCOME_TRY(walk(path));
    }

    LOG_DEBUG(
        "control flow validated: {} instructions, {} paths, {} jumps",
        stats_.instructions_visited,
        stats_.paths_explored,
        stats_.jumps_resolved);
    return success();
}

Result<void> validate_control_flow(
    evm::Code const &code, ValidatorConfig const &config)
{
    ControlFlowValidator validator{code, config};
    return validator.validate();
}

SAFEJUMP_ANALYSIS_NAMESPACE_END
