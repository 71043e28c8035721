#pragma once

#include <safejump/analysis/config.hpp>
#include <safejump/analysis/constant_tracker.hpp>
#include <safejump/analysis/visited_table.hpp>
#include <safejump/core/result.hpp>
#include <safejump/evm/code.hpp>
#include <safejump/validation_error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

SAFEJUMP_ANALYSIS_NAMESPACE_BEGIN

struct ValidatorConfig
{
    // running off the end of the code behaves like STOP
    bool implicit_stop_at_end{true};
    // every revisit must arrive with the stack height of the first visit
    bool require_consistent_stack_height{false};
};

struct ValidationStats
{
    size_t instructions_visited{0};
    size_t paths_explored{0};
    size_t jumps_resolved{0};
    size_t revisits{0};
    size_t max_stack_height{0};
    // JUMPI branches queued at the same time
    size_t max_pending{0};
    // shadow stack changes held for rollback at the same time
    size_t max_journal_size{0};
};

struct ValidationFailure
{
    ValidationError error;
    size_t pc;
    // unset when the failure is at the end of the code
    std::optional<uint8_t> opcode;
};

/**
 * Proves at creation time that no path through `code` executes an undefined
 * instruction, jumps to anything but a JUMPDEST, or leaves the stack outside
 * [0, 1024]. Jump destinations must be literals pushed by a PUSH instruction.
 *
 * The walk is depth first over paths. Every offset is analyzed at most once:
 * reaching an analyzed offset again closes a cycle and ends that path. A
 * JUMPI queues the taken branch and continues with the fallthrough. A queued
 * branch holds a checkpoint of the shadow stack rather than a copy, so the
 * memory used is linear in the code size whatever the number of branches.
 */
class ControlFlowValidator
{
    struct Path
    {
        size_t pc;
        size_t sp;
        size_t base;
    };

    struct Branch
    {
        size_t pc;
        size_t sp;
        // shadow stack checkpoint taken at the JUMPI
        size_t mark;
    };

    evm::Code const &code_;
    ValidatorConfig const config_;
    VisitedTable visited_;
    ConstantTracker tracker_;
    std::vector<Branch> pending_;
    ValidationStats stats_;
    std::optional<ValidationFailure> failure_;

    Result<void> walk(Path &);
    Result<size_t> resolve_jump(size_t pc);
    Result<void> exit_path(Path const &, size_t pc);
    ValidationError fail(ValidationError, size_t pc);

public:
    explicit ControlFlowValidator(
        evm::Code const &, ValidatorConfig const & = {});

    Result<void> validate();

    ValidationStats const &stats() const noexcept
    {
        return stats_;
    }

    std::optional<ValidationFailure> const &failure() const noexcept
    {
        return failure_;
    }

    VisitedTable const &visited() const noexcept
    {
        return visited_;
    }
};

Result<void>
validate_control_flow(evm::Code const &, ValidatorConfig const & = {});

SAFEJUMP_ANALYSIS_NAMESPACE_END
