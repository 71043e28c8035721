#include <safejump/analysis/analysis_fmt.hpp>
#include <safejump/analysis/control_flow_validator.hpp>
#include <safejump/core/byte_string.hpp>
#include <safejump/evm/code.hpp>
#include <safejump/evm/opcodes.hpp>
#include <safejump/validation_error.hpp>

#include <evmc/evmc.h>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>

using namespace safejump;
using namespace safejump::analysis;
using namespace safejump::evm;

namespace
{
    // EIP-170
    constexpr size_t code_size_limit = 24576;

    struct Verdict
    {
        bool valid;
        std::optional<ValidationFailure> failure;
        ValidationStats stats;
    };

    Verdict check(
        byte_string const &bytes, evmc_revision const rev = default_revision,
        ValidatorConfig const &config = {})
    {
        Code const code{bytes, rev};
        ControlFlowValidator validator{code, config};
        auto const res = validator.validate();
        EXPECT_LE(validator.stats().instructions_visited, code.size());
        EXPECT_EQ(
            validator.visited().visited_count(),
            validator.stats().instructions_visited);
        // at most 8 shadow stack changes (CALL) per analyzed instruction
        EXPECT_LE(
            validator.stats().max_journal_size,
            8 * validator.stats().instructions_visited);
        return Verdict{
            .valid = !res.has_error(),
            .failure = validator.failure(),
            .stats = validator.stats()};
    }

    void expect_failure(
        Verdict const &verdict, ValidationError const error, size_t const pc)
    {
        ASSERT_FALSE(verdict.valid);
        ASSERT_TRUE(verdict.failure.has_value());
        EXPECT_EQ(verdict.failure->error, error);
        EXPECT_EQ(verdict.failure->pc, pc);
    }
}

TEST(ControlFlowValidator, self_loop)
{
    auto const verdict = check({JUMPDEST, PUSH1, 0x00, JUMP});
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.instructions_visited, 3);
    EXPECT_EQ(verdict.stats.jumps_resolved, 1);
    EXPECT_EQ(verdict.stats.revisits, 1);
}

TEST(ControlFlowValidator, jump_to_non_jumpdest)
{
    auto const verdict = check({PUSH1, 0x05, JUMP, STOP, STOP, ADD});
    expect_failure(verdict, ValidationError::InvalidJumpDestination, 2);
    EXPECT_EQ(verdict.failure->opcode, JUMP);
}

TEST(ControlFlowValidator, jump_on_empty_stack)
{
    auto const verdict = check({JUMP});
    expect_failure(verdict, ValidationError::StackUnderflow, 0);
}

TEST(ControlFlowValidator, stack_overflow)
{
    byte_string code{PUSH1, 0x00};
    code.append(1025, DUP1);

    auto const verdict = check(code);
    // the 1024th DUP1 would leave 1025 items
    expect_failure(verdict, ValidationError::StackOverflow, 1025);
}

TEST(ControlFlowValidator, stack_limit_reached)
{
    byte_string code{PUSH1, 0x00};
    code.append(1023, DUP1);
    code.push_back(STOP);

    auto const verdict = check(code);
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.max_stack_height, 1024);
}

TEST(ControlFlowValidator, computed_destination)
{
    auto const verdict =
        check({PUSH1, 0x02, PUSH1, 0x03, ADD, JUMP, JUMPDEST, STOP});
    expect_failure(verdict, ValidationError::UnresolvedDynamicJump, 5);
}

TEST(ControlFlowValidator, subroutine_call_and_return)
{
    // 0: push return address 7, argument 0x2a, call subroutine at 9
    // 7: return site
    // 9: subroutine increments its argument and returns
    auto const verdict = check(
        {PUSH1,
         0x07,
         PUSH1,
         0x2a,
         PUSH1,
         0x09,
         JUMP,
         JUMPDEST,
         STOP,
         JUMPDEST,
         PUSH1,
         0x01,
         ADD,
         SWAP1,
         JUMP});
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.jumps_resolved, 2);
    EXPECT_EQ(verdict.stats.instructions_visited, 11);
}

TEST(ControlFlowValidator, destination_through_dup)
{
    auto const verdict =
        check({PUSH1, 0x05, DUP1, POP, JUMP, JUMPDEST, STOP});
    EXPECT_TRUE(verdict.valid);
}

TEST(ControlFlowValidator, conditional_jump)
{
    auto const verdict = check(
        {PUSH1,
         0x01,
         PUSH1,
         0x0a,
         JUMPI,
         PUSH1,
         0x00,
         PUSH1,
         0x00,
         REVERT,
         JUMPDEST,
         STOP});
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.paths_explored, 2);
    EXPECT_EQ(verdict.stats.jumps_resolved, 1);
    EXPECT_EQ(verdict.stats.instructions_visited, 8);
}

TEST(ControlFlowValidator, conditional_jump_taken_branch_checked)
{
    auto const verdict =
        check({PUSH1, 0x01, PUSH1, 0x06, JUMPI, STOP, JUMPDEST, INVALID});
    expect_failure(verdict, ValidationError::InvalidInstruction, 7);
    EXPECT_EQ(verdict.failure->opcode, INVALID);
}

TEST(ControlFlowValidator, conditional_jump_needs_two_items)
{
    auto const verdict = check({PUSH1, 0x03, JUMPI, JUMPDEST});
    expect_failure(verdict, ValidationError::StackUnderflow, 2);
}

TEST(ControlFlowValidator, conditional_jump_unknown_destination)
{
    auto const verdict = check({PUSH1, 0x01, CALLVALUE, JUMPI, STOP});
    expect_failure(verdict, ValidationError::UnresolvedDynamicJump, 3);
}

TEST(ControlFlowValidator, counting_loop)
{
    // n = 10; do { n = n - 1 } while (n)
    byte_string const code{
        PUSH1,
        0x0a,
        JUMPDEST,
        PUSH1,
        0x01,
        SWAP1,
        SUB,
        DUP1,
        PUSH1,
        0x02,
        JUMPI,
        STOP};

    EXPECT_TRUE(check(code).valid);
    EXPECT_TRUE(
        check(
            code,
            default_revision,
            ValidatorConfig{.require_consistent_stack_height = true})
            .valid);
}

TEST(ControlFlowValidator, growing_loop)
{
    // every iteration leaves one more item on the stack
    byte_string const code{
        JUMPDEST, CALLVALUE, CALLVALUE, PUSH1, 0x00, JUMPI, STOP};

    auto const lenient = check(code);
    EXPECT_TRUE(lenient.valid);
    EXPECT_EQ(lenient.stats.revisits, 1);

    auto const strict = check(
        code,
        default_revision,
        ValidatorConfig{.require_consistent_stack_height = true});
    expect_failure(strict, ValidationError::StackHeightMismatch, 0);
}

TEST(ControlFlowValidator, block_exit_below_entry)
{
    auto const verdict =
        check({CALLVALUE, PUSH1, 0x04, JUMP, JUMPDEST, POP, STOP});
    expect_failure(verdict, ValidationError::StackUnderflow, 6);
}

TEST(ControlFlowValidator, underflow)
{
    auto const verdict = check({PUSH1, 0x01, ADD});
    expect_failure(verdict, ValidationError::StackUnderflow, 2);
}

TEST(ControlFlowValidator, undefined_instruction)
{
    expect_failure(check({0x0c}), ValidationError::InvalidInstruction, 0);
    expect_failure(check({INVALID}), ValidationError::InvalidInstruction, 0);
}

TEST(ControlFlowValidator, unreachable_garbage)
{
    auto const verdict = check({STOP, INVALID, 0x0c});
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.instructions_visited, 1);
}

TEST(ControlFlowValidator, push0_revision)
{
    byte_string const code{PUSH0, STOP};

    EXPECT_TRUE(check(code, EVMC_SHANGHAI).valid);
    expect_failure(
        check(code, EVMC_PARIS), ValidationError::InvalidInstruction, 0);
}

TEST(ControlFlowValidator, jump_into_push_data)
{
    auto const verdict = check({PUSH1, JUMPDEST, PUSH1, 0x01, JUMP});
    expect_failure(verdict, ValidationError::InvalidJumpDestination, 4);
}

TEST(ControlFlowValidator, destination_out_of_range)
{
    byte_string code{PUSH32};
    code.append(32, 0xff);
    code.push_back(JUMP);

    auto const verdict = check(code);
    expect_failure(verdict, ValidationError::InvalidJumpDestination, 33);
}

TEST(ControlFlowValidator, truncated_push)
{
    auto const verdict = check({PUSH2, 0x01});
    expect_failure(verdict, ValidationError::CodeTruncated, 0);
}

TEST(ControlFlowValidator, implicit_stop)
{
    byte_string const code{PUSH1, 0x01};

    EXPECT_TRUE(check(code).valid);

    auto const verdict = check(
        code,
        default_revision,
        ValidatorConfig{.implicit_stop_at_end = false});
    expect_failure(verdict, ValidationError::CodeTruncated, 2);
    EXPECT_EQ(verdict.failure->opcode, std::nullopt);
}

TEST(ControlFlowValidator, empty_code)
{
    auto const verdict = check({});
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.instructions_visited, 0);
    EXPECT_EQ(verdict.stats.paths_explored, 1);
}

TEST(ControlFlowValidator, validate_control_flow)
{
    Code const good{byte_string{JUMPDEST, PUSH1, 0x00, JUMP}};
    EXPECT_FALSE(validate_control_flow(good).has_error());

    Code const bad{byte_string{JUMP}};
    auto const res = validate_control_flow(bad);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ValidationError::StackUnderflow);
}

TEST(ControlFlowValidator, revalidate)
{
    Code const code{byte_string{PUSH1, 0x01, JUMP}};
    ControlFlowValidator validator{code};

    EXPECT_TRUE(validator.validate().has_error());
    EXPECT_TRUE(validator.validate().has_error());
    ASSERT_TRUE(validator.failure().has_value());
    EXPECT_EQ(validator.stats().instructions_visited, 2);
}

TEST(ControlFlowValidator, format_failure)
{
    Code const code{byte_string{JUMP}};
    ControlFlowValidator validator{code};
    ASSERT_TRUE(validator.validate().has_error());

    EXPECT_EQ(
        fmt::format("{}", validator.failure().value()),
        "stack underflow at pc 0 (JUMP)");
}

TEST(ControlFlowValidator, many_branches_to_one_target)
{
    // a deep stack of literals, then thousands of JUMPIs to one JUMPDEST
    // placed after the final STOP
    byte_string code{PUSH0};
    code.append(1000, DUP1);
    code.append({PUSH1, 0x01, PUSH2, 0x00, 0x00});
    size_t const dest_offset = code.size() - 2;
    size_t n = 0;
    while (code.size() + 3 + 3 <= code_size_limit) {
        code.append({DUP2, DUP2, JUMPI});
        ++n;
    }
    code.push_back(STOP);
    size_t const dest = code.size();
    code.append({JUMPDEST, STOP});
    code[dest_offset] = static_cast<uint8_t>(dest >> 8);
    code[dest_offset + 1] = static_cast<uint8_t>(dest);
    ASSERT_LE(code.size(), code_size_limit);
    ASSERT_GT(n, 7000);

    auto const verdict = check(code);
    EXPECT_TRUE(verdict.valid);
    EXPECT_LE(verdict.stats.instructions_visited, code.size());
    EXPECT_EQ(verdict.stats.jumps_resolved, n);
    EXPECT_LE(verdict.stats.paths_explored, n + 1);
    EXPECT_LE(verdict.stats.max_pending, n);
    // each pending branch costs the two literals DUP2 pushed plus the two
    // slots JUMPI popped, independent of the stack height
    EXPECT_LE(verdict.stats.max_journal_size, 4 * n);
}

TEST(ControlFlowValidator, many_backward_branches)
{
    // blocks of JUMPDEST PUSH1 1 PUSH2 0 JUMPI, each branching back to the
    // first block, followed by a shared exit
    byte_string code;
    size_t blocks = 0;
    while (code.size() + 7 + 1 <= code_size_limit) {
        code.append({JUMPDEST, PUSH1, 0x01, PUSH2, 0x00, 0x00, JUMPI});
        ++blocks;
    }
    code.push_back(STOP);

    auto const verdict = check(code);
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.instructions_visited, 4 * blocks + 1);
    EXPECT_EQ(verdict.stats.jumps_resolved, blocks);
    EXPECT_EQ(verdict.stats.revisits, blocks);
    EXPECT_EQ(verdict.stats.paths_explored, 1);
    EXPECT_EQ(verdict.stats.max_pending, 0);
    EXPECT_EQ(verdict.stats.max_journal_size, 0);

    auto const strict = check(
        code,
        default_revision,
        ValidatorConfig{.require_consistent_stack_height = true});
    EXPECT_TRUE(strict.valid);
    EXPECT_EQ(strict.stats.paths_explored, blocks + 1);
    EXPECT_EQ(strict.stats.max_pending, blocks);
}

TEST(ControlFlowValidator, many_backward_jumps)
{
    // a chain of JUMPs, each landing on the JUMPDEST before it
    //   0: PUSH2 <last> JUMP
    //   then blocks of JUMPDEST PUSH2 <previous block> JUMP
    //   with the first block ending in STOP
    byte_string code{PUSH2, 0x00, 0x00, JUMP, JUMPDEST, STOP};
    size_t previous = 4;
    size_t blocks = 1;
    while (code.size() + 5 <= code_size_limit) {
        size_t const here = code.size();
        code.append(
            {JUMPDEST,
             PUSH2,
             static_cast<uint8_t>(previous >> 8),
             static_cast<uint8_t>(previous),
             JUMP});
        previous = here;
        ++blocks;
    }
    code[1] = static_cast<uint8_t>(previous >> 8);
    code[2] = static_cast<uint8_t>(previous);

    auto const verdict = check(code);
    EXPECT_TRUE(verdict.valid);
    EXPECT_EQ(verdict.stats.jumps_resolved, blocks);
    EXPECT_EQ(verdict.stats.instructions_visited, 3 * (blocks - 1) + 4);
    EXPECT_EQ(verdict.stats.paths_explored, 1);
}
