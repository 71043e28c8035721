#pragma once

#include <safejump/analysis/control_flow_validator.hpp>
#include <safejump/core/basic_formatter.hpp>
#include <safejump/evm/instruction_descriptor.hpp>
#include <safejump/validation_error.hpp>

#include <fmt/format.h>

template <>
struct fmt::formatter<safejump::ValidationError>
    : public safejump::basic_formatter
{
    template <typename FormatContext>
    auto
    format(safejump::ValidationError const &error, FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}", safejump::status_code(error).message().c_str());
    }
};

template <>
struct fmt::formatter<safejump::analysis::ValidationFailure>
    : public safejump::basic_formatter
{
    template <typename FormatContext>
    auto format(
        safejump::analysis::ValidationFailure const &failure,
        FormatContext &ctx) const
    {
        if (!failure.opcode.has_value()) {
            return fmt::format_to(
                ctx.out(),
                "{} at end of code (pc {})",
                failure.error,
                failure.pc);
        }
        return fmt::format_to(
            ctx.out(),
            "{} at pc {} ({})",
            failure.error,
            failure.pc,
            safejump::evm::opcode_name(*failure.opcode));
    }
};

template <>
struct fmt::formatter<safejump::analysis::ValidationStats>
    : public safejump::basic_formatter
{
    template <typename FormatContext>
    auto format(
        safejump::analysis::ValidationStats const &stats,
        FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "ValidationStats {{ instructions_visited={}, paths_explored={}, "
            "jumps_resolved={}, revisits={}, max_stack_height={}, "
            "max_pending={}, max_journal_size={} }}",
            stats.instructions_visited,
            stats.paths_explored,
            stats.jumps_resolved,
            stats.revisits,
            stats.max_stack_height,
            stats.max_pending,
            stats.max_journal_size);
    }
};
