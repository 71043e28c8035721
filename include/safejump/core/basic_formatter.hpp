#pragma once

#include <safejump/config.hpp>

#include <fmt/format.h>

SAFEJUMP_NAMESPACE_BEGIN

struct basic_formatter
{
    constexpr auto parse(fmt::format_parse_context &ctx)
    {
        return ctx.begin();
    }
};

SAFEJUMP_NAMESPACE_END
