#pragma once

#include <safejump/analysis/config.hpp>
#include <safejump/core/assert.h>

#include <cstddef>
#include <optional>
#include <vector>

SAFEJUMP_ANALYSIS_NAMESPACE_BEGIN

struct VisitRecord
{
    // stack height relative to the entry of the enclosing basic block, kept
    // for diagnostics
    int depth;
    // absolute stack height
    size_t height;

    friend bool operator==(VisitRecord const &, VisitRecord const &) = default;
};

/**
 * One entry per code offset, written on the first visit and never again. An
 * empty optional means the offset has not been reached; a visit with depth 0
 * is a distinct state.
 */
class VisitedTable
{
    std::vector<std::optional<VisitRecord>> records_;
    size_t visited_{0};

public:
    VisitedTable() = default;

    explicit VisitedTable(size_t const code_size)
        : records_(code_size)
    {
    }

    std::optional<VisitRecord> const &at(size_t const pc) const
    {
        SAFEJUMP_ASSERT(pc < records_.size());
        return records_[pc];
    }

    bool contains(size_t const pc) const
    {
        return at(pc).has_value();
    }

    void record(size_t const pc, VisitRecord const &record)
    {
        SAFEJUMP_ASSERT(pc < records_.size());
        SAFEJUMP_ASSERT(!records_[pc].has_value());
        records_[pc] = record;
        ++visited_;
    }

    size_t size() const noexcept
    {
        return records_.size();
    }

    size_t visited_count() const noexcept
    {
        return visited_;
    }
};

SAFEJUMP_ANALYSIS_NAMESPACE_END
