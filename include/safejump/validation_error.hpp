#pragma once

#include <safejump/config.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

SAFEJUMP_NAMESPACE_BEGIN

enum class ValidationError
{
    Success = 0,
    InvalidInstruction,
    CodeTruncated,
    UnresolvedDynamicJump,
    InvalidJumpDestination,
    StackUnderflow,
    StackOverflow,
    StackHeightMismatch,
};

SAFEJUMP_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<safejump::ValidationError>
    : quick_status_code_from_enum_defaults<safejump::ValidationError>
{
    static constexpr auto const domain_name = "Control Flow Validation Error";
    static constexpr auto const domain_uuid =
        "4f0b8a3e-96c1-4d6b-b5a2-1e7c2f9d0a64";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

SAFEJUMP_NAMESPACE_BEGIN

constexpr BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
    quick_status_code_from_enum_code<ValidationError>
    status_code(ValidationError const e)
{
    return BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
        quick_status_code_from_enum_code<ValidationError>(e);
}

SAFEJUMP_NAMESPACE_END
