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

enum class DeployError
{
    Success = 0,
    CodeSizeLimitExceeded,
};

SAFEJUMP_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<safejump::DeployError>
    : quick_status_code_from_enum_defaults<safejump::DeployError>
{
    static constexpr auto const domain_name = "Code Deployment Error";
    static constexpr auto const domain_uuid =
        "b27d6e01-3c5a-4f8e-9d14-7a0c85e2f3b9";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

SAFEJUMP_NAMESPACE_BEGIN

constexpr BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
    quick_status_code_from_enum_code<DeployError>
    status_code(DeployError const e)
{
    return BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
        quick_status_code_from_enum_code<DeployError>(e);
}

SAFEJUMP_NAMESPACE_END
