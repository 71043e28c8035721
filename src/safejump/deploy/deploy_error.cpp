#include <safejump/deploy/deploy_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<safejump::DeployError>::mapping> const &
quick_status_code_from_enum<safejump::DeployError>::value_mappings()
{
    using safejump::DeployError;

    static std::initializer_list<mapping> const v = {
        {DeployError::Success, "success", {errc::success}},
        {DeployError::CodeSizeLimitExceeded, "code size limit exceeded", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
