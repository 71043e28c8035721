#include <safejump/validation_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<safejump::ValidationError>::mapping> const &
quick_status_code_from_enum<safejump::ValidationError>::value_mappings()
{
    using safejump::ValidationError;

    static std::initializer_list<mapping> const v = {
        {ValidationError::Success, "success", {errc::success}},
        {ValidationError::InvalidInstruction, "invalid instruction", {}},
        {ValidationError::CodeTruncated, "code truncated", {}},
        {ValidationError::UnresolvedDynamicJump,
         "unresolved dynamic jump",
         {}},
        {ValidationError::InvalidJumpDestination,
         "invalid jump destination",
         {}},
        {ValidationError::StackUnderflow, "stack underflow", {}},
        {ValidationError::StackOverflow, "stack overflow", {}},
        {ValidationError::StackHeightMismatch, "stack height mismatch", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
