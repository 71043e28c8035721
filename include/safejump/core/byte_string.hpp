#pragma once

#include <safejump/config.hpp>

#include <string>
#include <string_view>

SAFEJUMP_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;

using byte_string_view = std::basic_string_view<unsigned char>;

SAFEJUMP_NAMESPACE_END
