#pragma once

#include <string>
#include <string_view>

#include "tc_core_global.h"

namespace tc {

namespace str {

// Strip leading and trailing whitespaces, the result refers to the input.
TC_CORE_API std::string_view Trim(std::string_view str);

TC_CORE_API std::string ToLower(std::string_view str);

} // namespace str

} // namespace tc
