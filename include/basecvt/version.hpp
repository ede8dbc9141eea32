// include/basecvt/version.hpp - Library version.

#pragma once

#include <string_view>

namespace basecvt {

inline constexpr std::string_view version = "1.0.0";

} // namespace basecvt
