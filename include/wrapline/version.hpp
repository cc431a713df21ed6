#pragma once
#include <string_view>

#ifndef WL_VERSION
  #define WL_VERSION "1.1.6"
#endif

namespace wl {

inline constexpr std::string_view kProgramName    = "wrapline";
inline constexpr std::string_view kProgramVersion = WL_VERSION;
inline constexpr std::string_view kProgramUrl     = "https://github.com/jftuga/wrapline";

}
