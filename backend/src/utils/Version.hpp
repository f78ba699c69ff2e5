#pragma once

#ifndef TP_BUILD_VERSION
#define TP_BUILD_VERSION "0.0.0-dev"
#endif

namespace tp::version
{

inline constexpr char const kDisplayVersion[] = "TinyPedal " TP_BUILD_VERSION;

} // namespace tp::version
