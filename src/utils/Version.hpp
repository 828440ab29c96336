#pragma once

#ifndef UR_BUILD_VERSION
#define UR_BUILD_VERSION "0.0.0-dev"
#endif

namespace ur::version
{

inline constexpr char const kDisplayVersion[] = "UriRelay " UR_BUILD_VERSION;

} // namespace ur::version
