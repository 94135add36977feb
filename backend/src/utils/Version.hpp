#pragma once

#ifndef KC_BUILD_VERSION
#define KC_BUILD_VERSION "0.0.0-dev"
#endif

namespace kc::version
{

// Compile-time helpers derived from KC_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = KC_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "KidCache " KC_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] = "KidCache/" KC_BUILD_VERSION;

} // namespace kc::version
