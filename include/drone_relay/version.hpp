// === Version Metadata ========================================================
//
// Exposes the relay's semantic version string used in logs and greetings.

#pragma once

#include <string_view>

namespace drone_relay {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace drone_relay
