#pragma once

namespace cqa::core {

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "0.1";

}  // namespace cqa::core
