#pragma once

namespace osim::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3";

}  // namespace osim::core
