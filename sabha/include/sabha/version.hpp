#pragma once

#define SABHA_VERSION "0.3.0"
#define SABHA_SNAPSHOT_VERSION 1

namespace sabha {
namespace version {

inline const char* string() { return SABHA_VERSION; }

} // namespace version
} // namespace sabha
