#ifndef TIMING_T
#define TIMING_T

#include <chrono>

namespace Timing {

using namespace std::chrono_literals;

constexpr auto InputTimeout = 10ms;
} // namespace Timing

#endif
