#pragma once

#include <chrono>

namespace resolver::util {

/*
  Time utilities. Single place to control the clock source.
*/

using SteadyTime = std::chrono::steady_clock::time_point;

// Stage timing for metrics/logging.
SteadyTime StartTimer();
double     ElapsedMs(SteadyTime start);

} // namespace resolver::util
