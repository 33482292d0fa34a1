#include "time.hpp"

namespace resolver::util {

SteadyTime StartTimer() {
  return std::chrono::steady_clock::now();
}

double ElapsedMs(SteadyTime start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace resolver::util
