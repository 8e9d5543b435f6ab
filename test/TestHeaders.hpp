#ifndef __RELAY_TEST_HEADERS__
#define __RELAY_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch.hpp>

namespace relay {
// Polls @p condition every 10ms until it holds or @p timeoutMs elapses.
inline bool waitFor(std::function<bool()> condition, int timeoutMs = 5000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}
}  // namespace relay

#endif  // __RELAY_TEST_HEADERS__
