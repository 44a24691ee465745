#pragma once

#include <cmath>
#include <cstdint>

namespace market::ledger {

// Fixed-point money: 1.0 == 1'000'000 micros.
using Micros = int64_t;

inline constexpr Micros kMicrosPerUnit = 1'000'000;

inline Micros ToMicros(double amount) {
  return static_cast<Micros>(std::llround(amount * static_cast<double>(kMicrosPerUnit)));
}

inline double FromMicros(Micros micros) {
  return static_cast<double>(micros) / static_cast<double>(kMicrosPerUnit);
}

} // namespace market::ledger
