#pragma once

#include "orrery/core/Types.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string_view>

namespace orrery::core {

// SplitMix64: small 64-bit state PRNG.
// Every generator draw goes through one instance, so a seed fully determines
// a universe. Not suitable for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed) : m_state(seed) {}

  u64 nextU64() {
    u64 z = (m_state += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  // [0, 1) from the top 53 bits.
  double nextDouble() {
    const u64 mantissa = nextU64() >> 11;
    return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
  }

  // Uniform real in [min, max). An empty or inverted range returns min
  // without consuming a draw.
  double range(double min, double max) {
    if (!(max > min)) return min;
    return min + (max - min) * nextDouble();
  }

  bool chance(double probability01) {
    probability01 = std::clamp(probability01, 0.0, 1.0);
    return nextDouble() < probability01;
  }

  // Uniform angle in [0, 2pi).
  double angle() { return nextDouble() * 6.283185307179586476925286766559; }

  // Standard normal (Box-Muller, no cached second value).
  double normal() {
    const double u1 = std::max(std::numeric_limits<double>::min(), nextDouble());
    const double u2 = nextDouble();
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586476925286766559 * u2);
  }

  // Gamma(shape, 1) via Marsaglia-Tsang.
  double gamma(double shape) {
    if (shape <= 0.0) return 0.0;
    if (shape < 1.0) {
      const double u = std::max(std::numeric_limits<double>::min(), nextDouble());
      return gamma(shape + 1.0) * std::pow(u, 1.0 / shape);
    }

    const double d = shape - 1.0 / 3.0;
    const double c = 1.0 / std::sqrt(9.0 * d);
    for (;;) {
      const double x = normal();
      double v = 1.0 + c * x;
      if (v <= 0.0) continue;
      v = v * v * v;

      const double u = nextDouble();
      const double x2 = x * x;
      if (u < 1.0 - 0.0331 * x2 * x2) return d * v;
      if (u > 0.0 && std::log(u) < 0.5 * x2 + d * (1.0 - v + std::log(v))) return d * v;
    }
  }

  // Beta(alpha, beta) in [0, 1].
  double beta(double alpha, double betaShape) {
    const double x = gamma(alpha);
    const double y = gamma(betaShape);
    const double sum = x + y;
    if (sum <= 0.0) return 0.5;
    return x / sum;
  }

  // PERT distribution on [min, max] peaking at mode (scaled Beta, lambda = 4).
  double pert(double min, double max, double mode) {
    const double width = max - min;
    if (!(width > 0.0)) return min;
    mode = std::clamp(mode, min, max);
    const double a = 1.0 + 4.0 * (mode - min) / width;
    const double b = 1.0 + 4.0 * (max - mode) / width;
    return min + beta(a, b) * width;
  }

private:
  u64 m_state = 0;
};

// Stable seed from a string (64-bit FNV-1a), for `--seed milky-way` style input.
inline u64 seedFromString(std::string_view text) {
  u64 hash = 14695981039346656037ull;
  for (char c : text) {
    hash ^= static_cast<u64>(static_cast<unsigned char>(c));
    hash *= 1099511628211ull;
  }
  return hash;
}

} // namespace orrery::core
