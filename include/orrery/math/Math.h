#pragma once

#include <cmath>

namespace orrery::math {

constexpr double pi = 3.141592653589793238462643383279502884;
constexpr double twoPi = 2.0 * pi;
constexpr double halfPi = 0.5 * pi;

template <typename T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : (v > hi) ? hi : v;
}

inline double degToRad(double deg) { return deg * (pi / 180.0); }
inline double radToDeg(double rad) { return rad * (180.0 / pi); }

// [0, 2pi)
inline double wrapTwoPi(double x) {
  x = std::fmod(x, twoPi);
  if (x < 0.0) x += twoPi;
  return x;
}

inline bool approxEqual(double a, double b, double eps) {
  return std::abs(a - b) <= eps;
}

} // namespace orrery::math
