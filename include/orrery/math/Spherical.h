#pragma once

#include "orrery/math/Math.h"
#include "orrery/math/Vec3.h"

#include <cmath>

namespace orrery::math {

// Polar angle from +z, azimuth from +x towards +y.
struct Spherical {
  double radius = 1.0;
  double polar = 0.0;
  double azimuth = 0.0;

  constexpr Spherical() = default;
  constexpr Spherical(double r, double polarRad, double azimuthRad)
      : radius(r), polar(polarRad), azimuth(azimuthRad) {}

  Vec3d toCartesian() const {
    const double s = std::sin(polar);
    return {radius * s * std::cos(azimuth), radius * s * std::sin(azimuth), radius * std::cos(polar)};
  }

  // Azimuth is wrapped into [0, 2pi); the zero vector maps to (0, 0, 0).
  static Spherical fromCartesian(const Vec3d& v) {
    const double r = v.length();
    if (r <= 0.0) return {0.0, 0.0, 0.0};
    const double polar = std::acos(clamp(v.z / r, -1.0, 1.0));
    return {r, polar, wrapTwoPi(std::atan2(v.y, v.x))};
  }
};

inline constexpr Spherical kSphericalUp{1.0, 0.0, 0.0};
inline constexpr Spherical kSphericalRight{1.0, halfPi, 0.0};
inline constexpr Spherical kSphericalForward{1.0, halfPi, halfPi};

// Cylindrical (r, h, theta) with h along +z.
inline Vec3d cylindricalToCartesian(double radius, double height, double theta) {
  return {radius * std::cos(theta), radius * std::sin(theta), height};
}

// Angular separation of two directions, radius ignored.
inline double angularSeparation(const Spherical& a, const Spherical& b) {
  const Vec3d ua = Spherical{1.0, a.polar, a.azimuth}.toCartesian();
  const Vec3d ub = Spherical{1.0, b.polar, b.azimuth}.toCartesian();
  return angleBetween(ua, ub);
}

} // namespace orrery::math
