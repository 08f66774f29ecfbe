#pragma once

#include "orrery/math/Vec3.h"

#include <cmath>
#include <ostream>

namespace orrery::math {

// Unit quaternion for rotations. Composition follows the usual convention:
// (a * b).rotate(v) == a.rotate(b.rotate(v)).
struct Quatd {
  double w = 1.0;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  constexpr Quatd() = default;
  constexpr Quatd(double w_, double x_, double y_, double z_) : w(w_), x(x_), y(y_), z(z_) {}

  static constexpr Quatd identity() { return {}; }

  // Right-handed rotation of `angleRad` around `axis` (normalized here).
  static Quatd fromAxisAngle(const Vec3d& axis, double angleRad) {
    const Vec3d n = axis.normalized();
    const double h = 0.5 * angleRad;
    const double s = std::sin(h);
    return {std::cos(h), n.x * s, n.y * s, n.z * s};
  }

  // Shortest rotation taking direction `from` onto direction `to`.
  static Quatd rotationFromTo(const Vec3d& from, const Vec3d& to) {
    const Vec3d u = from.normalized();
    const Vec3d v = to.normalized();
    const double d = dot(u, v);

    if (d >= 1.0 - 1e-12) return identity();
    if (d <= -1.0 + 1e-12) {
      Vec3d axis = cross(kRight, u);
      if (axis.lengthSquared() < 1e-12) axis = cross(kForward, u);
      return fromAxisAngle(axis, pi);
    }

    const Vec3d c = cross(u, v);
    return Quatd{1.0 + d, c.x, c.y, c.z}.normalized();
  }

  constexpr Quatd operator*(const Quatd& r) const {
    return {
      w*r.w - x*r.x - y*r.y - z*r.z,
      w*r.x + x*r.w + y*r.z - z*r.y,
      w*r.y - x*r.z + y*r.w + z*r.x,
      w*r.z + x*r.y - y*r.x + z*r.w
    };
  }

  constexpr Quatd conjugate() const { return {w, -x, -y, -z}; }

  double norm() const { return std::sqrt(w*w + x*x + y*y + z*z); }

  Quatd normalized() const {
    const double n = norm();
    if (n <= 0.0) return identity();
    return {w / n, x / n, y / n, z / n};
  }

  Vec3d rotate(const Vec3d& v) const {
    // v' = v + 2w (q x v) + 2 q x (q x v)
    const Vec3d q{x, y, z};
    const Vec3d t = cross(q, v) * 2.0;
    return v + t * w + cross(q, t);
  }
};

inline std::ostream& operator<<(std::ostream& os, const Quatd& q) {
  os << "(" << q.w << "; " << q.x << ", " << q.y << ", " << q.z << ")";
  return os;
}

} // namespace orrery::math
