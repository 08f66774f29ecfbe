#include "orrery/core/Random.h"
#include "orrery/math/Quat.h"
#include "orrery/math/Spherical.h"
#include "orrery/sim/Units.h"

#include <cmath>
#include <iostream>

namespace {
bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}
} // namespace

int test_math() {
  using namespace orrery;
  using namespace orrery::math;

  int fails = 0;

  // Right-handed: a quarter turn about +z takes +x to +y.
  {
    const Vec3d v = Quatd::fromAxisAngle(kUp, halfPi).rotate(kRight);
    if (!approxEqual(v, kForward, 1e-12)) {
      std::cerr << "[test_math] quarter turn about up expected (0,1,0) got " << v << "\n";
      ++fails;
    }
  }

  {
    const Vec3d v = Quatd::rotationFromTo(kRight, kUp).rotate(kRight);
    if (!approxEqual(v, kUp, 1e-12)) {
      std::cerr << "[test_math] rotationFromTo(right, up) got " << v << "\n";
      ++fails;
    }

    const Vec3d flipped = Quatd::rotationFromTo(kUp, -kUp).rotate(kUp);
    if (!approxEqual(flipped, -kUp, 1e-12)) {
      std::cerr << "[test_math] rotationFromTo(up, -up) got " << flipped << "\n";
      ++fails;
    }
  }

  // Composition applies the right operand first.
  {
    const Quatd a = Quatd::fromAxisAngle(kRight, 0.7);
    const Quatd b = Quatd::fromAxisAngle({0.3, -1.0, 2.0}, 1.9);
    const Vec3d v{0.5, -2.0, 1.25};
    const Vec3d lhs = (a * b).rotate(v);
    const Vec3d rhs = a.rotate(b.rotate(v));
    if (!approxEqual(lhs, rhs, 1e-12)) {
      std::cerr << "[test_math] (a*b).rotate(v) " << lhs << " != a.rotate(b.rotate(v)) " << rhs << "\n";
      ++fails;
    }
  }

  {
    if (!approxEqual(kSphericalForward.toCartesian(), kForward, 1e-12) ||
        !approxEqual(kSphericalRight.toCartesian(), kRight, 1e-12) ||
        !approxEqual(kSphericalUp.toCartesian(), kUp, 1e-12)) {
      std::cerr << "[test_math] spherical axis constants do not match the Cartesian axes\n";
      ++fails;
    }

    const Spherical back = Spherical::fromCartesian({0.0, -3.0, 0.0});
    if (!approx(back.radius, 3.0) || !approx(back.polar, halfPi) || !approx(back.azimuth, 1.5 * pi)) {
      std::cerr << "[test_math] fromCartesian(0,-3,0) expected (3, pi/2, 3pi/2) got (" << back.radius << ", "
                << back.polar << ", " << back.azimuth << ")\n";
      ++fails;
    }

    const Spherical zero = Spherical::fromCartesian({});
    if (zero.radius != 0.0 || zero.polar != 0.0 || zero.azimuth != 0.0) {
      std::cerr << "[test_math] zero vector should map to (0,0,0)\n";
      ++fails;
    }
  }

  {
    const Vec3d c = cylindricalToCartesian(2.0, 3.0, halfPi);
    if (!approxEqual(c, Vec3d{0.0, 2.0, 3.0}, 1e-12)) {
      std::cerr << "[test_math] cylindrical (2, 3, pi/2) got " << c << "\n";
      ++fails;
    }

    if (!approx(angularSeparation(kSphericalUp, kSphericalRight), halfPi, 1e-12)) {
      std::cerr << "[test_math] up/right separation should be pi/2\n";
      ++fails;
    }
  }

  {
    using namespace orrery::sim::units;
    if (!approx(auToLs(1.0), 499.0) || !approx(solarToJupiterMasses(2.0), 2096.0) ||
        !approx(lsToParsec(parsecToLs(3.5)), 3.5)) {
      std::cerr << "[test_math] unit conversions off\n";
      ++fails;
    }
  }

  // Same seed, same sequence; distributions stay in their ranges.
  {
    core::SplitMix64 a(99);
    core::SplitMix64 b(99);
    bool same = true;
    bool inRange = true;
    for (int i = 0; i < 1000; ++i) {
      if (a.nextU64() != b.nextU64()) same = false;
      const double p = a.pert(2.0, 10.0, 3.0);
      const double ang = a.angle();
      b.pert(2.0, 10.0, 3.0);
      b.angle();
      if (p < 2.0 || p > 10.0 || ang < 0.0 || ang >= twoPi) inRange = false;
    }
    if (!same) {
      std::cerr << "[test_math] SplitMix64 not deterministic\n";
      ++fails;
    }
    if (!inRange) {
      std::cerr << "[test_math] pert/angle out of range\n";
      ++fails;
    }

    if (core::seedFromString("orrery") != core::seedFromString("orrery") ||
        core::seedFromString("orrery") == core::seedFromString("orrerz")) {
      std::cerr << "[test_math] seedFromString not stable\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_math] pass\n";
  return fails;
}
