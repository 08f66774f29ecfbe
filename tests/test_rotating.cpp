#include "orrery/math/Math.h"
#include "orrery/sim/Rotating.h"

#include <cmath>
#include <iostream>

int test_rotating() {
  using namespace orrery;
  using namespace orrery::math;
  using orrery::sim::Rotating;

  int fails = 0;

  struct Case {
    const char* label;
    Vec3d axis;
    double timeHours;
    Vec3d in;
    Vec3d expected;
  };

  const double s = 1.0 / std::sqrt(2.0);

  // The sky turns against the spin, so a quarter period is a -90 degree turn.
  const Case cases[] = {
    {"up", kUp, 6.0, kRight, -kForward},
    {"right", kRight, 6.0, kForward, -kUp},
    {"forward", kForward, 6.0, kUp, -kRight},
    {"off-axis quarter", {1.0, 1.0, 0.0}, 6.0, kUp, {-s, s, 0.0}},
    {"off-axis half", {1.0, 1.0, 0.0}, 12.0, kRight, kForward},
    {"wrapped", kUp, 30.0, kRight, -kForward},
  };

  for (const auto& c : cases) {
    const Rotating r(24.0, c.axis);
    const Vec3d got = r.rotationAt(c.timeHours).rotate(c.in);
    if (!approxEqual(got, c.expected, 1e-9)) {
      std::cerr << "[test_rotating] " << c.label << ": expected " << c.expected << " got " << got << "\n";
      ++fails;
    }
  }

  {
    const Rotating r(24.0, kUp);
    if (std::abs(r.meanAngle(30.0) - halfPi) > 1e-12) {
      std::cerr << "[test_rotating] meanAngle should wrap at the period\n";
      ++fails;
    }
  }

  {
    const Rotating r(-5.0, Vec3d{});
    if (r.siderealPeriodHours() != 24.0 || r.axis() != kUp) {
      std::cerr << "[test_rotating] degenerate input should fall back to 24h about +z\n";
      ++fails;
    }

    const Rotating scaled(10.0, {0.0, 0.0, 5.0});
    if (!approxEqual(scaled.axis(), kUp, 1e-12)) {
      std::cerr << "[test_rotating] axis should be normalized, got " << scaled.axis() << "\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_rotating] pass\n";
  return fails;
}
