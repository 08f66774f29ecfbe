#include "orrery/sim/Rotating.h"

#include "orrery/math/Math.h"

#include <cmath>

namespace orrery::sim {
namespace {
  math::Vec3d unitAxis(const math::Vec3d& axis) {
    const double len = axis.length();
    if (!(len > 0.0)) return math::kUp;
    return std::abs(len - 1.0) > 1e-12 ? axis / len : axis;
  }
} // namespace

Rotating::Rotating(double siderealPeriodHours, const math::Vec3d& axis)
: m_periodHours(siderealPeriodHours > 0.0 ? siderealPeriodHours : 24.0),
  m_axis(unitAxis(axis)) {}

double Rotating::meanAngle(double timeHours) const {
  return std::fmod(timeHours, m_periodHours) / m_periodHours * math::twoPi;
}

math::Quatd Rotating::rotationAt(double timeHours) const {
  return math::Quatd::fromAxisAngle(m_axis, -meanAngle(timeHours));
}

} // namespace orrery::sim
