#include "orrery/sim/Dynamic.h"

#include "orrery/math/Math.h"
#include "orrery/sim/Units.h"

#include <cmath>

namespace orrery::sim {
namespace {
  // Leaves unit quaternions bit-exact so saved orbits reload unchanged.
  math::Quatd renormalized(const math::Quatd& q) {
    return std::abs(q.norm() - 1.0) > 1e-12 ? q.normalized() : q;
  }
} // namespace

double orbitalPeriodHours(double semiMajorAxisLs, double parentMassMj) {
  const double gm = units::kGravitationalConstant * parentMassMj;
  if (gm <= 0.0) return 0.0;
  return math::twoPi * std::sqrt(semiMajorAxisLs * semiMajorAxisLs * semiMajorAxisLs / gm);
}

math::Quatd orbitOrientation(double inclinationRad, double longitudeAscendingNodeRad,
                             double argumentPeriapsisRad) {
  const auto node = math::Quatd::fromAxisAngle(math::kUp, longitudeAscendingNodeRad);
  const auto tilt = math::Quatd::fromAxisAngle(math::kRight, inclinationRad);
  const auto periapsis = math::Quatd::fromAxisAngle(math::kUp, argumentPeriapsisRad);
  return (node * tilt * periapsis).normalized();
}

KeplerianDynamic KeplerianDynamic::aroundMass(const OrbitalElements& elements, double parentMassMj) {
  return withPeriod(elements, orbitalPeriodHours(elements.semiMajorAxisLs, parentMassMj));
}

KeplerianDynamic KeplerianDynamic::withPeriod(const OrbitalElements& elements, double periodHours) {
  return KeplerianDynamic(
    elements.eccentricity,
    elements.semiMajorAxisLs,
    orbitOrientation(elements.inclinationRad, elements.longitudeAscendingNodeRad, elements.argumentPeriapsisRad),
    elements.meanAnomalyAtEpochRad,
    periodHours);
}

KeplerianDynamic::KeplerianDynamic(double eccentricity, double semiMajorAxisLs, const math::Quatd& orientation,
                                   double meanAnomalyAtEpochRad, double periodHours)
: m_eccentricity(math::clamp(eccentricity, 0.0, 0.999999)),
  m_semiMajorAxisLs(semiMajorAxisLs > 0.0 ? semiMajorAxisLs : 1e-9),
  m_orientation(renormalized(orientation)),
  m_meanAnomalyAtEpoch(meanAnomalyAtEpochRad),
  m_periodHours(periodHours > 0.0 ? periodHours : 1.0) {}

double KeplerianDynamic::meanAnomaly(double timeHours) const {
  return std::fmod(timeHours, m_periodHours) / m_periodHours * math::twoPi + m_meanAnomalyAtEpoch;
}

double KeplerianDynamic::eccentricAnomaly(double timeHours) const {
  // Fixed-point form of Kepler's equation: E = M + e sin(E)
  const double M = meanAnomaly(timeHours);
  double E = M;
  for (int i = 0; i < kAnomalyIterations; ++i) {
    E = M + m_eccentricity * std::sin(E);
  }
  return E;
}

math::Vec3d KeplerianDynamic::offsetAt(double timeHours) const {
  const double E = eccentricAnomaly(timeHours);
  const double a = m_semiMajorAxisLs;
  const double e = m_eccentricity;

  // Periapsis on +x, motion towards +y, orbit normal along +z.
  const math::Vec3d inPlane{
    a * (std::cos(E) - e),
    a * std::sqrt(1.0 - e * e) * std::sin(E),
    0.0
  };
  return m_orientation.rotate(inPlane);
}

math::Vec3d offsetAt(const Dynamic& dynamic, double timeHours) {
  return std::visit([timeHours](const auto& d) { return d.offsetAt(timeHours); }, dynamic);
}

} // namespace orrery::sim
