#pragma once

#include "orrery/math/Quat.h"
#include "orrery/math/Vec3.h"

#include <variant>

namespace orrery::sim {

// Body that never moves relative to its parent (stars under the galactic root).
struct FixedDynamic {
  math::Vec3d offset{};

  math::Vec3d offsetAt(double /*timeHours*/) const { return offset; }
};

// Classical orbital elements, angles in radians, distance in light-seconds.
struct OrbitalElements {
  double eccentricity = 0.0;
  double semiMajorAxisLs = 1.0;
  double inclinationRad = 0.0;
  double longitudeAscendingNodeRad = 0.0;   // Omega
  double argumentPeriapsisRad = 0.0;        // omega
  double meanAnomalyAtEpochRad = 0.0;       // M0 at t=0
};

// Closed-form two-body orbit. The three orientation angles are fused into one
// quaternion at construction so offsetAt() is a single rotation.
class KeplerianDynamic {
public:
  static constexpr int kAnomalyIterations = 20;

  // Period from Kepler's third law around a parent of `parentMassMj`.
  static KeplerianDynamic aroundMass(const OrbitalElements& elements, double parentMassMj);
  static KeplerianDynamic withPeriod(const OrbitalElements& elements, double periodHours);

  // Raw form, as stored on disk. Eccentricity is clamped to [0, 1),
  // the semi-major axis and period to positive values.
  KeplerianDynamic(double eccentricity, double semiMajorAxisLs, const math::Quatd& orientation,
                   double meanAnomalyAtEpochRad, double periodHours);

  double eccentricity() const { return m_eccentricity; }
  double semiMajorAxisLs() const { return m_semiMajorAxisLs; }
  const math::Quatd& orientation() const { return m_orientation; }
  double meanAnomalyAtEpochRad() const { return m_meanAnomalyAtEpoch; }
  double periodHours() const { return m_periodHours; }

  double meanAnomaly(double timeHours) const;
  double eccentricAnomaly(double timeHours) const;

  math::Vec3d offsetAt(double timeHours) const;

private:
  double m_eccentricity = 0.0;
  double m_semiMajorAxisLs = 1.0;
  math::Quatd m_orientation{};
  double m_meanAnomalyAtEpoch = 0.0;
  double m_periodHours = 1.0;
};

using Dynamic = std::variant<FixedDynamic, KeplerianDynamic>;

math::Vec3d offsetAt(const Dynamic& dynamic, double timeHours);

inline bool isFixed(const Dynamic& dynamic) {
  return std::holds_alternative<FixedDynamic>(dynamic);
}

// 2pi sqrt(a^3 / (G M))
double orbitalPeriodHours(double semiMajorAxisLs, double parentMassMj);

// Rz(Omega) * Rx(i) * Rz(omega)
math::Quatd orbitOrientation(double inclinationRad, double longitudeAscendingNodeRad,
                             double argumentPeriapsisRad);

} // namespace orrery::sim
