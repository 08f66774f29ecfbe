#pragma once

#include "orrery/math/Quat.h"
#include "orrery/math/Vec3.h"

namespace orrery::sim {

// Axial spin of a body. Seen from the surface, the sky turns the other way,
// so rotationAt() rotates by the negated spin angle.
class Rotating {
public:
  // `axis` is normalized here; a zero axis falls back to +z.
  Rotating(double siderealPeriodHours, const math::Vec3d& axis);

  double siderealPeriodHours() const { return m_periodHours; }
  const math::Vec3d& axis() const { return m_axis; }

  // Spin angle in [0, 2pi) for non-negative times.
  double meanAngle(double timeHours) const;

  math::Quatd rotationAt(double timeHours) const;

private:
  double m_periodHours = 24.0;
  math::Vec3d m_axis = math::kUp;
};

} // namespace orrery::sim
