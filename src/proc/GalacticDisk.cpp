#include "orrery/proc/GalacticDisk.h"

#include "orrery/math/Math.h"
#include "orrery/math/Spherical.h"
#include "orrery/sim/Units.h"

#include <cmath>

namespace orrery::proc {

double allowedHeightLs(const GalacticDiskParams& params, double radiusLs) {
  const double rPc = sim::units::lsToParsec(radiusLs);
  const double sigma = params.heightSigmaPc;
  const double peakPc = params.heightScalePc / std::sqrt(math::twoPi);
  return sim::units::parsecToLs(peakPc * std::exp(-(rPc * rPc) / (2.0 * sigma * sigma)));
}

math::Vec3d sampleStarPosition(const GalacticDiskParams& params, core::SplitMix64& rng) {
  const double radius = std::abs(rng.pert(-1.0, 1.0, 0.0) * params.widthLs);
  const double height = rng.pert(-1.0, 1.0, 0.0) * allowedHeightLs(params, radius);

  double theta = 0.0;
  if (radius > params.bulgeRadiusLs) {
    // Arm offset in turns; the second arm sits half a turn from the first.
    const bool primaryArm = rng.chance(0.5);
    const double spread = rng.pert(-1.0, 1.0, 0.0) * 0.25;
    const double arm = primaryArm ? spread : spread + 0.5;
    theta = math::twoPi * (arm + 1.0 + radius * params.armWinding / params.widthLs);
  } else {
    theta = rng.angle();
  }

  return math::cylindricalToCartesian(radius, height, theta);
}

} // namespace orrery::proc
