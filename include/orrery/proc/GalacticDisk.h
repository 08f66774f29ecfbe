#pragma once

#include "orrery/core/Random.h"
#include "orrery/math/Vec3.h"

namespace orrery::proc {

// Density model for star placement: PERT radius around the galactic centre,
// thickness falling off with radius, two spiral arms beyond the bulge.
struct GalacticDiskParams {
  double widthLs = 3e12;
  double bulgeRadiusLs = 5e11;
  double heightScalePc = 2600.0;
  double heightSigmaPc = 40963.2174964452;
  // Turns the arms make between the centre and the rim.
  double armWinding = 1.352;
};

// Allowed |height| above the galactic plane at `radiusLs`.
double allowedHeightLs(const GalacticDiskParams& params, double radiusLs);

// Offset of a new star from the galactic centre (cylindrical sample, Cartesian result).
math::Vec3d sampleStarPosition(const GalacticDiskParams& params, core::SplitMix64& rng);

} // namespace orrery::proc
