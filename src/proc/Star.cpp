#include "orrery/proc/Star.h"

#include "orrery/math/Math.h"
#include "orrery/sim/Units.h"

#include <cmath>

namespace orrery::proc {

Star starFromMass(double massSolar, core::SplitMix64& rng) {
  using namespace sim::units;

  Star s{};
  s.massSolar = massSolar;
  s.massMj = solarToJupiterMasses(massSolar);
  s.luminositySolar = massSolar * massSolar * massSolar;
  s.radiusLs = solarRadiiToLs(std::pow(massSolar, 0.8));

  const double sqrtL = std::sqrt(s.luminositySolar);
  s.habitableZoneLs = {auToLs(sqrtL * 0.95), auToLs(sqrtL * 1.37)};
  s.planetaryZoneLs = {auToLs(0.1 * massSolar), auToLs(40.0 * massSolar)};
  s.frostLineLs = auToLs(4.85 * sqrtL);
  s.habitable = massSolar >= 0.6 && massSolar < 1.4;

  const double polar = rng.range(0.0, math::pi);
  const double azimuth = rng.angle();
  s.northPole = math::Spherical{1.0, polar, azimuth};
  return s;
}

Star makeStar(core::SplitMix64& rng, bool habitableCapable) {
  const double mass = habitableCapable ? rng.range(0.6, 1.4) : rng.range(0.02, 16.0);
  return starFromMass(mass, rng);
}

} // namespace orrery::proc
