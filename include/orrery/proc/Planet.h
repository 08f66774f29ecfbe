#pragma once

#include "orrery/core/Random.h"
#include "orrery/core/Types.h"
#include "orrery/math/Spherical.h"
#include "orrery/proc/Star.h"
#include "orrery/sim/Dynamic.h"
#include "orrery/sim/Rotating.h"

#include <optional>
#include <vector>

namespace orrery::proc {

enum class PlanetKind : core::u8 {
  GasGiant    = 0,
  Terrestrial = 1,
  Habitable   = 2
};

struct Planet {
  PlanetKind kind = PlanetKind::Terrestrial;
  double massMj = 0.0;
  double radiusLs = 0.0;
  double semiMajorAxisLs = 0.0;
  math::Spherical northPole = math::kSphericalUp;
};

// Minimum gap between neighbouring planet orbits, in AU.
inline constexpr double kMinPlanetSpacingAu = 0.15;

Planet makeGasGiant(core::SplitMix64& rng, double semiMajorAxisLs);
Planet makeTerrestrial(core::SplitMix64& rng, double semiMajorAxisLs);

// Only for habitable stars; the pole is tilted relative to the star's ecliptic.
std::optional<Planet> makeHabitable(core::SplitMix64& rng, const Star& star);

// Full planet list of a habitable-capable star, sorted by semi-major axis,
// with crowded orbits filtered out. Never empty: the first gas giant is kept.
std::vector<Planet> generatePlanets(core::SplitMix64& rng, const Star& star);

struct PlanetOrbit {
  sim::KeplerianDynamic dynamic;
  double hillLimitLs = 0.0;
};

PlanetOrbit makePlanetOrbit(core::SplitMix64& rng, const Planet& planet, const Star& star);

// Day length 12-36 h, 20 % retrograde.
sim::Rotating makeHabitableRotation(core::SplitMix64& rng);

} // namespace orrery::proc
