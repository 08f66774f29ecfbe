#pragma once

#include "orrery/core/Random.h"
#include "orrery/core/Types.h"
#include "orrery/proc/Planet.h"
#include "orrery/proc/Star.h"
#include "orrery/sim/Dynamic.h"

#include <optional>
#include <vector>

namespace orrery::proc {

enum class MoonKind : core::u8 {
  MinorRocky = 0, // Deimos
  MinorIcy   = 1, // ring bodies
  MajorRocky = 2, // Luna
  MajorIcy   = 3  // Europa
};

struct Moon {
  MoonKind kind = MoonKind::MinorRocky;
  double radiusLs = 0.0;
  double massMj = 0.0;
  double semiMajorAxisLs = 0.0;

  bool major() const { return kind == MoonKind::MajorRocky || kind == MoonKind::MajorIcy; }
};

// MJ per ls^3
inline constexpr double kLunaDensity = 47.47;

// Orbit corridor reserved around each placed moon is 20 planet radii wide.
inline constexpr double kMoonCorridorRadii = 20.0;

double sphereMass(double radiusLs, double density);

// One moon around a terrestrial or habitable planet, shifted outward past the
// corridors of `existing`. std::nullopt when no orbit is left inside the
// Hill limit (halved for major moons).
std::optional<Moon> placeMoon(core::SplitMix64& rng, bool major, bool icy, const Planet& parent,
                              double hillLimitLs, const std::vector<Moon>& existing);

// Gas giant populations: close ring-like minor moons and wider major moons.
std::vector<Moon> makeRingMoons(core::SplitMix64& rng, const Planet& parent);
std::vector<Moon> makeOuterMoons(core::SplitMix64& rng, const Planet& parent);

std::vector<Moon> generateMoons(core::SplitMix64& rng, const Planet& parent, const Star& star,
                                double hillLimitLs);

sim::KeplerianDynamic makeMoonOrbit(core::SplitMix64& rng, const Moon& moon, const Planet& parent,
                                    double hillLimitLs);

} // namespace orrery::proc
