#pragma once

#include "orrery/core/Random.h"
#include "orrery/math/Spherical.h"

namespace orrery::proc {

// Half-open [start, end).
struct Interval {
  double start = 0.0;
  double end = 0.0;

  bool contains(double v) const { return v >= start && v < end; }
  bool empty() const { return !(end > start); }
};

// Main-sequence star with the zones the planet generator needs.
// Distances in ls, mass in MJ unless the field says otherwise.
struct Star {
  double massSolar = 1.0;
  double massMj = 1048.0;
  double luminositySolar = 1.0;
  double radiusLs = 2.32;

  Interval habitableZoneLs{};
  Interval planetaryZoneLs{};
  double frostLineLs = 0.0;

  // Mass in [0.6, 1.4) solar masses: long-lived enough for water-based life.
  bool habitable = false;

  // Normal of the system's ecliptic.
  math::Spherical northPole = math::kSphericalUp;
};

// Derives every zone from the mass; draws the north pole (2 draws).
Star starFromMass(double massSolar, core::SplitMix64& rng);

// Ordinary stars: U[0.02, 16) solar masses.
// Habitable-capable stars: U[0.6, 1.4) solar masses.
Star makeStar(core::SplitMix64& rng, bool habitableCapable);

} // namespace orrery::proc
