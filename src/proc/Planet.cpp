#include "orrery/proc/Planet.h"

#include "orrery/math/Math.h"
#include "orrery/math/Quat.h"
#include "orrery/sim/Units.h"

#include <algorithm>
#include <cmath>

namespace orrery::proc {
namespace {
  math::Spherical randomPole(core::SplitMix64& rng) {
    const double polar = rng.range(0.0, math::pi);
    const double azimuth = rng.angle();
    return {1.0, polar, azimuth};
  }

  void gasGiantMassRadius(core::SplitMix64& rng, Planet& p) {
    p.massMj = rng.range(sim::units::earthToJupiterMasses(10.0), 13.0);
    p.radiusLs = 0.2333 * (p.massMj >= 2.0 ? rng.range(0.98, 1.02) : rng.range(1.0, 1.9));
  }

  // Radius bounded so surface gravity stays plausible.
  void terrestrialMassRadius(core::SplitMix64& rng, Planet& p) {
    const double massEarth = rng.range(0.18, 3.5);
    const double lo = std::max(std::sqrt(0.4 / massEarth), 0.5);
    const double hi = std::min(std::sqrt(1.6 / massEarth), 1.5);
    const double radiusEarth = massEarth * rng.range(lo, hi);

    p.massMj = sim::units::earthToJupiterMasses(massEarth);
    p.radiusLs = sim::units::earthRadiiToLs(radiusEarth);
  }

  Planet firstGasGiant(core::SplitMix64& rng, const Star& star) {
    const double sma = star.frostLineLs + sim::units::auToLs(rng.range(1.0, 1.2));
    return makeGasGiant(rng, sma);
  }
} // namespace

Planet makeGasGiant(core::SplitMix64& rng, double semiMajorAxisLs) {
  Planet p{};
  p.kind = PlanetKind::GasGiant;
  p.semiMajorAxisLs = semiMajorAxisLs;
  gasGiantMassRadius(rng, p);
  p.northPole = randomPole(rng);
  return p;
}

Planet makeTerrestrial(core::SplitMix64& rng, double semiMajorAxisLs) {
  Planet p{};
  p.kind = PlanetKind::Terrestrial;
  p.semiMajorAxisLs = semiMajorAxisLs;
  terrestrialMassRadius(rng, p);
  p.northPole = randomPole(rng);
  return p;
}

std::optional<Planet> makeHabitable(core::SplitMix64& rng, const Star& star) {
  if (!star.habitable) return std::nullopt;

  Planet p{};
  p.kind = PlanetKind::Habitable;
  // Margins keep the eccentricity range below non-empty.
  p.semiMajorAxisLs = rng.range(star.habitableZoneLs.start / 0.996, star.habitableZoneLs.end / 1.003);
  terrestrialMassRadius(rng, p);

  double polar = math::degToRad(rng.range(-80.0, 80.0));
  if (rng.chance(0.1)) polar += math::pi;
  const double azimuth = rng.angle();

  // Tilt relative to the ecliptic, then into the star's frame.
  const math::Vec3d local = math::Spherical{1.0, polar, azimuth}.toCartesian();
  const auto toStar = math::Quatd::rotationFromTo(math::kUp, star.northPole.toCartesian());
  p.northPole = math::Spherical::fromCartesian(toStar.rotate(local));
  return p;
}

std::vector<Planet> generatePlanets(core::SplitMix64& rng, const Star& star) {
  const Interval& zone = star.planetaryZoneLs;

  std::vector<Planet> planets;
  const Planet first = firstGasGiant(rng, star);
  planets.push_back(first);

  // Outward: more gas giants.
  double distance = first.semiMajorAxisLs * rng.range(1.4, 2.0);
  while (zone.contains(distance)) {
    planets.push_back(makeGasGiant(rng, distance));
    distance *= rng.range(1.4, 2.0);
  }

  // Inward: the habitable planet, then terrestrial planets around its band.
  const auto habitable = makeHabitable(rng, star);
  bool placed = false;

  distance = first.semiMajorAxisLs / rng.range(1.4, 2.0);
  while (zone.contains(distance)) {
    if (habitable) {
      const double sma = habitable->semiMajorAxisLs;
      const bool inBand = distance > sma / 1.4 && distance < sma * 1.4;

      if (!placed && inBand) {
        planets.push_back(*habitable);
        placed = true;
        distance = sma;
      } else if (!placed && distance < sma) {
        planets.push_back(*habitable);
        placed = true;
        planets.push_back(makeTerrestrial(rng, distance));
      } else if (!inBand) {
        planets.push_back(makeTerrestrial(rng, distance));
      }
    } else {
      planets.push_back(makeTerrestrial(rng, distance));
    }
    distance /= rng.range(1.4, 2.0);
  }

  if (habitable && !placed) planets.push_back(*habitable);

  std::sort(planets.begin(), planets.end(), [](const Planet& a, const Planet& b) {
    return a.semiMajorAxisLs < b.semiMajorAxisLs;
  });

  const double minSpacing = sim::units::auToLs(kMinPlanetSpacingAu);
  std::vector<Planet> kept;
  kept.reserve(planets.size());
  for (const auto& p : planets) {
    if (kept.empty() || kept.back().semiMajorAxisLs < p.semiMajorAxisLs - minSpacing) {
      kept.push_back(p);
    }
  }
  return kept;
}

PlanetOrbit makePlanetOrbit(core::SplitMix64& rng, const Planet& planet, const Star& star) {
  const double sma = planet.semiMajorAxisLs;
  const double ecliptic = star.northPole.polar;

  sim::OrbitalElements el{};
  el.semiMajorAxisLs = sma;
  el.longitudeAscendingNodeRad =
    star.northPole.azimuth + math::halfPi + rng.range(-math::pi / 8.0, math::pi / 8.0) / 2.0;

  switch (planet.kind) {
    case PlanetKind::GasGiant:
      el.inclinationRad = ecliptic + math::degToRad(rng.range(-4.0, 4.0));
      el.eccentricity = rng.range(0.001, 0.1);
      break;
    case PlanetKind::Habitable: {
      // Keep the whole orbit inside the habitable zone.
      const double inner = 1.0 - star.habitableZoneLs.start / sma;
      const double outer = star.habitableZoneLs.end / sma - 1.0;
      el.inclinationRad = ecliptic + math::degToRad(rng.range(-10.0, 10.0));
      el.eccentricity = rng.range(0.00001, std::min({inner, outer, 0.2}));
      break;
    }
    case PlanetKind::Terrestrial:
    default:
      el.inclinationRad = ecliptic + math::degToRad(rng.range(-10.0, 10.0));
      el.eccentricity = rng.range(0.0, 0.25);
      break;
  }

  el.argumentPeriapsisRad = rng.angle();
  el.meanAnomalyAtEpochRad = rng.angle();

  PlanetOrbit out{sim::KeplerianDynamic::aroundMass(el, star.massMj), 0.0};
  const double m = planet.massMj;
  out.hillLimitLs = sma * (1.0 - out.dynamic.eccentricity()) * std::cbrt(m / (3.0 * (m + star.massMj)));
  return out;
}

sim::Rotating makeHabitableRotation(core::SplitMix64& rng) {
  const double period = rng.range(12.0, 36.0);
  double tiltDeg = rng.range(0.0, 80.0);
  if (rng.chance(0.2)) tiltDeg += 100.0;
  const double azimuth = rng.angle();
  const math::Spherical axis{1.0, math::degToRad(tiltDeg), azimuth};
  return sim::Rotating(period, axis.toCartesian());
}

} // namespace orrery::proc
