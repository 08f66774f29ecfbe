#include "orrery/proc/Moon.h"

#include "orrery/math/Math.h"
#include "orrery/sim/Units.h"

#include <algorithm>
#include <cmath>

namespace orrery::proc {
namespace {
  constexpr double kSphereVolume = 4.0 / 3.0 * math::pi;
  constexpr double kIcyMinDensity = 21.3;

  // Number of minor moons a rocky planet may hold at its distance.
  int minorMoonBudget(const Planet& planet, const Star& star) {
    const double x = planet.semiMajorAxisLs / star.planetaryZoneLs.end;
    return static_cast<int>(std::floor(std::pow(2.0, x) * x * 6.0));
  }

  void fill(core::SplitMix64& rng, int count, bool major, const Planet& parent, double hillLimitLs,
            std::vector<Moon>& moons) {
    for (int i = 0; i < count; ++i) {
      const bool icy = rng.chance(0.1);
      auto moon = placeMoon(rng, major, icy, parent, hillLimitLs, moons);
      if (!moon) break; // orbits are full
      moons.push_back(*moon);
    }
  }
} // namespace

double sphereMass(double radiusLs, double density) {
  return radiusLs * radiusLs * radiusLs * kSphereVolume * density;
}

std::optional<Moon> placeMoon(core::SplitMix64& rng, bool major, bool icy, const Planet& parent,
                              double hillLimitLs, const std::vector<Moon>& existing) {
  const double density = icy ? rng.range(14.195, 28.39) : kLunaDensity * rng.range(0.95, 1.05);

  Moon m{};
  double limit = hillLimitLs;
  if (major) {
    const double maxRadius = parent.radiusLs * 0.75;
    if (!(maxRadius > 0.001001)) return std::nullopt;
    m.radiusLs = rng.range(0.001001, maxRadius);
    m.kind = icy ? MoonKind::MajorIcy : MoonKind::MajorRocky;
    if (parent.kind != PlanetKind::GasGiant) limit /= 2.0;
  } else {
    m.radiusLs = sim::units::kmToLs(rng.range(200.0, 300.0));
    m.kind = icy ? MoonKind::MinorIcy : MoonKind::MinorRocky;
  }
  m.massMj = sphereMass(m.radiusLs, density);

  // Margin so the smallest eccentricity used later stays outside the Roche limit.
  const double roche = m.radiusLs * std::cbrt(2.0 * parent.massMj / m.massMj) / 0.996;
  const double corridor = parent.radiusLs * kMoonCorridorRadii;
  const double upper = limit - static_cast<double>(existing.size()) * corridor;
  if (!(upper > roche)) return std::nullopt;

  double distance = rng.range(roche, upper);

  // Walk every placed orbit, including ones far below, so the number of
  // shifts only depends on the draw.
  std::vector<double> placed;
  placed.reserve(existing.size());
  for (const auto& e : existing) placed.push_back(e.semiMajorAxisLs);
  std::sort(placed.begin(), placed.end());
  for (double sma : placed) {
    if (sma - corridor / 2.0 < distance) distance += corridor;
  }
  if (distance > limit) return std::nullopt;

  m.semiMajorAxisLs = distance;
  return m;
}

std::vector<Moon> makeRingMoons(core::SplitMix64& rng, const Planet& parent) {
  std::vector<Moon> out;
  const double R = parent.radiusLs;

  double sma = (1.97 + rng.range(-0.2, 0.2)) * R;
  while (sma - 2.0 * 0.01861 < 2.44 * R) {
    Moon m{};
    m.kind = MoonKind::MinorRocky;
    m.semiMajorAxisLs = sma;
    m.radiusLs = sim::units::kmToLs(rng.range(20.0, 200.0));
    m.massMj = sphereMass(m.radiusLs, kLunaDensity * rng.range(0.95, 1.05));
    out.push_back(m);

    sma += rng.range(0.00532, 0.0319);
  }
  return out;
}

std::vector<Moon> makeOuterMoons(core::SplitMix64& rng, const Planet& parent) {
  std::vector<Moon> out;
  const double R = parent.radiusLs;

  double sma = 3.0 * R;
  while (sma <= 15.0 * R) {
    const bool icy = rng.chance(0.333);
    const double minMass = sphereMass(0.001001, icy ? kIcyMinDensity : kLunaDensity);

    Moon m{};
    m.kind = icy ? MoonKind::MajorIcy : MoonKind::MajorRocky;
    m.semiMajorAxisLs = sma;
    m.massMj = rng.range(minMass, 0.0001 * parent.massMj);
    m.radiusLs = std::cbrt(m.massMj / (kSphereVolume * kLunaDensity));
    out.push_back(m);

    sma += rng.range(R, 5.0 * R);
  }
  return out;
}

std::vector<Moon> generateMoons(core::SplitMix64& rng, const Planet& parent, const Star& star,
                                double hillLimitLs) {
  std::vector<Moon> moons;

  switch (parent.kind) {
    case PlanetKind::GasGiant: {
      moons = makeRingMoons(rng, parent);
      auto outer = makeOuterMoons(rng, parent);
      moons.insert(moons.end(), outer.begin(), outer.end());
      break;
    }
    case PlanetKind::Habitable:
      fill(rng, 1, true, parent, hillLimitLs, moons);
      fill(rng, minorMoonBudget(parent, star), false, parent, hillLimitLs, moons);
      break;
    case PlanetKind::Terrestrial:
    default:
      fill(rng, minorMoonBudget(parent, star), false, parent, hillLimitLs, moons);
      break;
  }
  return moons;
}

sim::KeplerianDynamic makeMoonOrbit(core::SplitMix64& rng, const Moon& moon, const Planet& parent,
                                    double hillLimitLs) {
  const double sma = moon.semiMajorAxisLs;

  double inclination = 0.0;
  double eccentricity = 0.0;
  if (!moon.major()) {
    inclination = math::degToRad(rng.range(-5.0, 5.0));
    eccentricity = rng.range(0.0, 0.08);
  } else {
    double maxEccentricity = 0.5;
    if (parent.kind != PlanetKind::GasGiant) {
      const double roche = moon.radiusLs * std::cbrt(2.0 * parent.massMj / moon.massMj);
      const double inner = 1.0 - roche / sma;
      const double outer = hillLimitLs / sma - 1.0;
      maxEccentricity = std::min({inner, outer, 0.5});
    }
    inclination = rng.range(0.0, math::halfPi);
    eccentricity = rng.range(0.001, maxEccentricity);
  }

  sim::OrbitalElements el{};
  el.eccentricity = eccentricity;
  el.semiMajorAxisLs = sma;
  el.inclinationRad = inclination + parent.northPole.polar;
  el.longitudeAscendingNodeRad = parent.northPole.azimuth + math::halfPi + math::degToRad(rng.range(-10.0, 10.0));
  el.argumentPeriapsisRad = rng.angle();
  el.meanAnomalyAtEpochRad = rng.angle();
  return sim::KeplerianDynamic::aroundMass(el, parent.massMj);
}

} // namespace orrery::proc
