#include "orrery/proc/Artifexian.h"

#include "orrery/core/Log.h"
#include "orrery/math/Spherical.h"
#include "orrery/proc/Moon.h"
#include "orrery/proc/Planet.h"
#include "orrery/proc/Star.h"

#include <string>

namespace orrery::proc {

ArtifexianGenerator::ArtifexianGenerator(ArtifexianConfig cfg)
: m_cfg(cfg) {
  if (m_cfg.habitableEvery == 0) {
    core::log(core::LogLevel::Warn, "Artifexian: habitableEvery must be positive, using 100");
    m_cfg.habitableEvery = 100;
  }
  if (m_cfg.starCount == 0) {
    core::log(core::LogLevel::Warn, "Artifexian: starCount is 0, the galaxy will be empty");
  }
}

GeneratedUniverse ArtifexianGenerator::generate(core::u64 seed) const {
  core::SplitMix64 rng(seed);
  return generate(rng);
}

GeneratedUniverse ArtifexianGenerator::generate(core::SplitMix64& rng) const {
  GeneratedUniverse out{};
  out.tree = std::make_shared<sim::BodyTree>();

  std::vector<sim::BodyId> habitablePlanets;

  out.tree->edit([&](sim::BodyTree::Editor& editor) {
    for (std::size_t i = 0; i < m_cfg.starCount; ++i) {
      const bool capable = (i % m_cfg.habitableEvery) == 0;
      const Star star = makeStar(rng, capable);

      std::vector<Planet> planets;
      if (capable) {
        planets = generatePlanets(rng, star);
        if (planets.empty()) {
          core::log(core::LogLevel::Warn, "Artifexian: star " + std::to_string(i) + " placed no planets, skipping its system");
        }
      }

      const sim::BodyId starId =
        editor.addBody(sim::BodyTree::kRoot, sim::FixedDynamic{sampleStarPosition(m_cfg.disk, rng)});
      editor.setRadius(starId, star.radiusLs);
      ++out.stats.stars;

      for (const auto& planet : planets) {
        const PlanetOrbit orbit = makePlanetOrbit(rng, planet, star);
        const sim::BodyId planetId = editor.addBody(starId, orbit.dynamic);
        editor.setRadius(planetId, planet.radiusLs);
        ++out.stats.planets;

        for (const auto& moon : generateMoons(rng, planet, star, orbit.hillLimitLs)) {
          const sim::BodyId moonId = editor.addBody(planetId, makeMoonOrbit(rng, moon, planet, orbit.hillLimitLs));
          editor.setRadius(moonId, moon.radiusLs);
          ++out.stats.moons;
        }

        if (planet.kind == PlanetKind::Habitable) {
          editor.setRotation(planetId, makeHabitableRotation(rng));
          habitablePlanets.push_back(planetId);
        }
      }

      if (capable) {
        core::log(core::LogLevel::Debug,
                  "Artifexian: star " + std::to_string(i) + " mass " + std::to_string(star.massSolar) +
                  " Msol with " + std::to_string(planets.size()) + " planets");
      }
    }
  });

  out.tree->hydrateAll();

  out.observatories.reserve(habitablePlanets.size());
  for (sim::BodyId id : habitablePlanets) {
    out.observatories.emplace_back(math::kSphericalForward, out.tree, id);
  }

  core::log(core::LogLevel::Info,
            "Artifexian: " + std::to_string(out.stats.stars) + " stars, " +
            std::to_string(out.stats.planets) + " planets, " +
            std::to_string(out.stats.moons) + " moons, " +
            std::to_string(out.observatories.size()) + " observatories");
  return out;
}

} // namespace orrery::proc
