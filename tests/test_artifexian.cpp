#include "orrery/io/TreeFile.h"
#include "orrery/proc/Artifexian.h"
#include "orrery/proc/GalacticDisk.h"
#include "orrery/proc/Moon.h"
#include "orrery/proc/Planet.h"
#include "orrery/proc/Star.h"
#include "orrery/sim/Units.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <variant>
#include <vector>

int test_artifexian() {
  using namespace orrery;
  using namespace orrery::proc;

  int fails = 0;

  // Same seed and size: byte-identical saves. Another seed: a different galaxy.
  {
    ArtifexianConfig cfg{};
    cfg.starCount = 300;
    cfg.habitableEvery = 50;
    const ArtifexianGenerator gen(cfg);

    std::ostringstream a;
    std::ostringstream b;
    std::ostringstream c;
    io::writeTree(a, *gen.generate(2024).tree);
    io::writeTree(b, *gen.generate(2024).tree);
    io::writeTree(c, *gen.generate(2025).tree);

    if (a.str() != b.str()) {
      std::cerr << "[test_artifexian] same seed produced different trees\n";
      ++fails;
    }
    if (a.str() == c.str()) {
      std::cerr << "[test_artifexian] different seeds produced the same tree\n";
      ++fails;
    }
  }

  // Default galaxy.
  {
    ArtifexianConfig cfg{};
    cfg.starCount = 1000;
    const auto universe = ArtifexianGenerator(cfg).generate(42123);
    const auto root = universe.tree->body(sim::BodyTree::kRoot);

    if (!root || root->children.size() != 1000) {
      std::cerr << "[test_artifexian] expected 1000 stars under the root\n";
      ++fails;
    } else {
      std::size_t withChildren = 0;
      std::size_t notFixed = 0;
      for (sim::BodyId id : root->children) {
        const auto star = universe.tree->body(id);
        if (!star) continue;
        if (!sim::isFixed(star->dynamic)) ++notFixed;
        if (!star->children.empty()) ++withChildren;
      }
      if (notFixed != 0) {
        std::cerr << "[test_artifexian] " << notFixed << " stars are not fixed\n";
        ++fails;
      }
      if (withChildren < 10) {
        std::cerr << "[test_artifexian] only " << withChildren << " stars have planets\n";
        ++fails;
      }
    }

    if (universe.stats.stars != 1000 || universe.tree->size() !=
        1 + universe.stats.stars + universe.stats.planets + universe.stats.moons) {
      std::cerr << "[test_artifexian] stats do not match the tree\n";
      ++fails;
    }

    if (universe.observatories.empty() || universe.observatories.size() > 10) {
      std::cerr << "[test_artifexian] expected 1..10 observatories got " << universe.observatories.size() << "\n";
      ++fails;
    }
    for (const auto& o : universe.observatories) {
      const auto planet = universe.tree->body(o.body());
      if (!planet || !planet->rotation) {
        std::cerr << "[test_artifexian] observatory body has no rotation\n";
        ++fails;
      }
      if (o.observe(0.0).empty()) {
        std::cerr << "[test_artifexian] observatory " << o.name() << " sees nothing\n";
        ++fails;
      }
    }
  }

  // Moons of rocky planets keep their orbit corridors apart.
  {
    const auto checkClearance = [&fails](const Planet& planet, const std::vector<Moon>& moons, double hillLimitLs,
                                         const char* where) {
      std::size_t pairs = 0;
      const double clearance = planet.radiusLs * kMoonCorridorRadii / 2.0;
      for (std::size_t i = 0; i < moons.size(); ++i) {
        if (moons[i].semiMajorAxisLs > hillLimitLs * (1.0 + 1e-12)) {
          std::cerr << "[test_artifexian] " << where << ": moon outside the Hill limit\n";
          ++fails;
        }
        for (std::size_t j = i + 1; j < moons.size(); ++j) {
          ++pairs;
          const double gap = std::abs(moons[i].semiMajorAxisLs - moons[j].semiMajorAxisLs);
          if (gap < clearance * (1.0 - 1e-9)) {
            std::cerr << "[test_artifexian] " << where << ": moons " << gap / planet.radiusLs << " radii apart\n";
            ++fails;
          }
        }
      }
      return pairs;
    };

    for (core::u64 seed = 1; seed <= 200; ++seed) {
      core::SplitMix64 rng(seed);
      const Star star = makeStar(rng, true);
      for (const auto& planet : generatePlanets(rng, star)) {
        const PlanetOrbit orbit = makePlanetOrbit(rng, planet, star);
        const auto moons = generateMoons(rng, planet, star, orbit.hillLimitLs);
        if (planet.kind != PlanetKind::GasGiant) checkClearance(planet, moons, orbit.hillLimitLs, "generated");
      }
    }

    // Crowded orbit space: keep placing until the Hill sphere is full.
    core::SplitMix64 rng(31);
    const Planet planet = makeTerrestrial(rng, sim::units::auToLs(3.0));
    const double hill = planet.radiusLs * 400.0;
    std::vector<Moon> moons;
    for (int i = 0; i < 40; ++i) {
      const auto moon = placeMoon(rng, false, rng.chance(0.1), planet, hill, moons);
      if (!moon) break;
      moons.push_back(*moon);
    }
    if (checkClearance(planet, moons, hill, "crowded") == 0) {
      std::cerr << "[test_artifexian] crowded planet got fewer than two moons\n";
      ++fails;
    }
  }

  // Planets: sorted, spaced, with exactly one habitable planet at most.
  {
    core::SplitMix64 rng(77);
    for (int i = 0; i < 50; ++i) {
      const Star star = makeStar(rng, true);
      const auto planets = generatePlanets(rng, star);
      const double spacing = sim::units::auToLs(kMinPlanetSpacingAu);
      const auto habitable = std::count_if(planets.begin(), planets.end(),
                                           [](const Planet& p) { return p.kind == PlanetKind::Habitable; });
      if (planets.empty() || habitable > 1) {
        std::cerr << "[test_artifexian] bad planet list (" << planets.size() << " planets, " << habitable
                  << " habitable)\n";
        ++fails;
        continue;
      }
      for (std::size_t k = 1; k < planets.size(); ++k) {
        if (!(planets[k].semiMajorAxisLs - planets[k - 1].semiMajorAxisLs > spacing)) {
          std::cerr << "[test_artifexian] planets closer than the minimum spacing\n";
          ++fails;
          break;
        }
      }
    }
  }

  // Stars stay inside the disk.
  {
    const GalacticDiskParams disk{};
    core::SplitMix64 rng(5);
    for (int i = 0; i < 2000; ++i) {
      const auto p = sampleStarPosition(disk, rng);
      const double r = std::sqrt(p.x * p.x + p.y * p.y);
      if (r > disk.widthLs * (1.0 + 1e-9) || std::abs(p.z) > allowedHeightLs(disk, r) * (1.0 + 1e-9)) {
        std::cerr << "[test_artifexian] star outside the disk at r=" << r << " z=" << p.z << "\n";
        ++fails;
        break;
      }
    }
  }

  if (fails == 0) std::cout << "[test_artifexian] pass\n";
  return fails;
}
