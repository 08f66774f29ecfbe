#pragma once

#include "orrery/core/Random.h"
#include "orrery/core/Types.h"
#include "orrery/proc/GalacticDisk.h"
#include "orrery/sim/BodyTree.h"
#include "orrery/sim/Observatory.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace orrery::proc {

struct ArtifexianConfig {
  std::size_t starCount = 1000;

  // Every N-th star (by index, starting with the first) gets a planet system
  // around a sun-like mass. Deterministic so small galaxies still have some.
  std::size_t habitableEvery = 100;

  GalacticDiskParams disk{};
};

struct GenerationStats {
  std::size_t stars = 0;
  std::size_t planets = 0;
  std::size_t moons = 0;
};

struct GeneratedUniverse {
  std::shared_ptr<sim::BodyTree> tree;
  std::vector<sim::Observatory> observatories;
  GenerationStats stats{};
};

// Galaxy of main-sequence stars under a fixed root, planet systems for the
// habitable-capable ones, one observatory per habitable planet.
// Output depends only on the config and the generator's state.
class ArtifexianGenerator {
public:
  explicit ArtifexianGenerator(ArtifexianConfig cfg);

  const ArtifexianConfig& config() const { return m_cfg; }

  GeneratedUniverse generate(core::SplitMix64& rng) const;
  GeneratedUniverse generate(core::u64 seed) const;

private:
  ArtifexianConfig m_cfg{};
};

} // namespace orrery::proc
