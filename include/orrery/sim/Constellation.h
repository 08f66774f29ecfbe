#pragma once

#include "orrery/sim/BodyTree.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orrery::sim {

// Decorative edges between bodies; only used for drawing output.
struct Constellation {
  std::optional<std::string> name;
  std::vector<std::pair<BodyId, BodyId>> edges;
};

// Persisted form: edges refer to bodies by path.
struct WeakConstellation {
  std::optional<std::string> name;
  std::vector<std::pair<BodyPath, BodyPath>> edges;
};

// Edges whose ends do not resolve are dropped with a warning.
Constellation resolve(const WeakConstellation& weak, const BodyTree& tree);
WeakConstellation toWeak(const Constellation& constellation, const BodyTree& tree);

} // namespace orrery::sim
