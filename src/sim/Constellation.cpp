#include "orrery/sim/Constellation.h"

#include "orrery/core/Log.h"

namespace orrery::sim {

Constellation resolve(const WeakConstellation& weak, const BodyTree& tree) {
  Constellation out{};
  out.name = weak.name;
  out.edges.reserve(weak.edges.size());

  for (const auto& [a, b] : weak.edges) {
    const auto from = tree.find(a);
    const auto to = tree.find(b);
    if (!from || !to) {
      core::log(core::LogLevel::Warn,
                "Constellation " + weak.name.value_or("<unnamed>") + ": dropping edge " +
                pathToName(a) + " -> " + pathToName(b) + " (body not found)");
      continue;
    }
    out.edges.emplace_back(*from, *to);
  }
  return out;
}

WeakConstellation toWeak(const Constellation& constellation, const BodyTree& tree) {
  WeakConstellation out{};
  out.name = constellation.name;
  out.edges.reserve(constellation.edges.size());
  for (const auto& [a, b] : constellation.edges) {
    out.edges.emplace_back(tree.pathOf(a), tree.pathOf(b));
  }
  return out;
}

} // namespace orrery::sim
