#include "orrery/sim/Observatory.h"

#include "orrery/core/Log.h"
#include "orrery/math/Math.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace orrery::sim {

Observatory::Observatory(const math::Spherical& location, std::shared_ptr<const BodyTree> tree, BodyId body,
                         std::optional<std::string> name, std::vector<Constellation> constellations)
: m_location(location),
  m_toLocal(math::Quatd::rotationFromTo(math::Spherical{1.0, location.polar, location.azimuth}.toCartesian(),
                                        math::kUp)),
  m_tree(std::move(tree)),
  m_body(body),
  m_name(std::move(name)),
  m_constellations(std::move(constellations)) {}

std::vector<LocalObservation> Observatory::observe(double timeHours) const {
  std::vector<LocalObservation> out;
  if (!m_tree) return out;

  const auto raw = m_tree->observationsFrom(m_body, timeHours);
  if (raw.empty()) return out;

  // Spin of the body first, then surface position -> zenith.
  const math::Quatd toLocal = m_toLocal * m_tree->rotationAt(m_body, timeHours);

  out.reserve(raw.size() / 2 + 1);
  for (const auto& o : raw) {
    const math::Vec3d local = toLocal.rotate(o.offset);
    if (local.z < 0.0) continue; // below the horizon
    out.push_back(LocalObservation{o.body, math::Spherical::fromCartesian(local)});
  }
  return out;
}

std::string Observatory::name() const {
  if (m_name) return *m_name;

  const double latitude = 90.0 - math::radToDeg(m_location.polar);
  const double longitude = math::radToDeg(m_location.azimuth);

  std::ostringstream oss;
  oss << (m_tree ? pathToName(m_tree->pathOf(m_body)) : std::string("detached"))
      << "@" << std::fixed << std::setprecision(2) << latitude << "N" << longitude << "E";
  return oss.str();
}

std::vector<ConstellationLine> Observatory::constellationLines(
    const std::vector<LocalObservation>& observations) const {
  std::vector<ConstellationLine> out;
  if (m_constellations.empty()) return out;

  std::unordered_map<BodyId, std::size_t> visible;
  visible.reserve(observations.size());
  for (std::size_t i = 0; i < observations.size(); ++i) {
    visible.emplace(observations[i].body, i);
  }

  for (const auto& c : m_constellations) {
    for (const auto& [a, b] : c.edges) {
      const auto ia = visible.find(a);
      const auto ib = visible.find(b);
      if (ia == visible.end() || ib == visible.end()) continue;
      out.push_back(ConstellationLine{a, b, observations[ia->second].position, observations[ib->second].position});
    }
  }
  return out;
}

WeakObservatory Observatory::toWeak() const {
  WeakObservatory weak{};
  weak.location = m_location;
  weak.name = m_name;
  if (m_tree) {
    weak.body = m_tree->pathOf(m_body);
    weak.constellations.reserve(m_constellations.size());
    for (const auto& c : m_constellations) {
      weak.constellations.push_back(sim::toWeak(c, *m_tree));
    }
  }
  return weak;
}

std::optional<Observatory> resolve(const WeakObservatory& weak, const std::shared_ptr<const BodyTree>& tree) {
  if (!tree) return std::nullopt;

  const auto body = tree->find(weak.body);
  if (!body) {
    core::log(core::LogLevel::Warn,
              "Observatory " + weak.name.value_or("<unnamed>") + ": body " + pathToName(weak.body) +
              " not found, dropping it");
    return std::nullopt;
  }

  std::vector<Constellation> constellations;
  constellations.reserve(weak.constellations.size());
  for (const auto& c : weak.constellations) {
    constellations.push_back(resolve(c, *tree));
  }

  return Observatory(weak.location, tree, *body, weak.name, std::move(constellations));
}

std::vector<Observatory> resolveAll(const std::vector<WeakObservatory>& weak,
                                    const std::shared_ptr<const BodyTree>& tree) {
  std::vector<Observatory> out;
  out.reserve(weak.size());
  for (const auto& w : weak) {
    if (auto o = resolve(w, tree)) out.push_back(std::move(*o));
  }
  return out;
}

} // namespace orrery::sim
