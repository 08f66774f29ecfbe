#pragma once

#include "orrery/math/Quat.h"
#include "orrery/math/Spherical.h"
#include "orrery/sim/BodyTree.h"
#include "orrery/sim/Constellation.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orrery::sim {

// A body as seen from an observatory: polar angle from the zenith,
// azimuth in the local horizon plane, radius = distance in ls.
struct LocalObservation {
  BodyId body = kNoBody;
  math::Spherical position{};
};

struct ConstellationLine {
  BodyId from = kNoBody;
  BodyId to = kNoBody;
  math::Spherical start{};
  math::Spherical end{};
};

// Persisted form of an observatory; the body is referenced by path.
struct WeakObservatory {
  math::Spherical location = math::kSphericalUp;
  BodyPath body;
  std::optional<std::string> name;
  std::vector<WeakConstellation> constellations;
};

// Fixed point on a body's surface.
class Observatory {
public:
  Observatory(const math::Spherical& location, std::shared_ptr<const BodyTree> tree, BodyId body,
              std::optional<std::string> name = std::nullopt,
              std::vector<Constellation> constellations = {});

  const math::Spherical& location() const { return m_location; }
  BodyId body() const { return m_body; }
  const std::shared_ptr<const BodyTree>& tree() const { return m_tree; }
  const std::optional<std::string>& userName() const { return m_name; }
  const std::vector<Constellation>& constellations() const { return m_constellations; }

  // Bodies above the local horizon at `timeHours`, in traversal order.
  // A poisoned tree yields an empty list.
  std::vector<LocalObservation> observe(double timeHours) const;

  // User name, or "<body path>@<lat>N<long>E". Walks the tree; cache it.
  std::string name() const;

  std::vector<ConstellationLine> constellationLines(const std::vector<LocalObservation>& observations) const;

  WeakObservatory toWeak() const;

private:
  math::Spherical m_location;
  math::Quatd m_toLocal;
  std::shared_ptr<const BodyTree> m_tree;
  BodyId m_body = kNoBody;
  std::optional<std::string> m_name;
  std::vector<Constellation> m_constellations;
};

// Unresolvable body path: warning and std::nullopt.
std::optional<Observatory> resolve(const WeakObservatory& weak, const std::shared_ptr<const BodyTree>& tree);

// Resolves each entry, dropping the ones that fail.
std::vector<Observatory> resolveAll(const std::vector<WeakObservatory>& weak,
                                    const std::shared_ptr<const BodyTree>& tree);

} // namespace orrery::sim
