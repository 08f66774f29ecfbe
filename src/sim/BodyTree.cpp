#include "orrery/sim/BodyTree.h"

#include "orrery/core/Assert.h"
#include "orrery/core/Log.h"
#include "orrery/math/Math.h"

#include <cmath>
#include <string>

namespace orrery::sim {

std::string pathToName(const BodyPath& path) {
  if (path.empty()) return "root";

  std::string out;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i > 0) out += '-';
    out += std::to_string(path[i]);
  }
  return out;
}

BodyId BodyTree::Editor::addBody(BodyId parent, Dynamic dynamic) {
  if (parent >= m_bodies.size()) {
    core::log(core::LogLevel::Error, "BodyTree: cannot attach to unknown parent " + std::to_string(parent));
    return kNoBody;
  }

  const auto id = static_cast<BodyId>(m_bodies.size());
  Body b{};
  b.dynamic = std::move(dynamic);
  b.parent = parent;
  m_bodies.push_back(std::move(b));
  m_bodies[parent].children.push_back(id);
  return id;
}

bool BodyTree::Editor::setRotation(BodyId id, const Rotating& rotation) {
  if (id >= m_bodies.size()) return false;
  m_bodies[id].rotation = rotation;
  return true;
}

bool BodyTree::Editor::setRadius(BodyId id, double radiusLs) {
  if (id >= m_bodies.size() || !(radiusLs > 0.0)) return false;
  m_bodies[id].radiusLs = radiusLs;
  return true;
}

bool BodyTree::Editor::setName(BodyId id, std::string name) {
  if (id >= m_bodies.size()) return false;
  m_bodies[id].name = BodyName{NameState::Named, std::move(name)};
  return true;
}

BodyTree::BodyTree(Dynamic rootDynamic) {
  Body root{};
  root.dynamic = std::move(rootDynamic);
  m_bodies.push_back(std::move(root));
}

std::shared_ptr<BodyTree> BodyTree::fromBodies(std::vector<Body> bodies) {
  if (bodies.empty()) {
    core::log(core::LogLevel::Error, "BodyTree: no bodies to rebuild from");
    return nullptr;
  }

  // Every non-root body must be listed as a child exactly once.
  const std::size_t n = bodies.size();
  std::vector<core::u32> referenced(n, 0);
  for (const auto& b : bodies) {
    for (BodyId c : b.children) {
      if (c == kRoot || c >= n || ++referenced[c] > 1) {
        core::log(core::LogLevel::Error, "BodyTree: bad child reference " + std::to_string(c));
        return nullptr;
      }
    }
  }

  // With single references, a node missing from the walk sits on a cycle.
  std::size_t reached = 0;
  std::vector<BodyId> stack{kRoot};
  while (!stack.empty()) {
    const BodyId id = stack.back();
    stack.pop_back();
    ++reached;
    for (BodyId c : bodies[id].children) stack.push_back(c);
  }
  if (reached != n) {
    core::log(core::LogLevel::Error, "BodyTree: " + std::to_string(n - reached) + " bodies unreachable from the root");
    return nullptr;
  }

  auto tree = std::make_shared<BodyTree>();
  tree->m_bodies = std::move(bodies);
  for (auto& b : tree->m_bodies) b.parent = kNoBody;
  tree->hydrateAll();
  return tree;
}

BodyId BodyTree::addBody(BodyId parent, Dynamic dynamic) {
  return edit([&](Editor& e) { return e.addBody(parent, std::move(dynamic)); });
}

bool BodyTree::setRotation(BodyId id, const Rotating& rotation) {
  return edit([&](Editor& e) { return e.setRotation(id, rotation); });
}

bool BodyTree::setRadius(BodyId id, double radiusLs) {
  return edit([&](Editor& e) { return e.setRadius(id, radiusLs); });
}

bool BodyTree::setName(BodyId id, std::string name) {
  return edit([&](Editor& e) { return e.setName(id, std::move(name)); });
}

void BodyTree::hydrateAll() {
  std::unique_lock<std::shared_mutex> lock(m_mutex);
  PoisonOnUnwind guard(m_poisoned);

  m_bodies[kRoot].parent = kNoBody;
  BodyPath path;
  hydrate(kRoot, path);
  guard.commit();
}

void BodyTree::hydrate(BodyId id, BodyPath& path) {
  Body& b = m_bodies[id];
  if (b.name.state != NameState::Named) {
    b.name = BodyName{NameState::Derived, pathToName(path)};
  }

  for (std::size_t i = 0; i < b.children.size(); ++i) {
    const BodyId child = m_bodies[id].children[i];
    m_bodies[child].parent = id;
    path.push_back(static_cast<core::u32>(i));
    hydrate(child, path);
    path.pop_back();
  }
}

std::size_t BodyTree::size() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return m_bodies.size();
}

bool BodyTree::contains(BodyId id) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return id < m_bodies.size();
}

std::optional<Body> BodyTree::body(BodyId id) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  if (id >= m_bodies.size()) return std::nullopt;
  return m_bodies[id];
}

std::vector<Body> BodyTree::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return m_bodies;
}

BodyId BodyTree::parentOf(BodyId id) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  if (id >= m_bodies.size()) return kNoBody;
  return m_bodies[id].parent;
}

BodyPath BodyTree::pathOf(BodyId id) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  BodyPath path;
  if (id >= m_bodies.size()) return path;

  BodyId current = id;
  while (m_bodies[current].parent != kNoBody) {
    const BodyId parent = m_bodies[current].parent;
    const auto& siblings = m_bodies[parent].children;

    std::size_t index = siblings.size();
    for (std::size_t i = 0; i < siblings.size(); ++i) {
      if (siblings[i] == current) {
        index = i;
        break;
      }
    }
    ORRERY_ASSERT_MSG(index < siblings.size(), "parent link points at a body that does not list this child");

    path.push_back(static_cast<core::u32>(index));
    current = parent;
  }

  return BodyPath(path.rbegin(), path.rend());
}

std::optional<BodyId> BodyTree::find(const BodyPath& path) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  if (!readable("find")) return std::nullopt;

  BodyId current = kRoot;
  for (core::u32 index : path) {
    const auto& children = m_bodies[current].children;
    if (index >= children.size()) return std::nullopt;
    current = children[index];
  }
  return current;
}

std::string BodyTree::nameOf(BodyId id) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  ORRERY_ASSERT_MSG(id < m_bodies.size(), "nameOf: unknown body id");

  const BodyName& name = m_bodies[id].name;
  ORRERY_ASSERT_MSG(name.resolved(), "body name read before hydrateAll()");
  return name.text;
}

bool BodyTree::readable(const char* operation) const {
  if (!m_poisoned.load()) return true;
  core::log(core::LogLevel::Warn, std::string("BodyTree: ") + operation + " on a poisoned tree, returning nothing");
  return false;
}

std::vector<Observation> BodyTree::observationsFrom(BodyId id, double timeHours) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  std::vector<Observation> out;
  if (!readable("observationsFrom") || id >= m_bodies.size()) return out;
  out.reserve(m_bodies.size() - 1);

  traverseDown(id, math::Vec3d{}, timeHours, out);

  const BodyId parent = m_bodies[id].parent;
  if (parent != kNoBody) {
    const math::Vec3d own = sim::offsetAt(m_bodies[id].dynamic, timeHours);
    traverseUp(parent, id, -own, timeHours, out);
  }
  return out;
}

// Descendants of `id`, deepest first. `origin` is the position of `id`
// relative to the observer.
void BodyTree::traverseDown(BodyId id, const math::Vec3d& origin, double timeHours,
                            std::vector<Observation>& out) const {
  for (BodyId child : m_bodies[id].children) {
    const math::Vec3d offset = origin + sim::offsetAt(m_bodies[child].dynamic, timeHours);
    traverseDown(child, offset, timeHours, out);
    out.push_back(Observation{child, offset});
  }
}

// Everything reachable through ancestor `id` except the subtree of `cameFrom`,
// which has already been covered.
void BodyTree::traverseUp(BodyId id, BodyId cameFrom, const math::Vec3d& origin, double timeHours,
                          std::vector<Observation>& out) const {
  for (BodyId child : m_bodies[id].children) {
    if (child == cameFrom) continue;
    const math::Vec3d offset = origin + sim::offsetAt(m_bodies[child].dynamic, timeHours);
    traverseDown(child, offset, timeHours, out);
    out.push_back(Observation{child, offset});
  }

  out.push_back(Observation{id, origin});

  // The root is the one body without a parent; the walk ends there.
  const BodyId parent = m_bodies[id].parent;
  if (parent == kNoBody) return;

  const math::Vec3d own = sim::offsetAt(m_bodies[id].dynamic, timeHours);
  traverseUp(parent, id, origin - own, timeHours, out);
}

math::Quatd BodyTree::rotationAt(BodyId id, double timeHours) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  if (id >= m_bodies.size() || !m_bodies[id].rotation) return math::Quatd::identity();
  return m_bodies[id].rotation->rotationAt(timeHours);
}

double BodyTree::angularRadius(BodyId id, double distanceLs) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  if (id >= m_bodies.size() || !m_bodies[id].radiusLs) return kFallbackAngularRadius;

  const double r = *m_bodies[id].radiusLs;
  if (distanceLs <= r) return math::halfPi;
  return std::asin(r / distanceLs);
}

} // namespace orrery::sim
