#pragma once

#include "orrery/core/Types.h"
#include "orrery/math/Quat.h"
#include "orrery/math/Vec3.h"
#include "orrery/sim/Dynamic.h"
#include "orrery/sim/Rotating.h"

#include <atomic>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace orrery::sim {

// Index into the tree's arena. Stable for the lifetime of the tree.
using BodyId = core::u32;
inline constexpr BodyId kNoBody = std::numeric_limits<BodyId>::max();

// Child indices from the root down to a body. The root's path is empty.
using BodyPath = std::vector<core::u32>;

// "12-0-3", or "root" for the empty path.
std::string pathToName(const BodyPath& path);

enum class NameState : core::u8 {
  Unknown = 0,
  Named   = 1, // given by a user, persisted
  Derived = 2  // computed from the path by hydrateAll()
};

struct BodyName {
  NameState state = NameState::Unknown;
  std::string text;

  bool resolved() const { return state != NameState::Unknown; }
};

struct Body {
  Dynamic dynamic{};
  std::optional<Rotating> rotation;
  std::optional<double> radiusLs;
  BodyName name{};

  BodyId parent = kNoBody;
  std::vector<BodyId> children;
};

// Offset of a body relative to the observing body, global frame.
struct Observation {
  BodyId body = kNoBody;
  math::Vec3d offset{};
};

// Arena-backed body hierarchy shared by the generator, observatories and
// serializers through std::shared_ptr.
//
// All reads take a shared lock. Mutations run inside edit(), which holds the
// exclusive lock; an exception escaping an edit poisons the tree, after which
// observation queries log a warning and return empty results.
class BodyTree {
public:
  static constexpr BodyId kRoot = 0;
  static constexpr double kFallbackAngularRadius = 0.01;

  // Mutation handle, only valid inside edit().
  class Editor {
  public:
    // Unknown parent: logs an error and returns kNoBody.
    BodyId addBody(BodyId parent, Dynamic dynamic);
    bool setRotation(BodyId id, const Rotating& rotation);
    bool setRadius(BodyId id, double radiusLs);
    bool setName(BodyId id, std::string name);

    std::size_t size() const { return m_bodies.size(); }

  private:
    friend class BodyTree;
    explicit Editor(std::vector<Body>& bodies) : m_bodies(bodies) {}

    std::vector<Body>& m_bodies;
  };

  explicit BodyTree(Dynamic rootDynamic = FixedDynamic{});

  BodyTree(const BodyTree&) = delete;
  BodyTree& operator=(const BodyTree&) = delete;

  // Rebuilds a tree from bodies whose child lists are filled in (bodies[0] is
  // the root). Parent links and derived names come from hydrateAll(). Returns
  // nullptr when the child lists do not describe a single tree.
  static std::shared_ptr<BodyTree> fromBodies(std::vector<Body> bodies);

  template <typename Fn>
  decltype(auto) edit(Fn&& fn) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    PoisonOnUnwind guard(m_poisoned);
    Editor editor(m_bodies);
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Editor&>>) {
      fn(editor);
      guard.commit();
    } else {
      auto result = fn(editor);
      guard.commit();
      return result;
    }
  }

  // Single-operation conveniences around edit().
  BodyId addBody(BodyId parent, Dynamic dynamic);
  bool setRotation(BodyId id, const Rotating& rotation);
  bool setRadius(BodyId id, double radiusLs);
  bool setName(BodyId id, std::string name);

  // Reattaches every parent link depth-first and resolves unnamed bodies to
  // their path names. Idempotent.
  void hydrateAll();

  std::size_t size() const;
  bool contains(BodyId id) const;
  bool poisoned() const { return m_poisoned.load(); }

  std::optional<Body> body(BodyId id) const;
  std::vector<Body> snapshot() const;
  BodyId parentOf(BodyId id) const;

  // Walks the ancestors scanning child lists. Not for per-frame code.
  BodyPath pathOf(BodyId id) const;
  std::optional<BodyId> find(const BodyPath& path) const;

  // Aborts if the body was never hydrated.
  std::string nameOf(BodyId id) const;

  // Every other body, relative to `id`, in the global frame.
  std::vector<Observation> observationsFrom(BodyId id, double timeHours) const;

  math::Quatd rotationAt(BodyId id, double timeHours) const;
  double angularRadius(BodyId id, double distanceLs) const;

private:
  class PoisonOnUnwind {
  public:
    explicit PoisonOnUnwind(std::atomic<bool>& flag) : m_flag(flag) {}
    ~PoisonOnUnwind() {
      if (!m_committed) m_flag.store(true);
    }
    PoisonOnUnwind(const PoisonOnUnwind&) = delete;
    PoisonOnUnwind& operator=(const PoisonOnUnwind&) = delete;

    void commit() { m_committed = true; }

  private:
    std::atomic<bool>& m_flag;
    bool m_committed = false;
  };

  bool readable(const char* operation) const;

  void hydrate(BodyId id, BodyPath& path);
  void traverseDown(BodyId id, const math::Vec3d& origin, double timeHours,
                    std::vector<Observation>& out) const;
  void traverseUp(BodyId id, BodyId cameFrom, const math::Vec3d& origin, double timeHours,
                  std::vector<Observation>& out) const;

  mutable std::shared_mutex m_mutex;
  std::atomic<bool> m_poisoned{false};
  std::vector<Body> m_bodies;
};

using BodyTreePtr = std::shared_ptr<BodyTree>;

} // namespace orrery::sim
