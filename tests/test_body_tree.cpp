#include "orrery/core/Log.h"
#include "orrery/sim/BodyTree.h"

#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}
} // namespace

int test_body_tree() {
  using namespace orrery;
  using namespace orrery::sim;

  int fails = 0;

  // Chain of five ancestors 13 ls apart along +y, observer at the bottom,
  // four descendants 7 ls apart along +x.
  {
    BodyTree tree;
    BodyId parent = BodyTree::kRoot;
    for (int i = 0; i < 4; ++i) parent = tree.addBody(parent, FixedDynamic{{0.0, 13.0, 0.0}});
    const BodyId observer = tree.addBody(parent, FixedDynamic{{0.0, 13.0, 0.0}});
    BodyId child = observer;
    for (int i = 0; i < 4; ++i) child = tree.addBody(child, FixedDynamic{{7.0, 0.0, 0.0}});
    tree.hydrateAll();

    const auto obs = tree.observationsFrom(observer, 0.0);
    if (obs.size() != 9) {
      std::cerr << "[test_body_tree] chain: expected 9 observations got " << obs.size() << "\n";
      ++fails;
    } else {
      for (int i = 0; i < 4; ++i) {
        const double x = 7.0 * (4 - i);
        if (!approx(obs[i].offset.x, x) || !approx(obs[i].offset.y, 0.0)) {
          std::cerr << "[test_body_tree] chain: descendant " << i << " expected x=" << x << " got " << obs[i].offset
                    << "\n";
          ++fails;
        }
      }
      for (int i = 0; i < 5; ++i) {
        const double y = -13.0 * (i + 1);
        if (!approx(obs[4 + i].offset.x, 0.0) || !approx(obs[4 + i].offset.y, y)) {
          std::cerr << "[test_body_tree] chain: ancestor " << i << " expected y=" << y << " got "
                    << obs[4 + i].offset << "\n";
          ++fails;
        }
      }
      if (obs.back().body != BodyTree::kRoot) {
        std::cerr << "[test_body_tree] chain: root should come last\n";
        ++fails;
      }
    }
  }

  // Branching tree with moving bodies.
  BodyTree tree;
  const BodyId s1 = tree.addBody(BodyTree::kRoot, FixedDynamic{{100.0, 0.0, 0.0}});
  const BodyId s2 = tree.addBody(BodyTree::kRoot, FixedDynamic{{-50.0, 20.0, 5.0}});
  OrbitalElements el{};
  el.semiMajorAxisLs = 3.0;
  el.eccentricity = 0.2;
  el.inclinationRad = 0.3;
  const BodyId p1 = tree.addBody(s1, KeplerianDynamic::withPeriod(el, 40.0));
  el.semiMajorAxisLs = 9.0;
  const BodyId p2 = tree.addBody(s1, KeplerianDynamic::withPeriod(el, 120.0));
  el.semiMajorAxisLs = 0.2;
  const BodyId m1 = tree.addBody(p1, KeplerianDynamic::withPeriod(el, 2.0));
  const BodyId q1 = tree.addBody(s2, FixedDynamic{{0.0, 0.0, 1.0}});
  tree.setName(p1, "Tauri");
  tree.hydrateAll();

  const std::size_t n = tree.size();
  if (n != 7) {
    std::cerr << "[test_body_tree] expected 7 bodies got " << n << "\n";
    ++fails;
  }

  // Everything but the observer, exactly once, consistent with global positions.
  {
    const double t = 3.7;
    std::vector<math::Vec3d> global(n);
    for (const auto& o : tree.observationsFrom(BodyTree::kRoot, t)) global[o.body] = o.offset;

    for (BodyId id = 0; id < n; ++id) {
      const auto obs = tree.observationsFrom(id, t);
      if (obs.size() != n - 1) {
        std::cerr << "[test_body_tree] body " << id << ": expected " << (n - 1) << " observations got " << obs.size()
                  << "\n";
        ++fails;
      }

      std::set<BodyId> seen;
      for (const auto& o : obs) {
        if (o.body == id) {
          std::cerr << "[test_body_tree] body " << id << " observes itself\n";
          ++fails;
        }
        seen.insert(o.body);

        const math::Vec3d expected = global[o.body] - global[id];
        if (!math::approxEqual(o.offset, expected, 1e-9)) {
          std::cerr << "[test_body_tree] offset " << id << "->" << o.body << " expected " << expected << " got "
                    << o.offset << "\n";
          ++fails;
        }
      }
      if (seen.size() != obs.size()) {
        std::cerr << "[test_body_tree] body " << id << " sees a body twice\n";
        ++fails;
      }
    }
  }

  // Paths and names.
  {
    if (tree.pathOf(p2) != BodyPath{0, 1} || tree.pathOf(q1) != BodyPath{1, 0} || !tree.pathOf(BodyTree::kRoot).empty()) {
      std::cerr << "[test_body_tree] unexpected paths\n";
      ++fails;
    }
    if (pathToName(tree.pathOf(m1)) != "0-0-0" || pathToName({}) != "root") {
      std::cerr << "[test_body_tree] pathToName mismatch\n";
      ++fails;
    }
    if (tree.nameOf(p1) != "Tauri" || tree.nameOf(m1) != "0-0-0" || tree.nameOf(BodyTree::kRoot) != "root") {
      std::cerr << "[test_body_tree] names: " << tree.nameOf(p1) << ", " << tree.nameOf(m1) << "\n";
      ++fails;
    }

    const auto found = tree.find({0, 0, 0});
    if (!found || *found != m1 || tree.find({5}) || tree.find({0, 3})) {
      std::cerr << "[test_body_tree] find by path failed\n";
      ++fails;
    }
    if (tree.parentOf(m1) != p1 || tree.parentOf(BodyTree::kRoot) != kNoBody) {
      std::cerr << "[test_body_tree] parent links wrong\n";
      ++fails;
    }
  }

  {
    if (!approx(tree.angularRadius(s2, 10.0), BodyTree::kFallbackAngularRadius)) {
      std::cerr << "[test_body_tree] body without radius should use the fallback\n";
      ++fails;
    }
    tree.setRadius(s2, 1.0);
    if (!approx(tree.angularRadius(s2, 2.0), std::asin(0.5)) || !approx(tree.angularRadius(s2, 0.5), math::halfPi)) {
      std::cerr << "[test_body_tree] angular radius wrong\n";
      ++fails;
    }
    if (tree.setRadius(s2, -1.0)) {
      std::cerr << "[test_body_tree] negative radius accepted\n";
      ++fails;
    }
  }

  // Rebuilding from child lists rejects shared children.
  {
    std::vector<Body> bodies(3);
    bodies[0].children = {1, 2};
    bodies[1].children = {2};
    if (BodyTree::fromBodies(bodies)) {
      std::cerr << "[test_body_tree] fromBodies accepted a child with two parents\n";
      ++fails;
    }

    bodies[1].children.clear();
    const auto rebuilt = BodyTree::fromBodies(bodies);
    if (!rebuilt || rebuilt->parentOf(2) != BodyTree::kRoot || rebuilt->nameOf(2) != "1") {
      std::cerr << "[test_body_tree] fromBodies failed on a valid tree\n";
      ++fails;
    }
  }

  // An exception inside an edit poisons the tree; reads degrade to empty.
  {
    std::vector<std::string> warnings;
    core::setLogSink([&warnings](core::LogLevel level, std::string_view msg) {
      if (level >= core::LogLevel::Warn) warnings.emplace_back(msg);
    });

    const BodyId bad = tree.addBody(12345, FixedDynamic{});
    if (bad != kNoBody) {
      std::cerr << "[test_body_tree] addBody under an unknown parent should fail\n";
      ++fails;
    }

    try {
      tree.edit([&](BodyTree::Editor& e) {
        e.addBody(s1, FixedDynamic{});
        throw std::runtime_error("interrupted edit");
      });
    } catch (const std::runtime_error&) {
      // expected
    }

    const auto obs = tree.observationsFrom(p1, 0.0);
    const auto found = tree.find({0});
    core::setLogSink({});

    if (!tree.poisoned() || !obs.empty() || found) {
      std::cerr << "[test_body_tree] poisoned tree should return empty results\n";
      ++fails;
    }
    if (warnings.size() < 2) {
      std::cerr << "[test_body_tree] expected warnings for the bad parent and poisoned reads\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_body_tree] pass\n";
  return fails;
}
