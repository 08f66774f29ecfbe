#include "orrery/io/TreeFile.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>

namespace {
bool approxRel(double a, double b, double rel = 1e-9) {
  return std::abs(a - b) <= rel * std::max(1.0, std::max(std::abs(a), std::abs(b)));
}

// Offset of every body from the root, keyed by path.
std::map<orrery::sim::BodyPath, orrery::math::Vec3d> positionsByPath(const orrery::sim::BodyTree& tree, double t) {
  std::map<orrery::sim::BodyPath, orrery::math::Vec3d> out;
  for (const auto& o : tree.observationsFrom(orrery::sim::BodyTree::kRoot, t)) {
    out[tree.pathOf(o.body)] = o.offset;
  }
  return out;
}
} // namespace

int test_tree_file() {
  using namespace orrery;
  using namespace orrery::sim;

  int fails = 0;

  BodyTree tree;
  const BodyId star = tree.addBody(BodyTree::kRoot, FixedDynamic{{1.5e11, -2.25e10, 3.0e9}});
  tree.setRadius(star, 2.32);
  tree.setName(star, "Sol \"prime\"");

  OrbitalElements el{};
  el.eccentricity = 0.0167;
  el.semiMajorAxisLs = 499.0;
  el.inclinationRad = 0.1;
  el.longitudeAscendingNodeRad = 1.2;
  el.argumentPeriapsisRad = 2.9;
  el.meanAnomalyAtEpochRad = 0.4;
  const BodyId planet = tree.addBody(star, KeplerianDynamic::aroundMass(el, 1048.0));
  tree.setRadius(planet, 0.0212);
  tree.setRotation(planet, Rotating(23.93, {0.2, 0.1, 0.97}));

  el.semiMajorAxisLs = 1.28;
  el.eccentricity = 0.055;
  tree.addBody(planet, KeplerianDynamic::aroundMass(el, 0.00315));
  tree.addBody(star, FixedDynamic{{0.0, 7.0, 0.0}});
  tree.addBody(BodyTree::kRoot, FixedDynamic{{-4.0e11, 0.0, 0.0}});
  tree.hydrateAll();

  std::stringstream buffer;
  if (!io::writeTree(buffer, tree)) {
    std::cerr << "[test_tree_file] writeTree failed\n";
    return 1;
  }

  std::shared_ptr<BodyTree> loaded;
  if (!io::readTree(buffer, loaded) || !loaded) {
    std::cerr << "[test_tree_file] readTree failed\n";
    return 1;
  }

  if (loaded->size() != tree.size()) {
    std::cerr << "[test_tree_file] size " << loaded->size() << " != " << tree.size() << "\n";
    ++fails;
  }

  for (double t : {0.0, 17.25, 4000.0}) {
    const auto a = positionsByPath(tree, t);
    const auto b = positionsByPath(*loaded, t);
    if (a.size() != b.size()) {
      std::cerr << "[test_tree_file] different path sets at t=" << t << "\n";
      ++fails;
      continue;
    }
    for (const auto& [path, pos] : a) {
      const auto it = b.find(path);
      if (it == b.end() || !approxRel(pos.x, it->second.x) || !approxRel(pos.y, it->second.y) ||
          !approxRel(pos.z, it->second.z)) {
        std::cerr << "[test_tree_file] body " << pathToName(path) << " moved after reload at t=" << t << "\n";
        ++fails;
      }
    }
  }

  {
    const auto id = loaded->find({0, 0});
    const auto body = id ? loaded->body(*id) : std::nullopt;
    if (!body || !body->rotation || !body->radiusLs || std::abs(body->rotation->siderealPeriodHours() - 23.93) > 1e-12) {
      std::cerr << "[test_tree_file] rotation/radius lost\n";
      ++fails;
    }

    const auto s = loaded->find({0});
    if (!s || loaded->nameOf(*s) != "Sol \"prime\"" || loaded->nameOf(*loaded->find({0, 0, 0})) != "0-0-0") {
      std::cerr << "[test_tree_file] names lost\n";
      ++fails;
    }
  }

  // Writing the reloaded tree reproduces the file.
  {
    std::ostringstream first;
    std::ostringstream second;
    io::writeTree(first, tree);
    io::writeTree(second, *loaded);
    if (first.str() != second.str()) {
      std::cerr << "[test_tree_file] second save differs from the first\n";
      ++fails;
    }
  }

  // Malformed input is rejected.
  {
    const char* bad[] = {
      "NotATree 1\nbodies 1\nbody 0\nfixed 0 0 0\nendbody\n",
      "OrreryTree 99\nbodies 1\nbody 0\nfixed 0 0 0\nendbody\n",
      "OrreryTree 1\nbodies 2\nbody 1\nfixed 0 0 0\nendbody\n",
      "OrreryTree 1\nbodies 1\nbody 0\nwobble 1\nendbody\n",
      "OrreryTree 1\nbodies 1\nbody 0\nradius 2\nendbody\n",
      "OrreryTree 1\nbodies 2\nbody 0\nfixed 0 0 0\nendbody\nbody 0\nfixed 1 1 1\nendbody\n",
      "OrreryTree 0\nbodies 1\nbody 0\nfixed 0 0 0\nendbody\n",
      "OrreryTree -3\nbodies 1\nbody 0\nfixed 0 0 0\nendbody\n",
      "OrreryTree 1\nbodies 4000000000000000000\n",
      "OrreryTree 1\nbodies 4000000000000000000\nbody 0\nfixed 0 0 0\nendbody\n",
    };
    for (const char* text : bad) {
      std::istringstream in(text);
      std::shared_ptr<BodyTree> out;
      if (io::readTree(in, out) || out) {
        std::cerr << "[test_tree_file] accepted malformed tree:\n" << text;
        ++fails;
      }
    }
  }

  // Observatories round trip in their weak form.
  {
    WeakObservatory w{};
    w.location = math::Spherical{1.0, 0.75, 4.5};
    w.body = {0, 0};
    w.name = "Mauna Kea";
    WeakConstellation c{};
    c.name = "The Line";
    c.edges.emplace_back(BodyPath{0}, BodyPath{1});
    w.constellations.push_back(c);
    WeakConstellation unnamed{};
    unnamed.edges.emplace_back(BodyPath{}, BodyPath{0, 1});
    w.constellations.push_back(unnamed);

    std::stringstream obsBuffer;
    std::vector<WeakObservatory> back;
    if (!io::writeObservatories(obsBuffer, {w, WeakObservatory{}}) || !io::readObservatories(obsBuffer, back)) {
      std::cerr << "[test_tree_file] observatory round trip failed\n";
      ++fails;
    } else if (back.size() != 2 || back[0].body != w.body || back[0].name != w.name ||
               back[0].location.polar != w.location.polar || back[0].location.azimuth != w.location.azimuth ||
               back[0].constellations.size() != 2 || back[0].constellations[0].name != c.name ||
               back[0].constellations[1].name || back[0].constellations[1].edges != unnamed.edges ||
               !back[1].body.empty() || back[1].name) {
      std::cerr << "[test_tree_file] observatory fields changed in the round trip\n";
      ++fails;
    }
  }

  // Malformed observatory files, including absurd counts, are rejected.
  {
    const char* bad[] = {
      "OrreryObservatories 0\nobservatories 0\n",
      "OrreryObservatories 1\nobservatories 4000000000000000000\n",
      "OrreryObservatories 1\nobservatories 1\nobservatory\nlocation 0 0\nbody 4000000000000000000\nendobservatory\n",
      "OrreryObservatories 1\nobservatories 1\nobservatory\nconstellation - 4000000000000000000\nendobservatory\n",
    };
    for (const char* text : bad) {
      std::istringstream in(text);
      std::vector<WeakObservatory> out;
      if (io::readObservatories(in, out)) {
        std::cerr << "[test_tree_file] accepted malformed observatories:\n" << text;
        ++fails;
      }
    }
  }

  if (fails == 0) std::cout << "[test_tree_file] pass\n";
  return fails;
}
