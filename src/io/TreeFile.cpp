#include "orrery/io/TreeFile.h"

#include "orrery/core/Log.h"

#include <fstream>
#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <utility>

namespace orrery::io {
namespace {
  constexpr const char* kTreeHeader = "OrreryTree";
  constexpr const char* kObservatoryHeader = "OrreryObservatories";

  void fail(const std::string& what) {
    core::log(core::LogLevel::Error, "TreeFile: " + what);
  }

  void writeBody(std::ostream& f, const std::vector<sim::Body>& bodies, sim::BodyId id) {
    const sim::Body& b = bodies[id];
    f << "body " << b.children.size() << "\n";

    if (const auto* fixed = std::get_if<sim::FixedDynamic>(&b.dynamic)) {
      f << "fixed " << fixed->offset.x << " " << fixed->offset.y << " " << fixed->offset.z << "\n";
    } else if (const auto* k = std::get_if<sim::KeplerianDynamic>(&b.dynamic)) {
      const auto& q = k->orientation();
      f << "keplerian "
        << k->eccentricity() << " "
        << k->semiMajorAxisLs() << " "
        << q.w << " " << q.x << " " << q.y << " " << q.z << " "
        << k->meanAnomalyAtEpochRad() << " "
        << k->periodHours() << "\n";
    }

    if (b.rotation) {
      const auto& axis = b.rotation->axis();
      f << "rotation " << b.rotation->siderealPeriodHours() << " "
        << axis.x << " " << axis.y << " " << axis.z << "\n";
    }
    if (b.radiusLs) {
      f << "radius " << *b.radiusLs << "\n";
    }
    if (b.name.state == sim::NameState::Named) {
      f << "name " << std::quoted(b.name.text) << "\n";
    }
    f << "endbody\n";

    for (sim::BodyId child : b.children) writeBody(f, bodies, child);
  }

  // Reads one body block after its "body" tag.
  bool readBody(std::istream& f, sim::Body& out, std::size_t& childCount) {
    if (!(f >> childCount)) return false;

    bool haveDynamic = false;
    std::string key;
    while (f >> key) {
      if (key == "endbody") {
        if (!haveDynamic) fail("body without a dynamic");
        return haveDynamic;
      }

      if (key == "fixed") {
        sim::FixedDynamic d{};
        if (!(f >> d.offset.x >> d.offset.y >> d.offset.z)) return false;
        out.dynamic = d;
        haveDynamic = true;
      } else if (key == "keplerian") {
        double e = 0.0, a = 0.0, m0 = 0.0, period = 0.0;
        math::Quatd q{};
        if (!(f >> e >> a >> q.w >> q.x >> q.y >> q.z >> m0 >> period)) return false;
        out.dynamic = sim::KeplerianDynamic(e, a, q, m0, period);
        haveDynamic = true;
      } else if (key == "rotation") {
        double period = 0.0;
        math::Vec3d axis{};
        if (!(f >> period >> axis.x >> axis.y >> axis.z)) return false;
        out.rotation = sim::Rotating(period, axis);
      } else if (key == "radius") {
        double r = 0.0;
        if (!(f >> r)) return false;
        out.radiusLs = r;
      } else if (key == "name") {
        std::string name;
        if (!(f >> std::quoted(name))) return false;
        out.name = sim::BodyName{sim::NameState::Named, std::move(name)};
      } else {
        fail("unknown body key '" + key + "'");
        return false;
      }
    }
    return false;
  }

  void writePath(std::ostream& f, const sim::BodyPath& path) {
    f << path.size();
    for (auto i : path) f << " " << i;
  }

  bool readPath(std::istream& f, sim::BodyPath& out) {
    std::size_t depth = 0;
    if (!(f >> depth)) return false;
    out.clear();
    for (std::size_t i = 0; i < depth; ++i) {
      core::u32 index = 0;
      if (!(f >> index)) return false;
      out.push_back(index);
    }
    return true;
  }

  // A quoted string, or a bare "-" for "no name".
  bool readOptionalName(std::istream& f, std::optional<std::string>& out) {
    f >> std::ws;
    if (f.peek() == '"') {
      std::string s;
      if (!(f >> std::quoted(s))) return false;
      out = std::move(s);
      return true;
    }
    std::string dash;
    if (!(f >> dash) || dash != "-") return false;
    out.reset();
    return true;
  }

  bool readObservatory(std::istream& f, sim::WeakObservatory& out) {
    std::string key;
    while (f >> key) {
      if (key == "endobservatory") return true;

      if (key == "location") {
        if (!(f >> out.location.polar >> out.location.azimuth)) return false;
        out.location.radius = 1.0;
      } else if (key == "body") {
        if (!readPath(f, out.body)) return false;
      } else if (key == "name") {
        std::string name;
        if (!(f >> std::quoted(name))) return false;
        out.name = std::move(name);
      } else if (key == "constellation") {
        sim::WeakConstellation c{};
        std::size_t edges = 0;
        if (!readOptionalName(f, c.name) || !(f >> edges)) return false;
        for (std::size_t i = 0; i < edges; ++i) {
          std::string tag;
          if (!(f >> tag) || tag != "edge") return false;
          sim::BodyPath a;
          sim::BodyPath b;
          if (!readPath(f, a) || !readPath(f, b)) return false;
          c.edges.emplace_back(std::move(a), std::move(b));
        }
        out.constellations.push_back(std::move(c));
      } else {
        fail("unknown observatory key '" + key + "'");
        return false;
      }
    }
    return false;
  }
} // namespace

bool writeTree(std::ostream& f, const sim::BodyTree& tree) {
  const auto bodies = tree.snapshot();

  f.precision(std::numeric_limits<double>::max_digits10);
  f << kTreeHeader << " " << kTreeFileVersion << "\n";
  f << "bodies " << bodies.size() << "\n";
  writeBody(f, bodies, sim::BodyTree::kRoot);
  return static_cast<bool>(f);
}

bool readTree(std::istream& f, std::shared_ptr<sim::BodyTree>& out) {
  std::string header;
  int version = 0;
  if (!(f >> header) || header != kTreeHeader) {
    fail("bad tree header");
    return false;
  }
  if (!(f >> version) || version < 1 || version > kTreeFileVersion) {
    fail("unsupported tree version " + std::to_string(version));
    return false;
  }

  std::string tag;
  std::size_t count = 0;
  if (!(f >> tag) || tag != "bodies" || !(f >> count) || count == 0) {
    fail("missing body count");
    return false;
  }

  std::vector<sim::Body> bodies;

  // Bodies that still expect children: (index, children left).
  std::vector<std::pair<sim::BodyId, std::size_t>> open;

  for (std::size_t i = 0; i < count; ++i) {
    if (!(f >> tag) || tag != "body") {
      fail("expected body " + std::to_string(i));
      return false;
    }

    sim::Body b{};
    std::size_t childCount = 0;
    if (!readBody(f, b, childCount)) {
      fail("malformed body " + std::to_string(i));
      return false;
    }

    const auto id = static_cast<sim::BodyId>(bodies.size());
    if (i > 0) {
      if (open.empty()) {
        fail("body " + std::to_string(i) + " has no parent slot");
        return false;
      }
      bodies[open.back().first].children.push_back(id);
      if (--open.back().second == 0) open.pop_back();
    }

    bodies.push_back(std::move(b));
    if (childCount > 0) open.emplace_back(id, childCount);
  }

  if (!open.empty()) {
    fail("file ends before all children were read");
    return false;
  }

  auto tree = sim::BodyTree::fromBodies(std::move(bodies));
  if (!tree) return false;
  out = std::move(tree);
  return true;
}

bool saveTreeToFile(const sim::BodyTree& tree, const std::string& path) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    fail("failed to open file for writing: " + path);
    return false;
  }
  if (!writeTree(f, tree)) {
    fail("write failed: " + path);
    return false;
  }
  return true;
}

bool loadTreeFromFile(const std::string& path, std::shared_ptr<sim::BodyTree>& out) {
  std::ifstream f(path);
  if (!f) {
    core::log(core::LogLevel::Warn, "TreeFile: file not found: " + path);
    return false;
  }
  return readTree(f, out);
}

bool writeObservatories(std::ostream& f, const std::vector<sim::WeakObservatory>& observatories) {
  f.precision(std::numeric_limits<double>::max_digits10);
  f << kObservatoryHeader << " " << kObservatoryFileVersion << "\n";
  f << "observatories " << observatories.size() << "\n";

  for (const auto& o : observatories) {
    f << "observatory\n";
    f << "location " << o.location.polar << " " << o.location.azimuth << "\n";
    f << "body ";
    writePath(f, o.body);
    f << "\n";
    if (o.name) f << "name " << std::quoted(*o.name) << "\n";

    for (const auto& c : o.constellations) {
      f << "constellation ";
      if (c.name) {
        f << std::quoted(*c.name);
      } else {
        f << "-";
      }
      f << " " << c.edges.size() << "\n";
      for (const auto& [a, b] : c.edges) {
        f << "edge ";
        writePath(f, a);
        f << " ";
        writePath(f, b);
        f << "\n";
      }
    }
    f << "endobservatory\n";
  }
  return static_cast<bool>(f);
}

bool readObservatories(std::istream& f, std::vector<sim::WeakObservatory>& out) {
  std::string header;
  int version = 0;
  if (!(f >> header) || header != kObservatoryHeader) {
    fail("bad observatory header");
    return false;
  }
  if (!(f >> version) || version < 1 || version > kObservatoryFileVersion) {
    fail("unsupported observatory version " + std::to_string(version));
    return false;
  }

  std::string tag;
  std::size_t count = 0;
  if (!(f >> tag) || tag != "observatories" || !(f >> count)) {
    fail("missing observatory count");
    return false;
  }

  std::vector<sim::WeakObservatory> list;
  for (std::size_t i = 0; i < count; ++i) {
    if (!(f >> tag) || tag != "observatory") {
      fail("expected observatory " + std::to_string(i));
      return false;
    }
    sim::WeakObservatory o{};
    if (!readObservatory(f, o)) {
      fail("malformed observatory " + std::to_string(i));
      return false;
    }
    list.push_back(std::move(o));
  }

  out = std::move(list);
  return true;
}

bool saveObservatoriesToFile(const std::vector<sim::WeakObservatory>& observatories, const std::string& path) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    fail("failed to open file for writing: " + path);
    return false;
  }
  return writeObservatories(f, observatories);
}

bool loadObservatoriesFromFile(const std::string& path, std::vector<sim::WeakObservatory>& out) {
  std::ifstream f(path);
  if (!f) {
    core::log(core::LogLevel::Warn, "TreeFile: file not found: " + path);
    return false;
  }
  return readObservatories(f, out);
}

} // namespace orrery::io
