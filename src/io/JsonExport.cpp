#include "orrery/io/JsonExport.h"

#include <variant>

namespace orrery::io {
namespace {
  void writeDynamic(core::JsonWriter& w, const sim::Dynamic& dynamic) {
    w.beginObject();
    if (const auto* fixed = std::get_if<sim::FixedDynamic>(&dynamic)) {
      w.field("type", "fixed");
      w.key("offset");
      w.triple(fixed->offset.x, fixed->offset.y, fixed->offset.z);
    } else if (const auto* k = std::get_if<sim::KeplerianDynamic>(&dynamic)) {
      const auto& q = k->orientation();
      w.field("type", "keplerian");
      w.field("eccentricity", k->eccentricity());
      w.field("semiMajorAxisLs", k->semiMajorAxisLs());
      w.key("orientation");
      w.beginArray();
      w.value(q.w);
      w.value(q.x);
      w.value(q.y);
      w.value(q.z);
      w.endArray();
      w.field("meanAnomalyAtEpoch", k->meanAnomalyAtEpochRad());
      w.field("periodHours", k->periodHours());
    }
    w.endObject();
  }

  void writeBody(core::JsonWriter& w, const std::vector<sim::Body>& bodies, sim::BodyId id) {
    const sim::Body& b = bodies[id];

    w.beginObject();
    w.field("name", b.name.text);
    w.field("userNamed", b.name.state == sim::NameState::Named);
    w.key("dynamic");
    writeDynamic(w, b.dynamic);

    if (b.rotation) {
      const auto& axis = b.rotation->axis();
      w.key("rotation");
      w.beginObject();
      w.field("periodHours", b.rotation->siderealPeriodHours());
      w.key("axis");
      w.triple(axis.x, axis.y, axis.z);
      w.endObject();
    }
    if (b.radiusLs) w.field("radiusLs", *b.radiusLs);

    w.key("children");
    w.beginArray();
    for (sim::BodyId child : b.children) writeBody(w, bodies, child);
    w.endArray();
    w.endObject();
  }
} // namespace

void writeTreeJson(core::JsonWriter& w, const sim::BodyTree& tree) {
  const auto bodies = tree.snapshot();
  writeBody(w, bodies, sim::BodyTree::kRoot);
}

void writeFrameJson(core::JsonWriter& w,
                    std::string_view observatory,
                    double timeHours,
                    const sim::BodyTree& tree,
                    const std::vector<sim::LocalObservation>& observations,
                    const std::vector<sim::ConstellationLine>& lines) {
  w.beginObject();
  w.field("observatory", observatory);
  w.field("timeHours", timeHours);

  w.key("bodies");
  w.beginArray();
  for (const auto& o : observations) {
    w.beginObject();
    w.field("name", tree.nameOf(o.body));
    w.field("polar", o.position.polar);
    w.field("azimuth", o.position.azimuth);
    w.field("distanceLs", o.position.radius);
    w.field("angularRadius", tree.angularRadius(o.body, o.position.radius));
    w.endObject();
  }
  w.endArray();

  w.key("lines");
  w.beginArray();
  for (const auto& l : lines) {
    w.beginObject();
    w.field("from", tree.nameOf(l.from));
    w.field("to", tree.nameOf(l.to));
    w.key("start");
    w.triple(l.start.radius, l.start.polar, l.start.azimuth);
    w.key("end");
    w.triple(l.end.radius, l.end.polar, l.end.azimuth);
    w.endObject();
  }
  w.endArray();

  w.endObject();
}

} // namespace orrery::io
