#include "orrery/out/EclipseOutput.h"

#include "orrery/core/Log.h"

#include <iterator>
#include <sstream>

namespace orrery::out {

bool EclipseOutput::write(const Frame& frame) {
  CollisionGrid grid;
  for (const auto& o : frame.observations) {
    grid.insert(SkyDisk{o.body, o.position, frame.tree.angularRadius(o.body, o.position.radius)});
  }

  const auto overlaps = grid.overlaps();
  if (overlaps.empty()) return true;

  std::vector<EclipseEvent> found;
  found.reserve(overlaps.size());
  for (const auto& hit : overlaps) {
    const SkyDisk& a = grid.disk(hit.first);
    const SkyDisk& b = grid.disk(hit.second);

    // Nearer body first: it is the one in front.
    const bool aInFront = a.position.radius <= b.position.radius;
    EclipseEvent e{frame.observatory, frame.timeHours, aInFront ? a.body : b.body, aInFront ? b.body : a.body,
                   hit.separation};

    std::ostringstream oss;
    oss << "Eclipse at " << e.observatory << " t=" << e.timeHours << "h: "
        << frame.tree.nameOf(e.first) << " over " << frame.tree.nameOf(e.second)
        << " (separation " << e.separation << " rad)";
    core::log(core::LogLevel::Info, oss.str());

    found.push_back(std::move(e));
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_events.insert(m_events.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  return true;
}

std::size_t EclipseOutput::eventCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_events.size();
}

std::vector<EclipseEvent> EclipseOutput::events() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_events;
}

} // namespace orrery::out
