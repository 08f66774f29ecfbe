#pragma once

#include "orrery/out/CollisionGrid.h"
#include "orrery/out/Output.h"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace orrery::out {

struct EclipseEvent {
  std::string observatory;
  double timeHours = 0.0;
  sim::BodyId first = sim::kNoBody;
  sim::BodyId second = sim::kNoBody;
  double separation = 0.0;
};

// Reports every pair of bodies whose disks overlap in a frame. Writes no files.
class EclipseOutput final : public Output {
public:
  std::string_view kind() const override { return "eclipse"; }
  bool write(const Frame& frame) override;

  std::size_t eventCount() const;
  std::vector<EclipseEvent> events() const;

private:
  mutable std::mutex m_mutex;
  std::vector<EclipseEvent> m_events;
};

} // namespace orrery::out
