#pragma once

#include "orrery/core/JsonWriter.h"
#include "orrery/sim/BodyTree.h"
#include "orrery/sim/Observatory.h"

#include <string_view>
#include <vector>

namespace orrery::io {

// Nested dump of the whole tree, one object per body. The tree must be hydrated.
void writeTreeJson(core::JsonWriter& w, const sim::BodyTree& tree);

// One observatory at one instant: visible bodies and constellation lines.
void writeFrameJson(core::JsonWriter& w,
                    std::string_view observatory,
                    double timeHours,
                    const sim::BodyTree& tree,
                    const std::vector<sim::LocalObservation>& observations,
                    const std::vector<sim::ConstellationLine>& lines);

} // namespace orrery::io
