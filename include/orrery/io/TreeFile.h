#pragma once

#include "orrery/sim/BodyTree.h"
#include "orrery/sim/Observatory.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace orrery::io {

inline constexpr int kTreeFileVersion = 1;
inline constexpr int kObservatoryFileVersion = 1;

// Token-based text format, bodies in pre-order with their child counts.
// Parent links are not stored; reading rebuilds them through hydrateAll().
bool writeTree(std::ostream& out, const sim::BodyTree& tree);
bool readTree(std::istream& in, std::shared_ptr<sim::BodyTree>& out);

bool saveTreeToFile(const sim::BodyTree& tree, const std::string& path);
bool loadTreeFromFile(const std::string& path, std::shared_ptr<sim::BodyTree>& out);

// Observatories are stored in their weak form (body paths).
bool writeObservatories(std::ostream& out, const std::vector<sim::WeakObservatory>& observatories);
bool readObservatories(std::istream& in, std::vector<sim::WeakObservatory>& out);

bool saveObservatoriesToFile(const std::vector<sim::WeakObservatory>& observatories, const std::string& path);
bool loadObservatoriesFromFile(const std::string& path, std::vector<sim::WeakObservatory>& out);

} // namespace orrery::io
