#pragma once

#include "orrery/sim/BodyTree.h"
#include "orrery/sim/Observatory.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::out {

// Everything one observatory sees at one instant.
struct Frame {
  const std::string& observatory;
  double timeHours = 0.0;
  const sim::BodyTree& tree;
  const std::vector<sim::LocalObservation>& observations;
  const std::vector<sim::ConstellationLine>& lines;
};

// Sink for observation frames. write() is called from several worker threads
// at once, each with a different frame.
class Output {
public:
  virtual ~Output() = default;

  virtual std::string_view kind() const = 0;

  // Called once per run before any write(), on the calling thread.
  virtual bool prepare(const std::filesystem::path& root, const std::vector<std::string>& observatories) {
    (void)root;
    (void)observatories;
    return true;
  }

  virtual bool write(const Frame& frame) = 0;
};

// "<root>/<observatory>/<time>.<ext>", time printed without trailing zeros.
std::filesystem::path framePath(const std::filesystem::path& root, std::string_view observatory,
                                double timeHours, std::string_view extension);

// Creates "<root>/<observatory>" for every observatory.
bool createObservatoryDirs(const std::filesystem::path& root, const std::vector<std::string>& observatories);

} // namespace orrery::out
