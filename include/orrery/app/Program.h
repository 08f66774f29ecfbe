#pragma once

#include "orrery/out/Output.h"
#include "orrery/sim/BodyTree.h"
#include "orrery/sim/Observatory.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace orrery::app {

struct ProgramConfig {
  std::filesystem::path outputRoot = "out";
  // 0 = one worker per hardware thread.
  unsigned threads = 0;
};

struct RunStats {
  std::size_t frames = 0;
  std::size_t observations = 0;
  std::size_t failedWrites = 0;
};

// Steps time over [start, end] and hands every observatory's view to every
// output. Time steps are split into contiguous chunks, one per worker.
class Program {
public:
  Program(std::shared_ptr<const sim::BodyTree> tree, std::vector<sim::Observatory> observatories,
          ProgramConfig config = {});

  void addOutput(std::unique_ptr<out::Output> output);

  const ProgramConfig& config() const { return m_config; }
  const std::vector<sim::Observatory>& observatories() const { return m_observatories; }
  std::size_t outputCount() const { return m_outputs.size(); }

  // A non-positive step or end < start logs an error and returns empty stats.
  RunStats run(double startHours, double endHours, double stepHours);

private:
  RunStats runChunk(std::size_t first, std::size_t last, double startHours, double stepHours,
                    const std::vector<std::string>& names) const;

  std::shared_ptr<const sim::BodyTree> m_tree;
  std::vector<sim::Observatory> m_observatories;
  ProgramConfig m_config;
  std::vector<std::unique_ptr<out::Output>> m_outputs;
};

} // namespace orrery::app
