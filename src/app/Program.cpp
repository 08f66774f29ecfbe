#include "orrery/app/Program.h"

#include "orrery/core/Log.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <sstream>
#include <thread>

namespace orrery::app {

Program::Program(std::shared_ptr<const sim::BodyTree> tree, std::vector<sim::Observatory> observatories,
                 ProgramConfig config)
: m_tree(std::move(tree)),
  m_observatories(std::move(observatories)),
  m_config(std::move(config)) {
  if (m_config.threads == 0) {
    m_config.threads = std::max(1u, std::thread::hardware_concurrency());
  }
}

void Program::addOutput(std::unique_ptr<out::Output> output) {
  if (!output) return;
  m_outputs.push_back(std::move(output));
}

RunStats Program::run(double startHours, double endHours, double stepHours) {
  if (!m_tree) {
    core::log(core::LogLevel::Error, "Program: no body tree");
    return {};
  }
  if (!(stepHours > 0.0) || !(endHours >= startHours)) {
    std::ostringstream oss;
    oss << "Program: invalid time range [" << startHours << ", " << endHours << "] step " << stepHours;
    core::log(core::LogLevel::Error, oss.str());
    return {};
  }

  // Names walk the tree; resolve them once for the whole run.
  std::vector<std::string> names;
  names.reserve(m_observatories.size());
  for (const auto& o : m_observatories) names.push_back(o.name());

  for (auto& output : m_outputs) {
    if (!output->prepare(m_config.outputRoot, names)) {
      core::log(core::LogLevel::Error, "Program: " + std::string(output->kind()) + " output failed to prepare");
      return {};
    }
  }

  // Small tolerance so that an end exactly on a step boundary is included.
  const auto steps = static_cast<std::size_t>(std::floor((endHours - startHours) / stepHours + 1e-9)) + 1;
  const std::size_t workers = std::min<std::size_t>(m_config.threads, steps);

  std::ostringstream plan;
  plan << "Program: " << steps << " steps x " << m_observatories.size() << " observatories x " << m_outputs.size()
       << " outputs on " << workers << " threads";
  core::log(core::LogLevel::Info, plan.str());

  std::vector<std::future<RunStats>> fut(workers);
  for (std::size_t t = 0; t < workers; ++t) {
    const std::size_t first = t * steps / workers;
    const std::size_t last = (t + 1) * steps / workers;
    fut[t] = std::async(std::launch::async, [this, first, last, startHours, stepHours, &names] {
      return runChunk(first, last, startHours, stepHours, names);
    });
  }

  RunStats total{};
  for (auto& f : fut) {
    const RunStats part = f.get();
    total.frames += part.frames;
    total.observations += part.observations;
    total.failedWrites += part.failedWrites;
  }

  if (total.failedWrites > 0) {
    core::log(core::LogLevel::Warn, "Program: " + std::to_string(total.failedWrites) + " frame writes failed");
  }
  return total;
}

RunStats Program::runChunk(std::size_t first, std::size_t last, double startHours, double stepHours,
                           const std::vector<std::string>& names) const {
  RunStats stats{};
  for (std::size_t step = first; step < last; ++step) {
    const double t = startHours + static_cast<double>(step) * stepHours;

    for (std::size_t i = 0; i < m_observatories.size(); ++i) {
      const sim::Observatory& observatory = m_observatories[i];
      const auto observations = observatory.observe(t);
      const auto lines = observatory.constellationLines(observations);
      const out::Frame frame{names[i], t, *m_tree, observations, lines};

      ++stats.frames;
      stats.observations += observations.size();

      for (const auto& output : m_outputs) {
        try {
          if (!output->write(frame)) ++stats.failedWrites;
        } catch (const std::exception& e) {
          core::log(core::LogLevel::Error,
                    "Program: " + std::string(output->kind()) + " output threw at t=" + std::to_string(t) + ": " +
                    e.what());
          ++stats.failedWrites;
        }
      }
    }
  }
  return stats;
}

} // namespace orrery::app
