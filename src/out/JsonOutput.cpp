#include "orrery/out/JsonOutput.h"

#include "orrery/core/JsonWriter.h"
#include "orrery/core/Log.h"
#include "orrery/io/JsonExport.h"

#include <fstream>

namespace orrery::out {

bool JsonOutput::prepare(const std::filesystem::path& root, const std::vector<std::string>& observatories) {
  m_root = root;
  return createObservatoryDirs(root, observatories);
}

bool JsonOutput::write(const Frame& frame) {
  const auto path = framePath(m_root, frame.observatory, frame.timeHours, "json");
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    core::log(core::LogLevel::Error, "JsonOutput: failed to open " + path.string());
    return false;
  }

  core::JsonWriter w(f, m_pretty);
  io::writeFrameJson(w, frame.observatory, frame.timeHours, frame.tree, frame.observations, frame.lines);
  f << "\n";
  return static_cast<bool>(f);
}

} // namespace orrery::out
