#pragma once

#include "orrery/out/Output.h"

#include <filesystem>

namespace orrery::out {

// One JSON document per frame.
class JsonOutput final : public Output {
public:
  explicit JsonOutput(bool pretty = true) : m_pretty(pretty) {}

  std::string_view kind() const override { return "json"; }
  bool prepare(const std::filesystem::path& root, const std::vector<std::string>& observatories) override;
  bool write(const Frame& frame) override;

private:
  bool m_pretty = true;
  std::filesystem::path m_root;
};

} // namespace orrery::out
