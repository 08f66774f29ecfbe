#pragma once

#include "orrery/math/Spherical.h"
#include "orrery/out/Output.h"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace orrery::out {

struct SvgOptions {
  int sizePx = 1000;
  double minRadiusPx = 1.0;
  std::string background = "black";
  std::string bodyFill = "white";
  std::string lineStroke = "#4f6bff";
};

// Upper hemisphere flattened onto the horizon plane: zenith in the centre,
// horizon on the unit circle. Returns [-1, 1] coordinates, or nothing for
// directions below the horizon.
struct ChartPoint {
  double x = 0.0;
  double y = 0.0;
};
std::optional<ChartPoint> projectOrthographic(const math::Spherical& direction);

// Star chart per frame.
class SvgOutput final : public Output {
public:
  explicit SvgOutput(SvgOptions options = {}) : m_options(std::move(options)) {}

  std::string_view kind() const override { return "svg"; }
  bool prepare(const std::filesystem::path& root, const std::vector<std::string>& observatories) override;
  bool write(const Frame& frame) override;

  // Renders into any stream; write() uses it with a file.
  void render(std::ostream& out, const Frame& frame) const;

private:
  SvgOptions m_options;
  std::filesystem::path m_root;
};

} // namespace orrery::out
