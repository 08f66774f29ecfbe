#include "orrery/out/SvgOutput.h"

#include "orrery/core/Log.h"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace orrery::out {
namespace {
  void writeEscaped(std::ostream& o, std::string_view s) {
    for (char c : s) {
      switch (c) {
        case '&': o << "&amp;"; break;
        case '<': o << "&lt;"; break;
        case '>': o << "&gt;"; break;
        case '"': o << "&quot;"; break;
        default: o << c; break;
      }
    }
  }
} // namespace

std::optional<ChartPoint> projectOrthographic(const math::Spherical& direction) {
  if (direction.polar > math::halfPi) return std::nullopt;
  const double s = std::sin(direction.polar);
  return ChartPoint{s * std::cos(direction.azimuth), s * std::sin(direction.azimuth)};
}

bool SvgOutput::prepare(const std::filesystem::path& root, const std::vector<std::string>& observatories) {
  m_root = root;
  return createObservatoryDirs(root, observatories);
}

bool SvgOutput::write(const Frame& frame) {
  const auto path = framePath(m_root, frame.observatory, frame.timeHours, "svg");
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    core::log(core::LogLevel::Error, "SvgOutput: failed to open " + path.string());
    return false;
  }
  render(f, frame);
  return static_cast<bool>(f);
}

void SvgOutput::render(std::ostream& out, const Frame& frame) const {
  const double size = static_cast<double>(std::max(1, m_options.sizePx));
  const double half = size / 2.0;
  // Chart coordinates to pixels, north (+y) up.
  const auto toPx = [half](const ChartPoint& p) { return ChartPoint{half * (1.0 + p.x), half * (1.0 - p.y)}; };

  out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << size << "\" height=\"" << size
      << "\" viewBox=\"0 0 " << size << " " << size << "\">\n";
  out << "<rect width=\"100%\" height=\"100%\" fill=\"" << m_options.background << "\"/>\n";

  for (const auto& line : frame.lines) {
    const auto a = projectOrthographic(line.start);
    const auto b = projectOrthographic(line.end);
    if (!a || !b) continue;
    const auto pa = toPx(*a);
    const auto pb = toPx(*b);
    out << "<line x1=\"" << pa.x << "\" y1=\"" << pa.y << "\" x2=\"" << pb.x << "\" y2=\"" << pb.y
        << "\" stroke=\"" << m_options.lineStroke << "\" stroke-width=\"1\"/>\n";
  }

  for (const auto& o : frame.observations) {
    const auto p = projectOrthographic(o.position);
    if (!p) continue;
    const auto px = toPx(*p);
    const double r = std::max(m_options.minRadiusPx, frame.tree.angularRadius(o.body, o.position.radius) * half);

    out << "<circle cx=\"" << px.x << "\" cy=\"" << px.y << "\" r=\"" << r << "\" fill=\"" << m_options.bodyFill
        << "\"><title>";
    writeEscaped(out, frame.tree.nameOf(o.body));
    out << "</title></circle>\n";
  }

  out << "</svg>\n";
}

} // namespace orrery::out
