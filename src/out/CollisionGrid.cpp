#include "orrery/out/CollisionGrid.h"

#include "orrery/math/Math.h"

#include <algorithm>
#include <cmath>

namespace orrery::out {

std::size_t CollisionGrid::azimuthCell(double azimuth) {
  const double a = math::wrapTwoPi(azimuth);
  const auto cell = static_cast<std::size_t>(a / math::twoPi * static_cast<double>(kAzimuthCells));
  return std::min(cell, kAzimuthCells - 1);
}

std::size_t CollisionGrid::polarCell(double polar) {
  const double p = math::clamp(polar, 0.0, math::pi);
  const auto cell = static_cast<std::size_t>(p / math::pi * static_cast<double>(kPolarCells));
  return std::min(cell, kPolarCells - 1);
}

void CollisionGrid::insert(const SkyDisk& disk) {
  const std::size_t index = m_disks.size();
  const std::size_t row = polarCell(disk.position.polar);
  const std::size_t col = azimuthCell(disk.position.azimuth);

  m_disks.push_back(disk);
  m_large.push_back(disk.angularRadius > kLargeRadius);
  m_row.push_back(row);
  m_col.push_back(col);
  m_cells[row * kAzimuthCells + col].members.push_back(index);
}

void CollisionGrid::clear() {
  for (auto& c : m_cells) c.members.clear();
  m_disks.clear();
  m_large.clear();
  m_row.clear();
  m_col.clear();
}

bool CollisionGrid::neighbours(std::size_t rowA, std::size_t colA, std::size_t rowB, std::size_t colB) {
  const std::size_t rowDelta = rowA > rowB ? rowA - rowB : rowB - rowA;
  if (rowDelta > 1) return false;

  const auto isPole = [](std::size_t r) { return r == 0 || r == kPolarCells - 1; };
  if (isPole(rowA) || isPole(rowB)) return true;

  const std::size_t colDelta = colA > colB ? colA - colB : colB - colA;
  return colDelta <= 1 || colDelta == kAzimuthCells - 1; // wraps at 2pi
}

bool CollisionGrid::testPair(const SkyDisk& a, const SkyDisk& b, double& separation) {
  separation = math::angularSeparation(a.position, b.position);
  return separation < a.angularRadius + b.angularRadius;
}

std::vector<DiskOverlap> CollisionGrid::overlaps() const {
  std::vector<DiskOverlap> out;
  const std::size_t n = m_disks.size();

  for (std::size_t i = 0; i < n; ++i) {
    double separation = 0.0;

    if (m_large[i]) {
      // Large-large pairs once via j > i; large-small always from this side.
      for (std::size_t j = 0; j < n; ++j) {
        if (j == i || (m_large[j] && j < i)) continue;
        if (testPair(m_disks[i], m_disks[j], separation)) out.push_back(DiskOverlap{i, j, separation});
      }
      continue;
    }

    const std::size_t rowLo = m_row[i] > 0 ? m_row[i] - 1 : 0;
    const std::size_t rowHi = std::min(m_row[i] + 1, kPolarCells - 1);
    for (std::size_t row = rowLo; row <= rowHi; ++row) {
      for (std::size_t col = 0; col < kAzimuthCells; ++col) {
        if (!neighbours(m_row[i], m_col[i], row, col)) continue;
        for (std::size_t j : m_cells[row * kAzimuthCells + col].members) {
          if (j <= i || m_large[j]) continue;
          if (testPair(m_disks[i], m_disks[j], separation)) out.push_back(DiskOverlap{i, j, separation});
        }
      }
    }
  }
  return out;
}

} // namespace orrery::out
