#pragma once

#include "orrery/math/Spherical.h"
#include "orrery/sim/BodyTree.h"

#include <array>
#include <cstddef>
#include <vector>

namespace orrery::out {

// Disk on the sky: direction plus angular radius.
struct SkyDisk {
  sim::BodyId body = sim::kNoBody;
  math::Spherical position{};
  double angularRadius = 0.0;
};

struct DiskOverlap {
  std::size_t first = 0;  // index into the inserted disks
  std::size_t second = 0;
  double separation = 0.0;
};

// Buckets disks into azimuth x polar cells so that only neighbouring cells are
// compared. Cells in the two pole rows are narrow, so any row next to a pole
// row is searched in full. Disks too large for a neighbour search are kept in
// a separate list and tested against everything.
class CollisionGrid {
public:
  static constexpr std::size_t kAzimuthCells = 16;
  static constexpr std::size_t kPolarCells = 8;
  static constexpr double kLargeRadius = 0.05;

  void insert(const SkyDisk& disk);
  void clear();

  std::size_t size() const { return m_disks.size(); }
  const SkyDisk& disk(std::size_t i) const { return m_disks[i]; }

  // Each overlapping pair once, first < second by insertion order for pairs of
  // small disks.
  std::vector<DiskOverlap> overlaps() const;

  static std::size_t azimuthCell(double azimuth);
  static std::size_t polarCell(double polar);

private:
  struct Cell {
    std::vector<std::size_t> members;
  };

  static bool neighbours(std::size_t rowA, std::size_t colA, std::size_t rowB, std::size_t colB);
  static bool testPair(const SkyDisk& a, const SkyDisk& b, double& separation);

  std::array<Cell, kAzimuthCells * kPolarCells> m_cells{};
  std::vector<SkyDisk> m_disks;
  std::vector<bool> m_large;
  std::vector<std::size_t> m_row;
  std::vector<std::size_t> m_col;
};

} // namespace orrery::out
