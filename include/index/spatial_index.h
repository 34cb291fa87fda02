#pragma once

#include "common/proximity_types.h"
#include "index/cell_key.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace idx {

// Raised when an index invariant is found broken (entity in two cells, member
// missing from its recorded cell) and on any later mutation of the halted cell.
class IndexCorruption : public std::runtime_error {
public:
  IndexCorruption(const CellKey& cell, const std::string& what)
      : std::runtime_error(what), cell_(cell) {}
  const CellKey& cell() const { return cell_; }

private:
  CellKey cell_;
};

enum class UpsertOutcome : std::uint8_t {
  INSERTED  = 0,
  UPDATED   = 1,  // same cell, content changed
  MOVED     = 2,  // crossed a cell boundary
  UNCHANGED = 3   // identical observable state, no version bump
};

// Point-in-time copy of one cell. Iteration is restartable and unaffected by
// later mutation of the cell.
struct CellView {
  CellKey key{};
  std::uint64_t version = 0;
  bool halted = false;
  std::vector<prox::Entity> members;

  std::vector<prox::Entity>::const_iterator begin() const { return members.begin(); }
  std::vector<prox::Entity>::const_iterator end() const { return members.end(); }
  std::size_t size() const { return members.size(); }
};

struct IntegrityReport {
  std::size_t cells_checked = 0;
  std::size_t entities_checked = 0;
  std::vector<CellKey> halted_cells;  // cells halted by this audit
};

// Concurrent cell-partitioned entity index.
// - All methods are thread-safe.
// - Mutations lock only the cells they touch (ascending CellKey order).
class ISpatialIndex {
public:
  virtual ~ISpatialIndex() = default;

  virtual double CellSizeMeters() const = 0;
  virtual CellKey CellFor(double e_m, double n_m) const = 0;
  virtual CellBounds Bounds(const CellKey& key) const = 0;

  // Throws IndexCorruption when the affected cell is (or becomes) halted.
  virtual UpsertOutcome Upsert(const prox::Entity& entity) = 0;
  virtual bool Remove(prox::EntityId id) = 0;

  // Remove only if pred(current entity) holds, evaluated under the cell lock.
  virtual bool RemoveIf(prox::EntityId id, const std::function<bool(const prox::Entity&)>& pred) = 0;

  // Cells whose footprint intersects the circle, sorted ascending.
  virtual std::vector<CellKey> CellsWithinRadius(double e_m, double n_m, double radius_m) const = 0;

  virtual CellView EntitiesIn(const CellKey& key) const = 0;
  virtual std::uint64_t CellVersion(const CellKey& key) const = 0;

  virtual bool Lookup(prox::EntityId id, prox::Entity& out) const = 0;
  virtual std::size_t Size() const = 0;

  // Ids of every indexed entity (unordered); used by maintenance sweeps.
  virtual prox::IdList AllIds() const = 0;

  virtual void HaltCell(const CellKey& key, const std::string& reason) = 0;
  virtual bool IsHalted(const CellKey& key) const = 0;
  virtual IntegrityReport AuditIntegrity() = 0;

  // Number of cell-lock acquisitions that had to wait.
  virtual std::uint64_t ContentionCount() const = 0;
};

} // namespace idx
