#pragma once

#include "index/spatial_index.h"     // idx::ISpatialIndex

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace idx {

// Uniform square grid over the fusion frame with one reader/writer lock per cell.
//
// Locking:
// - entity directory: kDirStripes striped mutexes (id -> cell), taken first
// - cell map: shared_mutex, held only to find/create a cell, never while
//   waiting on a cell lock (audit excepted, which owns every stripe)
// - cells: shared_mutex each; writers lock in ascending CellKey order
//
// Cells are created on first insert and never erased, so versions stay
// monotonic and Cell pointers stay valid for the index lifetime.
class UniformGridIndex final : public ISpatialIndex {
public:
  explicit UniformGridIndex(double cell_m = 50.0);

  double CellSizeMeters() const override { return cell_m_; }
  CellKey CellFor(double e_m, double n_m) const override;
  CellBounds Bounds(const CellKey& key) const override;

  UpsertOutcome Upsert(const prox::Entity& entity) override;
  bool Remove(prox::EntityId id) override;
  bool RemoveIf(prox::EntityId id, const std::function<bool(const prox::Entity&)>& pred) override;

  std::vector<CellKey> CellsWithinRadius(double e_m, double n_m, double radius_m) const override;
  CellView EntitiesIn(const CellKey& key) const override;
  std::uint64_t CellVersion(const CellKey& key) const override;

  bool Lookup(prox::EntityId id, prox::Entity& out) const override;
  std::size_t Size() const override { return size_.load(std::memory_order_relaxed); }
  prox::IdList AllIds() const override;

  void HaltCell(const CellKey& key, const std::string& reason) override;
  bool IsHalted(const CellKey& key) const override;
  IntegrityReport AuditIntegrity() override;

  std::uint64_t ContentionCount() const override { return contention_.load(std::memory_order_relaxed); }

  std::size_t NumCells() const;

private:
  struct Cell {
    CellKey key{};
    mutable std::shared_mutex mu;
    std::unordered_map<prox::EntityId, prox::Entity> members;
    std::atomic<std::uint64_t> version{0};
    std::atomic<bool> halted{false};
  };

  struct DirStripe {
    std::mutex mu;
    std::unordered_map<prox::EntityId, CellKey> where;
  };

  static constexpr std::size_t kDirStripes = 64;

  using CellMap = std::unordered_map<CellKey, std::unique_ptr<Cell>, CellKeyHash>;

  DirStripe& stripe_for(prox::EntityId id) const;
  Cell* find_cell(const CellKey& key) const;
  Cell& get_or_create_cell(const CellKey& key);

  std::unique_lock<std::shared_mutex> lock_cell(Cell& cell) const;
  void ensure_mutable(const Cell& cell) const;
  [[noreturn]] void corrupt(Cell& cell, const std::string& what);
  void halt(Cell& cell, const std::string& reason);

  bool remove_locked(DirStripe& stripe, prox::EntityId id,
                     const std::function<bool(const prox::Entity&)>* pred);

  double cell_m_ = 50.0;

  mutable std::shared_mutex cells_mu_;
  CellMap cells_;

  mutable std::array<DirStripe, kDirStripes> stripes_;

  std::atomic<std::size_t> size_{0};
  mutable std::atomic<std::uint64_t> contention_{0};
};

} // namespace idx
