#include "index/uniform_grid_index.h"

#include "common/log.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace idx {

static inline std::int32_t floor_to_i32(double v) {
  const double f = std::floor(v);
  if (!std::isfinite(f) ||
      f < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
      f > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    throw std::runtime_error("UniformGridIndex: cell coord overflow");
  }
  return static_cast<std::int32_t>(f);
}

UniformGridIndex::UniformGridIndex(double cell_m) : cell_m_(cell_m) {
  if (!(cell_m_ > 0.0)) throw std::runtime_error("UniformGridIndex: cell_m must be > 0");
}

CellKey UniformGridIndex::CellFor(double e_m, double n_m) const {
  const double inv = 1.0 / cell_m_;
  return CellKey{floor_to_i32(e_m * inv), floor_to_i32(n_m * inv)};
}

CellBounds UniformGridIndex::Bounds(const CellKey& key) const {
  CellBounds b;
  b.min_e = static_cast<double>(key.ix) * cell_m_;
  b.max_e = b.min_e + cell_m_;
  b.min_n = static_cast<double>(key.iy) * cell_m_;
  b.max_n = b.min_n + cell_m_;
  return b;
}

UniformGridIndex::DirStripe& UniformGridIndex::stripe_for(prox::EntityId id) const {
  // Fibonacci hash so sequential ids spread over stripes.
  const std::uint64_t h = id * 0x9E3779B97F4A7C15ULL;
  return stripes_[static_cast<std::size_t>(h >> 58) % kDirStripes];
}

UniformGridIndex::Cell* UniformGridIndex::find_cell(const CellKey& key) const {
  std::shared_lock<std::shared_mutex> lock(cells_mu_);
  auto it = cells_.find(key);
  return (it == cells_.end()) ? nullptr : it->second.get();
}

UniformGridIndex::Cell& UniformGridIndex::get_or_create_cell(const CellKey& key) {
  if (Cell* c = find_cell(key)) return *c;

  std::unique_lock<std::shared_mutex> lock(cells_mu_);
  auto [it, inserted] = cells_.try_emplace(key, nullptr);
  if (inserted) {
    it->second = std::make_unique<Cell>();
    it->second->key = key;
  }
  return *it->second;
}

std::unique_lock<std::shared_mutex> UniformGridIndex::lock_cell(Cell& cell) const {
  std::unique_lock<std::shared_mutex> lock(cell.mu, std::try_to_lock);
  if (!lock.owns_lock()) {
    contention_.fetch_add(1, std::memory_order_relaxed);
    lock.lock();
  }
  return lock;
}

void UniformGridIndex::ensure_mutable(const Cell& cell) const {
  if (cell.halted.load(std::memory_order_acquire)) {
    throw IndexCorruption(cell.key, "UniformGridIndex: cell " + ToString(cell.key) + " is halted");
  }
}

void UniformGridIndex::halt(Cell& cell, const std::string& reason) {
  const bool was_halted = cell.halted.exchange(true, std::memory_order_acq_rel);
  if (!was_halted && logu::should_log(logu::LogLevel::ERROR)) {
    std::cerr << "ERROR: index corruption, halting cell " << ToString(cell.key)
              << ": " << reason << "\n";
  }
}

void UniformGridIndex::corrupt(Cell& cell, const std::string& what) {
  halt(cell, what);
  throw IndexCorruption(cell.key, "UniformGridIndex: " + what + " (cell " + ToString(cell.key) + ")");
}

UpsertOutcome UniformGridIndex::Upsert(const prox::Entity& entity) {
  if (entity.id == 0) throw std::runtime_error("UniformGridIndex::Upsert: entity id 0 is reserved");

  const CellKey new_key = CellFor(entity.point.e_m, entity.point.n_m);

  DirStripe& stripe = stripe_for(entity.id);
  std::lock_guard<std::mutex> dir_lock(stripe.mu);

  Cell& new_cell = get_or_create_cell(new_key);
  auto it_dir = stripe.where.find(entity.id);

  // First sighting.
  if (it_dir == stripe.where.end()) {
    auto lock = lock_cell(new_cell);
    ensure_mutable(new_cell);
    if (new_cell.members.count(entity.id)) {
      corrupt(new_cell, "entity " + std::to_string(entity.id) + " present without directory entry");
    }
    new_cell.members.emplace(entity.id, entity);
    new_cell.version.fetch_add(1, std::memory_order_acq_rel);
    stripe.where.emplace(entity.id, new_key);
    size_.fetch_add(1, std::memory_order_relaxed);
    return UpsertOutcome::INSERTED;
  }

  const CellKey old_key = it_dir->second;

  // Same cell: in-place update.
  if (old_key == new_key) {
    auto lock = lock_cell(new_cell);
    ensure_mutable(new_cell);
    auto it = new_cell.members.find(entity.id);
    if (it == new_cell.members.end()) {
      corrupt(new_cell, "entity " + std::to_string(entity.id) + " missing from its recorded cell");
    }
    if (prox::SameObservableState(it->second, entity)) return UpsertOutcome::UNCHANGED;
    it->second = entity;
    new_cell.version.fetch_add(1, std::memory_order_acq_rel);
    return UpsertOutcome::UPDATED;
  }

  // Cross-cell move: both locks, ascending key order.
  Cell* old_cell = find_cell(old_key);
  if (!old_cell) {
    throw IndexCorruption(old_key, "UniformGridIndex: recorded cell " + ToString(old_key) + " does not exist");
  }

  Cell* first = (old_key < new_key) ? old_cell : &new_cell;
  Cell* second = (old_key < new_key) ? &new_cell : old_cell;
  auto lock_first = lock_cell(*first);
  auto lock_second = lock_cell(*second);
  ensure_mutable(*old_cell);
  ensure_mutable(new_cell);

  auto it_old = old_cell->members.find(entity.id);
  if (it_old == old_cell->members.end()) {
    corrupt(*old_cell, "entity " + std::to_string(entity.id) + " missing from its recorded cell");
  }
  if (new_cell.members.count(entity.id)) {
    halt(*old_cell, "entity " + std::to_string(entity.id) + " found in two cells");
    corrupt(new_cell, "entity " + std::to_string(entity.id) + " found in two cells");
  }

  old_cell->members.erase(it_old);
  new_cell.members.emplace(entity.id, entity);
  old_cell->version.fetch_add(1, std::memory_order_acq_rel);
  new_cell.version.fetch_add(1, std::memory_order_acq_rel);
  it_dir->second = new_key;
  return UpsertOutcome::MOVED;
}

bool UniformGridIndex::remove_locked(DirStripe& stripe, prox::EntityId id,
                                     const std::function<bool(const prox::Entity&)>* pred) {
  auto it_dir = stripe.where.find(id);
  if (it_dir == stripe.where.end()) return false;

  Cell* cell = find_cell(it_dir->second);
  if (!cell) {
    throw IndexCorruption(it_dir->second, "UniformGridIndex: recorded cell " + ToString(it_dir->second) + " does not exist");
  }

  auto lock = lock_cell(*cell);
  ensure_mutable(*cell);
  auto it = cell->members.find(id);
  if (it == cell->members.end()) {
    corrupt(*cell, "entity " + std::to_string(id) + " missing from its recorded cell");
  }
  if (pred && !(*pred)(it->second)) return false;

  cell->members.erase(it);
  cell->version.fetch_add(1, std::memory_order_acq_rel);
  stripe.where.erase(it_dir);
  size_.fetch_sub(1, std::memory_order_relaxed);
  return true;
}

bool UniformGridIndex::Remove(prox::EntityId id) {
  DirStripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> dir_lock(stripe.mu);
  return remove_locked(stripe, id, nullptr);
}

bool UniformGridIndex::RemoveIf(prox::EntityId id, const std::function<bool(const prox::Entity&)>& pred) {
  DirStripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> dir_lock(stripe.mu);
  return remove_locked(stripe, id, &pred);
}

std::vector<CellKey> UniformGridIndex::CellsWithinRadius(double e_m, double n_m, double radius_m) const {
  if (!(radius_m >= 0.0) || !std::isfinite(radius_m)) {
    throw std::runtime_error("UniformGridIndex::CellsWithinRadius: radius must be finite and >= 0");
  }

  const double inv = 1.0 / cell_m_;
  const std::int32_t ix0 = floor_to_i32((e_m - radius_m) * inv);
  const std::int32_t ix1 = floor_to_i32((e_m + radius_m) * inv);
  const std::int32_t iy0 = floor_to_i32((n_m - radius_m) * inv);
  const std::int32_t iy1 = floor_to_i32((n_m + radius_m) * inv);

  const double r2 = radius_m * radius_m;
  std::vector<CellKey> out;
  out.reserve(static_cast<std::size_t>(ix1 - ix0 + 1) * static_cast<std::size_t>(iy1 - iy0 + 1));

  // ix-major loops yield keys already in ascending order.
  for (std::int32_t ix = ix0; ix <= ix1; ++ix) {
    for (std::int32_t iy = iy0; iy <= iy1; ++iy) {
      const CellKey key{ix, iy};
      const CellBounds b = Bounds(key);
      // closest point of the cell rectangle to the center
      const double ce = std::min(std::max(e_m, b.min_e), b.max_e);
      const double cn = std::min(std::max(n_m, b.min_n), b.max_n);
      const double de = ce - e_m;
      const double dn = cn - n_m;
      if (de * de + dn * dn <= r2) out.push_back(key);
    }
  }
  return out;
}

CellView UniformGridIndex::EntitiesIn(const CellKey& key) const {
  CellView view;
  view.key = key;

  const Cell* cell = find_cell(key);
  if (!cell) return view;

  std::shared_lock<std::shared_mutex> lock(cell->mu, std::try_to_lock);
  if (!lock.owns_lock()) {
    contention_.fetch_add(1, std::memory_order_relaxed);
    lock.lock();
  }
  view.version = cell->version.load(std::memory_order_acquire);
  view.halted = cell->halted.load(std::memory_order_acquire);
  view.members.reserve(cell->members.size());
  for (const auto& kv : cell->members) view.members.push_back(kv.second);
  return view;
}

std::uint64_t UniformGridIndex::CellVersion(const CellKey& key) const {
  const Cell* cell = find_cell(key);
  return cell ? cell->version.load(std::memory_order_acquire) : 0;
}

bool UniformGridIndex::Lookup(prox::EntityId id, prox::Entity& out) const {
  DirStripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> dir_lock(stripe.mu);
  auto it_dir = stripe.where.find(id);
  if (it_dir == stripe.where.end()) return false;

  const Cell* cell = find_cell(it_dir->second);
  if (!cell) return false;
  std::shared_lock<std::shared_mutex> lock(cell->mu);
  auto it = cell->members.find(id);
  if (it == cell->members.end()) return false;
  out = it->second;
  return true;
}

prox::IdList UniformGridIndex::AllIds() const {
  prox::IdList out;
  out.reserve(Size());
  for (DirStripe& stripe : stripes_) {
    std::lock_guard<std::mutex> lock(stripe.mu);
    for (const auto& kv : stripe.where) out.push_back(kv.first);
  }
  return out;
}

void UniformGridIndex::HaltCell(const CellKey& key, const std::string& reason) {
  Cell& cell = get_or_create_cell(key);
  halt(cell, reason);
}

bool UniformGridIndex::IsHalted(const CellKey& key) const {
  const Cell* cell = find_cell(key);
  return cell ? cell->halted.load(std::memory_order_acquire) : false;
}

std::size_t UniformGridIndex::NumCells() const {
  std::shared_lock<std::shared_mutex> lock(cells_mu_);
  return cells_.size();
}

IntegrityReport UniformGridIndex::AuditIntegrity() {
  // Stop-the-world: every stripe (ascending), then every cell shared (ascending).
  std::vector<std::unique_lock<std::mutex>> dir_locks;
  dir_locks.reserve(kDirStripes);
  for (DirStripe& stripe : stripes_) dir_locks.emplace_back(stripe.mu);

  std::vector<Cell*> cells;
  {
    std::shared_lock<std::shared_mutex> lock(cells_mu_);
    cells.reserve(cells_.size());
    for (auto& kv : cells_) cells.push_back(kv.second.get());
  }
  std::sort(cells.begin(), cells.end(), [](const Cell* a, const Cell* b) { return a->key < b->key; });

  std::vector<std::shared_lock<std::shared_mutex>> cell_locks;
  cell_locks.reserve(cells.size());
  for (Cell* c : cells) cell_locks.emplace_back(c->mu);

  IntegrityReport report;
  report.cells_checked = cells.size();

  std::unordered_map<prox::EntityId, CellKey> seen;
  std::unordered_set<Cell*> bad;
  for (Cell* c : cells) {
    for (const auto& kv : c->members) {
      ++report.entities_checked;
      auto [it, inserted] = seen.emplace(kv.first, c->key);
      if (!inserted) {
        bad.insert(c);
        if (Cell* other = find_cell(it->second)) bad.insert(other);
        continue;
      }
      const DirStripe& stripe = stripe_for(kv.first);
      auto it_dir = stripe.where.find(kv.first);
      if (it_dir == stripe.where.end() || it_dir->second != c->key) bad.insert(c);
    }
  }
  for (const DirStripe& stripe : stripes_) {
    for (const auto& kv : stripe.where) {
      if (!seen.count(kv.first)) {
        if (Cell* c = find_cell(kv.second)) bad.insert(c);
      }
    }
  }

  for (Cell* c : bad) {
    if (!c->halted.load(std::memory_order_acquire)) {
      halt(*c, "integrity audit found inconsistent membership");
      report.halted_cells.push_back(c->key);
    }
  }
  std::sort(report.halted_cells.begin(), report.halted_cells.end());
  return report;
}

} // namespace idx
