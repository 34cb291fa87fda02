#define BOOST_TEST_MODULE SpatialIndexTests
#include <boost/test/unit_test.hpp>

#include "index/uniform_grid_index.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <random>
#include <thread>
#include <vector>

namespace {

prox::Entity at(prox::EntityId id, double e, double n, double t = 100.0) {
  prox::Entity x;
  x.id = id;
  x.point.e_m = e;
  x.point.n_m = n;
  x.position.timestamp_s = t;
  x.last_updated_at_s = t;
  return x;
}

bool contains(const std::vector<idx::CellKey>& keys, const idx::CellKey& k) {
  return std::find(keys.begin(), keys.end(), k) != keys.end();
}

bool member_of(const idx::CellView& v, prox::EntityId id) {
  for (const auto& e : v) {
    if (e.id == id) return true;
  }
  return false;
}

} // namespace

BOOST_AUTO_TEST_SUITE(UniformGridIndexTests)

BOOST_AUTO_TEST_CASE(CellForUsesFloor) {
  idx::UniformGridIndex index(50.0);
  BOOST_CHECK(index.CellFor(0.0, 0.0) == (idx::CellKey{0, 0}));
  BOOST_CHECK(index.CellFor(49.99, 49.99) == (idx::CellKey{0, 0}));
  BOOST_CHECK(index.CellFor(50.0, -0.01) == (idx::CellKey{1, -1}));
  BOOST_CHECK(index.CellFor(-120.0, 75.0) == (idx::CellKey{-3, 1}));
}

BOOST_AUTO_TEST_CASE(MaxRadiusTouchesAtMostThreeByThree) {
  idx::UniformGridIndex index(50.0);
  std::mt19937_64 rng(7);
  std::uniform_real_distribution<double> u(-500.0, 500.0);
  for (int i = 0; i < 200; ++i) {
    const auto cells = index.CellsWithinRadius(u(rng), u(rng), 50.0);
    BOOST_CHECK_LE(cells.size(), 9u);
    BOOST_CHECK(std::is_sorted(cells.begin(), cells.end()));
  }
}

BOOST_AUTO_TEST_CASE(CoverageIncludesEveryPointWithinRadius) {
  idx::UniformGridIndex index(50.0);
  std::mt19937_64 rng(11);
  std::uniform_real_distribution<double> u(-300.0, 300.0);
  std::uniform_real_distribution<double> ang(0.0, 6.283185307179586);
  std::uniform_real_distribution<double> rr(0.0, 1.0);

  for (int i = 0; i < 500; ++i) {
    const double ce = u(rng);
    const double cn = u(rng);
    const double radius = 0.5 + 49.5 * rr(rng);
    const double a = ang(rng);
    const double d = radius * rr(rng);
    const double pe = ce + d * std::cos(a);
    const double pn = cn + d * std::sin(a);

    const auto cells = index.CellsWithinRadius(ce, cn, radius);
    BOOST_CHECK(contains(cells, index.CellFor(pe, pn)));
  }
}

BOOST_AUTO_TEST_CASE(InsertUpdateMoveRemove) {
  idx::UniformGridIndex index(50.0);

  BOOST_CHECK(index.Upsert(at(1, 10.0, 10.0)) == idx::UpsertOutcome::INSERTED);
  const idx::CellKey c0{0, 0};
  const std::uint64_t v1 = index.CellVersion(c0);
  BOOST_CHECK_EQUAL(v1, 1u);

  // identical state: no version bump
  BOOST_CHECK(index.Upsert(at(1, 10.0, 10.0)) == idx::UpsertOutcome::UNCHANGED);
  BOOST_CHECK_EQUAL(index.CellVersion(c0), v1);

  BOOST_CHECK(index.Upsert(at(1, 20.0, 10.0, 101.0)) == idx::UpsertOutcome::UPDATED);
  BOOST_CHECK_GT(index.CellVersion(c0), v1);

  const std::uint64_t before_move = index.CellVersion(c0);
  BOOST_CHECK(index.Upsert(at(1, 70.0, 10.0, 102.0)) == idx::UpsertOutcome::MOVED);
  BOOST_CHECK_GT(index.CellVersion(c0), before_move);
  BOOST_CHECK(!member_of(index.EntitiesIn(c0), 1));
  BOOST_CHECK(member_of(index.EntitiesIn(idx::CellKey{1, 0}), 1));
  BOOST_CHECK_EQUAL(index.Size(), 1u);

  prox::Entity got;
  BOOST_REQUIRE(index.Lookup(1, got));
  BOOST_CHECK_EQUAL(got.point.e_m, 70.0);

  BOOST_CHECK(index.Remove(1));
  BOOST_CHECK(!index.Remove(1));
  BOOST_CHECK(!index.Lookup(1, got));
  BOOST_CHECK_EQUAL(index.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(EntityIdZeroIsRejected) {
  idx::UniformGridIndex index(50.0);
  BOOST_CHECK_THROW(index.Upsert(at(0, 1.0, 1.0)), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(RemoveIfHonorsPredicate) {
  idx::UniformGridIndex index(50.0);
  index.Upsert(at(5, 1.0, 1.0));

  BOOST_CHECK(!index.RemoveIf(5, [](const prox::Entity&) { return false; }));
  BOOST_CHECK_EQUAL(index.Size(), 1u);
  BOOST_CHECK(index.RemoveIf(5, [](const prox::Entity& e) { return e.id == 5; }));
  BOOST_CHECK_EQUAL(index.Size(), 0u);
}

BOOST_AUTO_TEST_CASE(SnapshotIsIndependentOfLaterWrites) {
  idx::UniformGridIndex index(50.0);
  index.Upsert(at(1, 1.0, 1.0));
  index.Upsert(at(2, 2.0, 2.0));

  const idx::CellView view = index.EntitiesIn(idx::CellKey{0, 0});
  index.Remove(1);
  index.Upsert(at(3, 3.0, 3.0));

  BOOST_CHECK_EQUAL(view.size(), 2u);
  BOOST_CHECK(member_of(view, 1));
  BOOST_CHECK(member_of(view, 2));
  BOOST_CHECK(!member_of(view, 3));
}

BOOST_AUTO_TEST_CASE(HaltedCellRejectsMutationButStaysReadable) {
  idx::UniformGridIndex index(50.0);
  index.Upsert(at(1, 1.0, 1.0));
  const idx::CellKey c0{0, 0};

  index.HaltCell(c0, "test");
  BOOST_CHECK(index.IsHalted(c0));

  BOOST_CHECK_THROW(index.Upsert(at(2, 2.0, 2.0)), idx::IndexCorruption);
  BOOST_CHECK_THROW(index.Upsert(at(1, 2.0, 2.0, 101.0)), idx::IndexCorruption);
  BOOST_CHECK_THROW(index.Remove(1), idx::IndexCorruption);

  // moving into the halted cell from elsewhere fails too
  index.Upsert(at(7, 60.0, 1.0));
  BOOST_CHECK_THROW(index.Upsert(at(7, 3.0, 3.0, 101.0)), idx::IndexCorruption);

  const idx::CellView view = index.EntitiesIn(c0);
  BOOST_CHECK(view.halted);
  BOOST_CHECK(member_of(view, 1));

  // other cells are unaffected
  BOOST_CHECK(index.Upsert(at(8, 160.0, 1.0)) == idx::UpsertOutcome::INSERTED);

  try {
    index.Upsert(at(9, 4.0, 4.0));
    BOOST_FAIL("expected IndexCorruption");
  } catch (const idx::IndexCorruption& ex) {
    BOOST_CHECK(ex.cell() == c0);
  }
}

BOOST_AUTO_TEST_CASE(AuditOnConsistentIndexHaltsNothing) {
  idx::UniformGridIndex index(50.0);
  for (prox::EntityId id = 1; id <= 100; ++id) {
    index.Upsert(at(id, static_cast<double>(id) * 7.0, static_cast<double>(id % 13) * 11.0));
  }
  const idx::IntegrityReport r = index.AuditIntegrity();
  BOOST_CHECK_EQUAL(r.entities_checked, 100u);
  BOOST_CHECK(r.halted_cells.empty());
}

// Two writers repeatedly moving disjoint entity sets into one shared cell.
// Every entity must end up in exactly one cell, and the shared cell must
// hold all of them.
BOOST_AUTO_TEST_CASE(ConcurrentMovesIntoSameCellLoseNothing) {
  idx::UniformGridIndex index(50.0);
  constexpr int kPerThread = 200;
  constexpr int kRounds = 20;

  auto writer = [&](prox::EntityId base, double home_e) {
    for (int round = 0; round < kRounds; ++round) {
      const double t = 100.0 + round;
      const bool in_target = (round == kRounds - 1) || (round % 2 == 1);
      for (int i = 0; i < kPerThread; ++i) {
        const double e = in_target ? (1.0 + 0.1 * i) : home_e;
        index.Upsert(at(base + static_cast<prox::EntityId>(i), e, 25.0, t));
      }
    }
  };

  std::thread a(writer, 1000, -80.0);   // home cell (-2, 0)
  std::thread b(writer, 5000, 180.0);   // home cell (3, 0)
  a.join();
  b.join();

  const idx::CellView target = index.EntitiesIn(idx::CellKey{0, 0});
  BOOST_CHECK_EQUAL(target.size(), static_cast<std::size_t>(2 * kPerThread));
  BOOST_CHECK_EQUAL(index.Size(), static_cast<std::size_t>(2 * kPerThread));
  BOOST_CHECK_EQUAL(index.EntitiesIn(idx::CellKey{-2, 0}).size(), 0u);
  BOOST_CHECK_EQUAL(index.EntitiesIn(idx::CellKey{3, 0}).size(), 0u);

  const idx::IntegrityReport r = index.AuditIntegrity();
  BOOST_CHECK(r.halted_cells.empty());
}

BOOST_AUTO_TEST_CASE(ConcurrentReadersSeeConsistentSnapshots) {
  idx::UniformGridIndex index(50.0);
  std::atomic<bool> stop{false};
  std::atomic<int> bad{0};

  std::thread reader([&]() {
    while (!stop.load()) {
      const idx::CellView v = index.EntitiesIn(idx::CellKey{0, 0});
      for (const auto& e : v) {
        if (index.CellFor(e.point.e_m, e.point.n_m) != v.key) bad.fetch_add(1);
      }
    }
  });

  for (int round = 0; round < 50; ++round) {
    for (prox::EntityId id = 1; id <= 50; ++id) {
      const double e = (round % 2 == 0) ? 10.0 : 60.0;
      index.Upsert(at(id, e, 10.0, 100.0 + round));
    }
  }
  stop.store(true);
  reader.join();

  BOOST_CHECK_EQUAL(bad.load(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
