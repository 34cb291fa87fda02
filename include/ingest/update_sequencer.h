#pragma once

#include "common/proximity_types.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace ingest {

enum class SequenceDecision : std::uint8_t {
  APPLY        = 0,
  DUPLICATE    = 1,  // identical state already indexed
  OUT_OF_ORDER = 2,  // older than the last accepted sample
  CONFLICT     = 3   // same timestamp, different content
};

// UpdateSequencer controls WHETHER a write for an entity may be applied.
// - Writes for one entity are serialized by a striped mutex held across
//   read-current -> decide -> upsert.
// - Different entities (in different stripes) proceed in parallel.
class UpdateSequencer {
public:
  explicit UpdateSequencer(std::size_t n_stripes = 256);

  std::unique_lock<std::mutex> Lock(prox::EntityId id);

  // existing == nullptr means the entity is not indexed yet.
  static SequenceDecision Decide(const prox::Entity* existing, const prox::Entity& candidate);

  std::size_t NumStripes() const { return stripes_.size(); }

private:
  std::vector<std::mutex> stripes_;
};

} // namespace ingest
