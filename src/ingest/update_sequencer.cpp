#include "ingest/update_sequencer.h"

#include <stdexcept>

namespace ingest {

UpdateSequencer::UpdateSequencer(std::size_t n_stripes) : stripes_(n_stripes) {
  if (n_stripes == 0) throw std::runtime_error("UpdateSequencer: n_stripes must be > 0");
}

std::unique_lock<std::mutex> UpdateSequencer::Lock(prox::EntityId id) {
  const std::uint64_t h = id * 0x9E3779B97F4A7C15ULL;
  return std::unique_lock<std::mutex>(stripes_[static_cast<std::size_t>(h >> 32) % stripes_.size()]);
}

SequenceDecision UpdateSequencer::Decide(const prox::Entity* existing, const prox::Entity& candidate) {
  if (!existing) return SequenceDecision::APPLY;

  const double t_prev = existing->last_updated_at_s;
  const double t_new = candidate.last_updated_at_s;
  if (t_new < t_prev) return SequenceDecision::OUT_OF_ORDER;
  if (t_new == t_prev) {
    return prox::SameObservableState(*existing, candidate) ? SequenceDecision::DUPLICATE
                                                           : SequenceDecision::CONFLICT;
  }
  return SequenceDecision::APPLY;
}

} // namespace ingest
