#include "ingest/ingest_pipeline.h"

#include "common/log.h"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ingest {
namespace {

bool purgeable(const prox::Entity& e, double now_s, double user_staleness_s) {
  if (e.status == prox::EntityStatus::EXPIRED || e.status == prox::EntityStatus::DELETED) return true;
  if (e.kind == prox::EntityKind::TAG) return e.has_expiry && now_s >= e.expires_at_s;
  return user_staleness_s > 0.0 && (now_s - e.last_updated_at_s) > user_staleness_s;
}

} // namespace

const char* ToString(AckKind k) {
  switch (k) {
    case AckKind::ACCEPTED:          return "accepted";
    case AckKind::ACCEPTED_ADVISORY: return "accepted_advisory";
    case AckKind::DUPLICATE:         return "duplicate";
  }
  return "unknown";
}

EntityAttributes AttributesOf(const prox::Entity& e) {
  EntityAttributes a;
  a.visibility_radius_m = e.visibility_radius_m;
  a.status = e.status;
  a.visibility = e.visibility;
  a.status_level = e.status_level;
  a.owner_id = e.owner_id;
  a.has_expiry = e.has_expiry;
  a.expires_at_s = e.expires_at_s;
  return a;
}

IngestPipeline::IngestPipeline(const IngestConfig& cfg,
                               const coord::CoordinateFusion& fusion,
                               idx::ISpatialIndex& index,
                               sched::ServiceMetrics* metrics)
    : cfg_(cfg),
      fusion_(fusion),
      index_(index),
      metrics_(metrics),
      sequencer_(cfg.sequencer_stripes) {
  if (!(cfg_.precision_threshold_m > 0.0)) throw std::runtime_error("IngestPipeline: precision_threshold_m must be > 0");
  if (!(cfg_.min_altitude_m < cfg_.max_altitude_m)) throw std::runtime_error("IngestPipeline: altitude range is empty");
  if (!(cfg_.max_accuracy_m > 0.0)) throw std::runtime_error("IngestPipeline: max_accuracy_m must be > 0");
  if (!(cfg_.min_visibility_radius_m > 0.0) || !(cfg_.min_visibility_radius_m <= cfg_.max_visibility_radius_m)) {
    throw std::runtime_error("IngestPipeline: invalid visibility radius range");
  }
}

void IngestPipeline::count(sched::Counter c) {
  if (metrics_) metrics_->Increment(c);
}

IngestResult IngestPipeline::reject(prox::IngestErrorKind kind, const std::string& reason) {
  switch (kind) {
    case prox::IngestErrorKind::INVALID_DATA:     count(sched::Counter::INGEST_INVALID); break;
    case prox::IngestErrorKind::PRECISION_ERROR:  count(sched::Counter::INGEST_PRECISION); break;
    case prox::IngestErrorKind::BACKPRESSURE:     count(sched::Counter::INGEST_BACKPRESSURE); break;
    case prox::IngestErrorKind::INDEX_CORRUPTION: count(sched::Counter::INGEST_CORRUPTION); break;
  }
  if (logu::should_log(logu::LogLevel::DEBUG)) {
    std::cerr << "DEBUG: ingest rejected (" << prox::ToString(kind) << "): " << reason << "\n";
  }
  return IngestResult::Fail(prox::IngestError{kind, reason});
}

std::optional<std::string> IngestPipeline::ValidateSample(const prox::SpatialSample& s) const {
  std::ostringstream oss;
  if (!std::isfinite(s.latitude_deg) || s.latitude_deg < -90.0 || s.latitude_deg > 90.0) {
    oss << "latitude out of range: " << s.latitude_deg;
    return oss.str();
  }
  if (!std::isfinite(s.longitude_deg) || s.longitude_deg < -180.0 || s.longitude_deg > 180.0) {
    oss << "longitude out of range: " << s.longitude_deg;
    return oss.str();
  }
  if (!std::isfinite(s.altitude_m) || s.altitude_m < cfg_.min_altitude_m || s.altitude_m > cfg_.max_altitude_m) {
    oss << "altitude out of range: " << s.altitude_m;
    return oss.str();
  }
  if (!std::isfinite(s.horizontal_accuracy_m) || s.horizontal_accuracy_m < 0.0 ||
      s.horizontal_accuracy_m > cfg_.max_accuracy_m) {
    oss << "horizontal accuracy out of range: " << s.horizontal_accuracy_m;
    return oss.str();
  }
  if (!std::isfinite(s.vertical_accuracy_m) || s.vertical_accuracy_m < 0.0) {
    oss << "vertical accuracy out of range: " << s.vertical_accuracy_m;
    return oss.str();
  }
  if (!std::isfinite(s.confidence) || s.confidence < 0.0 || s.confidence > 1.0) {
    oss << "confidence out of range: " << s.confidence;
    return oss.str();
  }
  if (!std::isfinite(s.timestamp_s)) {
    return std::string("timestamp is not finite");
  }
  return std::nullopt;
}

std::optional<std::string> IngestPipeline::validate_attributes(const EntityAttributes& a) const {
  if (!std::isfinite(a.visibility_radius_m) ||
      a.visibility_radius_m < cfg_.min_visibility_radius_m ||
      a.visibility_radius_m > cfg_.max_visibility_radius_m) {
    std::ostringstream oss;
    oss << "visibility radius " << a.visibility_radius_m << " outside ["
        << cfg_.min_visibility_radius_m << ", " << cfg_.max_visibility_radius_m << "]";
    return oss.str();
  }
  if (a.has_expiry && !std::isfinite(a.expires_at_s)) {
    return std::string("expiry is not finite");
  }
  return std::nullopt;
}

IngestResult IngestPipeline::Submit(prox::EntityId id,
                                    prox::EntityKind kind,
                                    const prox::SpatialSample& sample,
                                    const EntityAttributes& attrs) {
  if (id == 0) return reject(prox::IngestErrorKind::INVALID_DATA, "entity id 0 is reserved");
  if (auto err = ValidateSample(sample)) return reject(prox::IngestErrorKind::INVALID_DATA, *err);
  if (auto err = validate_attributes(attrs)) return reject(prox::IngestErrorKind::INVALID_DATA, *err);

  auto guard = sequencer_.Lock(id);

  prox::Entity existing;
  const bool has_existing = index_.Lookup(id, existing);
  if (has_existing && existing.kind != kind) {
    return reject(prox::IngestErrorKind::INVALID_DATA,
                  std::string("entity kind mismatch: indexed as ") + prox::ToString(existing.kind));
  }

  const bool require_precision =
      attrs.require_precision ||
      (kind == prox::EntityKind::TAG && !has_existing && cfg_.tags_require_precision);

  return apply_locked(id, kind, sample, attrs, require_precision, has_existing ? &existing : nullptr);
}

IngestResult IngestPipeline::UpdateLocation(prox::EntityId id, const prox::SpatialSample& sample) {
  if (id == 0) return reject(prox::IngestErrorKind::INVALID_DATA, "entity id 0 is reserved");
  if (auto err = ValidateSample(sample)) return reject(prox::IngestErrorKind::INVALID_DATA, *err);

  auto guard = sequencer_.Lock(id);

  prox::Entity existing;
  if (index_.Lookup(id, existing)) {
    return apply_locked(id, existing.kind, sample, AttributesOf(existing), false, &existing);
  }
  return apply_locked(id, prox::EntityKind::USER, sample, EntityAttributes{}, false, nullptr);
}

IngestResult IngestPipeline::apply_locked(prox::EntityId id,
                                          prox::EntityKind kind,
                                          const prox::SpatialSample& sample,
                                          const EntityAttributes& attrs,
                                          bool require_precision,
                                          const prox::Entity* existing) {
  const bool lidar_grade = prox::IsLidarGrade(sample, cfg_.precision_threshold_m);
  if (require_precision && !lidar_grade) {
    std::ostringstream oss;
    oss << "LiDAR-grade sample required (source=" << prox::ToString(sample.source_kind)
        << ", horizontal accuracy " << sample.horizontal_accuracy_m
        << " m, threshold " << cfg_.precision_threshold_m << " m)";
    return reject(prox::IngestErrorKind::PRECISION_ERROR, oss.str());
  }

  prox::Entity e;
  e.id = id;
  e.kind = kind;
  e.position = sample;
  e.position.source_kind = lidar_grade ? prox::SourceKind::LIDAR : prox::SourceKind::ADVISORY;
  e.point = fusion_.Fuse(e.position);
  e.visibility_radius_m = attrs.visibility_radius_m;
  e.status = attrs.status;
  e.visibility = attrs.visibility;
  e.status_level = attrs.status_level;
  e.owner_id = attrs.owner_id;
  e.has_expiry = attrs.has_expiry;
  e.expires_at_s = attrs.has_expiry ? attrs.expires_at_s : 0.0;
  e.created_at_s = existing ? existing->created_at_s : sample.timestamp_s;
  e.last_updated_at_s = sample.timestamp_s;

  switch (UpdateSequencer::Decide(existing, e)) {
    case SequenceDecision::OUT_OF_ORDER: {
      std::ostringstream oss;
      oss << "out-of-order sample: t=" << sample.timestamp_s
          << " older than last accepted t=" << existing->last_updated_at_s;
      return reject(prox::IngestErrorKind::INVALID_DATA, oss.str());
    }
    case SequenceDecision::CONFLICT: {
      std::ostringstream oss;
      oss << "conflicting sample for already accepted t=" << sample.timestamp_s;
      return reject(prox::IngestErrorKind::INVALID_DATA, oss.str());
    }
    case SequenceDecision::DUPLICATE:
      count(sched::Counter::INGEST_DUPLICATE);
      return IngestResult::Ok(AckKind::DUPLICATE);
    case SequenceDecision::APPLY:
      break;
  }

  try {
    index_.Upsert(e);
  } catch (const idx::IndexCorruption& ex) {
    return reject(prox::IngestErrorKind::INDEX_CORRUPTION, ex.what());
  }

  if (lidar_grade) {
    count(sched::Counter::INGEST_ACCEPTED);
    return IngestResult::Ok(AckKind::ACCEPTED);
  }
  count(sched::Counter::INGEST_ADVISORY);
  return IngestResult::Ok(AckKind::ACCEPTED_ADVISORY);
}

prox::Result<bool, prox::IngestError> IngestPipeline::Remove(prox::EntityId id) {
  using RemoveResult = prox::Result<bool, prox::IngestError>;
  auto guard = sequencer_.Lock(id);
  try {
    const bool removed = index_.Remove(id);
    if (removed) count(sched::Counter::ENTITIES_REMOVED);
    return RemoveResult::Ok(removed);
  } catch (const idx::IndexCorruption& ex) {
    count(sched::Counter::INGEST_CORRUPTION);
    return RemoveResult::Fail(prox::IngestError{prox::IngestErrorKind::INDEX_CORRUPTION, ex.what()});
  }
}

std::size_t IngestPipeline::PurgeExpired(double now_s, double user_staleness_s) {
  std::size_t n_purged = 0;
  const auto pred = [&](const prox::Entity& e) { return purgeable(e, now_s, user_staleness_s); };

  for (prox::EntityId id : index_.AllIds()) {
    auto guard = sequencer_.Lock(id);
    try {
      if (index_.RemoveIf(id, pred)) ++n_purged;
    } catch (const idx::IndexCorruption& ex) {
      if (logu::should_log(logu::LogLevel::WARN)) {
        std::cerr << "WARNING: purge skipped entity " << id << ": " << ex.what() << "\n";
      }
    }
  }

  if (metrics_ && n_purged) metrics_->Increment(sched::Counter::ENTITIES_PURGED, n_purged);
  return n_purged;
}

} // namespace ingest
