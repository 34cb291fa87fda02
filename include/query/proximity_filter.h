#pragma once

#include "common/proximity_types.h"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace query {

// Entity status level at least min_level (REGULAR < ELITE < RARE).
struct StatusLevelFilter {
  prox::StatusLevel min_level = prox::StatusLevel::REGULAR;
};

struct KindFilter {
  bool users = true;
  bool tags = true;
};

// Restrict to authoritative samples.
// max_horizontal_accuracy_m <= 0 and min_confidence <= 0 disable those checks.
struct PrecisionFilter {
  bool lidar_only = true;
  double max_horizontal_accuracy_m = 0.0;
  double min_confidence = 0.0;
};

using Filter = std::variant<StatusLevelFilter, KindFilter, PrecisionFilter>;

bool Matches(const Filter& f, const prox::Entity& e);
std::string Describe(const Filter& f);

// Conjunction of filters. Two sets accepting the same entities by construction
// (same filters, any order) share one Signature(), which keys the cache.
class FilterSet {
public:
  FilterSet() = default;
  FilterSet(std::initializer_list<Filter> filters) : filters_(filters) {}

  FilterSet& Add(const Filter& f) {
    filters_.push_back(f);
    return *this;
  }

  bool Matches(const prox::Entity& e) const;
  std::string Signature() const;

  bool empty() const { return filters_.empty(); }
  std::size_t size() const { return filters_.size(); }
  const std::vector<Filter>& Filters() const { return filters_; }

private:
  std::vector<Filter> filters_;
};

} // namespace query
