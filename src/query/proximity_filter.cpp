#include "query/proximity_filter.h"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>

namespace query {
namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

std::string fmt_double(double v) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return oss.str();
}

} // namespace

bool Matches(const Filter& f, const prox::Entity& e) {
  return std::visit([&](const auto& x) -> bool {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, StatusLevelFilter>) {
      return static_cast<int>(e.status_level) >= static_cast<int>(x.min_level);
    } else if constexpr (std::is_same_v<T, KindFilter>) {
      return e.kind == prox::EntityKind::USER ? x.users : x.tags;
    } else if constexpr (std::is_same_v<T, PrecisionFilter>) {
      if (x.lidar_only && e.position.source_kind != prox::SourceKind::LIDAR) return false;
      if (x.max_horizontal_accuracy_m > 0.0 &&
          e.position.horizontal_accuracy_m > x.max_horizontal_accuracy_m) return false;
      if (x.min_confidence > 0.0 && e.position.confidence < x.min_confidence) return false;
      return true;
    } else {
      static_assert(kAlwaysFalse<T>, "unhandled filter");
    }
  }, f);
}

std::string Describe(const Filter& f) {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, StatusLevelFilter>) {
      return std::string("level>=") + prox::ToString(x.min_level);
    } else if constexpr (std::is_same_v<T, KindFilter>) {
      return std::string("kind:") + (x.users ? "u" : "") + (x.tags ? "t" : "");
    } else if constexpr (std::is_same_v<T, PrecisionFilter>) {
      return std::string("prec:") + (x.lidar_only ? "lidar" : "any") +
             ",acc<=" + fmt_double(x.max_horizontal_accuracy_m) +
             ",conf>=" + fmt_double(x.min_confidence);
    } else {
      static_assert(kAlwaysFalse<T>, "unhandled filter");
    }
  }, f);
}

bool FilterSet::Matches(const prox::Entity& e) const {
  for (const auto& f : filters_) {
    if (!query::Matches(f, e)) return false;
  }
  return true;
}

std::string FilterSet::Signature() const {
  if (filters_.empty()) return "all";

  std::vector<std::string> parts;
  parts.reserve(filters_.size());
  for (const auto& f : filters_) parts.push_back(Describe(f));
  std::sort(parts.begin(), parts.end());
  parts.erase(std::unique(parts.begin(), parts.end()), parts.end());

  std::string sig;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) sig += ';';
    sig += parts[i];
  }
  return sig;
}

} // namespace query
