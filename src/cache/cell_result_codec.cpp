#include "cache/cell_result_codec.h"

#include "cache/cache_store.h"

#include <cstring>
#include <sstream>
#include <type_traits>

namespace cache {
namespace {

// Bytes in one encoded entity record; see the put_* calls in EncodeCellResult.
constexpr std::size_t kEntityRecordBytes = 8 + 1 + 57 + 57 + 8 + 3 + 8 + 8 + 8 + 1 + 8;

// Unsigned integer of the same width as T, used as its wire image.
template <typename T>
using WireBits = std::conditional_t<
    sizeof(T) == 8, std::uint64_t,
    std::conditional_t<sizeof(T) == 4, std::uint32_t,
                       std::conditional_t<sizeof(T) == 2, std::uint16_t, std::uint8_t>>>;

class Writer {
public:
  explicit Writer(std::string& out) : out_(out) {}

  template <typename T>
  void put(T v) {
    static_assert(std::is_arithmetic<T>::value, "arithmetic only");
    WireBits<T> bits;
    static_assert(sizeof(bits) == sizeof(T), "unsupported width");
    std::memcpy(&bits, &v, sizeof(T));
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      out_.push_back(static_cast<char>((bits >> (8 * i)) & 0xFFu));
    }
  }

  void put_enum(std::uint8_t v) { put<std::uint8_t>(v); }

private:
  std::string& out_;
};

class Reader {
public:
  explicit Reader(const std::string& in) : in_(in) {}

  template <typename T>
  T get() {
    static_assert(std::is_arithmetic<T>::value, "arithmetic only");
    if (pos_ + sizeof(T) > in_.size()) {
      std::ostringstream oss;
      oss << "DecodeCellResult: truncated payload at byte " << pos_ << " of " << in_.size();
      throw CacheError(oss.str());
    }
    WireBits<T> bits = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      const auto byte = static_cast<unsigned char>(in_[pos_ + i]);
      bits = static_cast<WireBits<T>>(bits | (static_cast<WireBits<T>>(byte) << (8 * i)));
    }
    pos_ += sizeof(T);
    T v;
    std::memcpy(&v, &bits, sizeof(T));
    return v;
  }

  template <typename E>
  E get_enum(std::uint8_t max_value, const char* what) {
    const auto raw = get<std::uint8_t>();
    if (raw > max_value) {
      throw CacheError(std::string("DecodeCellResult: bad ") + what + " value " + std::to_string(raw));
    }
    return static_cast<E>(raw);
  }

  std::size_t remaining() const { return in_.size() - pos_; }

private:
  const std::string& in_;
  std::size_t pos_ = 0;
};

void put_sample(Writer& w, const prox::SpatialSample& s) {
  w.put(s.latitude_deg);
  w.put(s.longitude_deg);
  w.put(s.altitude_m);
  w.put(s.horizontal_accuracy_m);
  w.put(s.vertical_accuracy_m);
  w.put(s.timestamp_s);
  w.put_enum(static_cast<std::uint8_t>(s.source_kind));
  w.put(s.confidence);
}

prox::SpatialSample get_sample(Reader& r) {
  prox::SpatialSample s;
  s.latitude_deg = r.get<double>();
  s.longitude_deg = r.get<double>();
  s.altitude_m = r.get<double>();
  s.horizontal_accuracy_m = r.get<double>();
  s.vertical_accuracy_m = r.get<double>();
  s.timestamp_s = r.get<double>();
  s.source_kind = r.get_enum<prox::SourceKind>(3, "source_kind");
  s.confidence = r.get<double>();
  return s;
}

void put_point(Writer& w, const prox::SpatialPoint& p) {
  w.put(p.e_m);
  w.put(p.n_m);
  w.put(p.u_m);
  w.put(p.horizontal_accuracy_m);
  w.put(p.vertical_accuracy_m);
  w.put(p.confidence);
  w.put_enum(static_cast<std::uint8_t>(p.source_kind));
  w.put(p.timestamp_s);
}

prox::SpatialPoint get_point(Reader& r) {
  prox::SpatialPoint p;
  p.e_m = r.get<double>();
  p.n_m = r.get<double>();
  p.u_m = r.get<double>();
  p.horizontal_accuracy_m = r.get<double>();
  p.vertical_accuracy_m = r.get<double>();
  p.confidence = r.get<double>();
  p.source_kind = r.get_enum<prox::SourceKind>(3, "point source_kind");
  p.timestamp_s = r.get<double>();
  return p;
}

} // namespace

std::string EncodeCellResult(const CellResult& r) {
  std::string out;
  out.reserve(25 + r.members.size() * kEntityRecordBytes);
  Writer w(out);

  w.put(kCellResultMagic);
  w.put(kCellResultFormat);
  w.put(r.cell.ix);
  w.put(r.cell.iy);
  w.put(r.cell_version);
  w.put(static_cast<std::uint32_t>(r.members.size()));

  for (const auto& e : r.members) {
    w.put(e.id);
    w.put_enum(static_cast<std::uint8_t>(e.kind));
    put_sample(w, e.position);
    put_point(w, e.point);
    w.put(e.visibility_radius_m);
    w.put_enum(static_cast<std::uint8_t>(e.status));
    w.put_enum(static_cast<std::uint8_t>(e.visibility));
    w.put_enum(static_cast<std::uint8_t>(e.status_level));
    w.put(e.owner_id);
    w.put(e.created_at_s);
    w.put(e.last_updated_at_s);
    w.put<std::uint8_t>(e.has_expiry ? 1 : 0);
    w.put(e.expires_at_s);
  }
  return out;
}

CellResult DecodeCellResult(const std::string& payload) {
  Reader r(payload);

  if (r.get<std::uint32_t>() != kCellResultMagic) {
    throw CacheError("DecodeCellResult: bad magic");
  }
  const auto format = r.get<std::uint8_t>();
  if (format != kCellResultFormat) {
    throw CacheError("DecodeCellResult: unsupported format version " + std::to_string(format));
  }

  CellResult out;
  out.cell.ix = r.get<std::int32_t>();
  out.cell.iy = r.get<std::int32_t>();
  out.cell_version = r.get<std::uint64_t>();
  const auto n = r.get<std::uint32_t>();
  if (n > r.remaining() / kEntityRecordBytes) {
    throw CacheError("DecodeCellResult: member count " + std::to_string(n) + " exceeds payload of " +
                     std::to_string(r.remaining()) + " bytes");
  }

  out.members.reserve(n);
  for (std::uint32_t i = 0; i < n; ++i) {
    prox::Entity e;
    e.id = r.get<std::uint64_t>();
    e.kind = r.get_enum<prox::EntityKind>(1, "kind");
    e.position = get_sample(r);
    e.point = get_point(r);
    e.visibility_radius_m = r.get<double>();
    e.status = r.get_enum<prox::EntityStatus>(3, "status");
    e.visibility = r.get_enum<prox::Visibility>(2, "visibility");
    e.status_level = r.get_enum<prox::StatusLevel>(2, "status_level");
    e.owner_id = r.get<std::uint64_t>();
    e.created_at_s = r.get<double>();
    e.last_updated_at_s = r.get<double>();
    e.has_expiry = r.get<std::uint8_t>() != 0;
    e.expires_at_s = r.get<double>();
    out.members.push_back(e);
  }

  if (r.remaining() != 0) {
    throw CacheError("DecodeCellResult: " + std::to_string(r.remaining()) + " trailing bytes");
  }
  return out;
}

} // namespace cache
