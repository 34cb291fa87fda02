#include "common/result.h"

namespace prox {

const char* ToString(IngestErrorKind k) {
  switch (k) {
    case IngestErrorKind::INVALID_DATA:     return "InvalidData";
    case IngestErrorKind::PRECISION_ERROR:  return "PrecisionError";
    case IngestErrorKind::BACKPRESSURE:     return "Backpressure";
    case IngestErrorKind::INDEX_CORRUPTION: return "IndexCorruption";
  }
  return "Unknown";
}

const char* ToString(QueryErrorKind k) {
  switch (k) {
    case QueryErrorKind::INVALID_RADIUS: return "InvalidRadius";
    case QueryErrorKind::INVALID_DATA:   return "InvalidData";
    case QueryErrorKind::BACKPRESSURE:   return "Backpressure";
  }
  return "Unknown";
}

} // namespace prox
