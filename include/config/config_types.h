#pragma once
/**
 * @file config_types.h
 * @brief Plain-old-data structures holding the parsed proximity engine configuration.
 *
 * Design goals:
 *  - Keep types simple and stable.
 *  - Parse/validation is handled by ConfigLoader.
 *  - Mapping onto component configs (IngestConfig, QueryConfig, ...) happens in the service.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cfg {

// ------------------------------
// System wiring (system.xml)
// ------------------------------
struct ActiveSelection {
  std::string runtime_profile_id;
  std::string cache_profile_id;
};

struct SystemRefs {
  std::string base_dir;  // optional
  std::string runtime_profiles_href;
  std::string engine_href;
  std::string cache_href;
  std::string performance_href;    // optional
  std::string demo_scenario_href;  // optional
};

struct SystemConfig {
  ActiveSelection active;
  SystemRefs refs;
};

// ------------------------------
// Runtime profiles (runtime_profiles.xml)
// ------------------------------
struct RuntimeProfile {
  std::string id;
  int request_threads = 4;
  int request_queue_capacity = 1024;
  int worker_threads = 2;
  int worker_queue_capacity = 256;
  double time_budget_ms = 100.0;
  int parallel_threshold = 4096;     // optional
  int parallel_chunk = 1024;         // optional
  double maintenance_interval_s = 1.0;
};

struct RuntimeProfiles {
  std::map<std::string, RuntimeProfile> by_id;
};

// ------------------------------
// Engine (engine.xml)
// ------------------------------
struct OriginCfg {
  double lat_deg = 0.0;
  double lon_deg = 0.0;
  double alt_m = 0.0;
};

struct IngestCfg {
  double precision_threshold_m = 0.01;
  double min_altitude_m = -100.0;
  double max_altitude_m = 10000.0;
  double max_accuracy_m = 50.0;
  bool tags_require_precision = true;
};

struct QueryCfg {
  double min_radius_m = 0.5;
  double max_radius_m = 50.0;
  int default_max_results = 100;
  int max_results_cap = 100;
  double user_staleness_s = 300.0;
};

struct ScanQualityCfg {
  double ultra_min_fraction = 0.9;
  double high_min_fraction = 0.6;
  double medium_min_fraction = 0.3;
};

struct EngineCfg {
  OriginCfg origin{};
  double cell_size_m = 50.0;
  IngestCfg ingest{};
  QueryCfg query{};
  ScanQualityCfg quality{};
};

// ------------------------------
// Cache (cache.xml)
// ------------------------------
enum class CacheBackend {
  MEMORY,
  SQLITE,
  NONE
};

inline CacheBackend CacheBackendFromText(const std::string& s) {
  if (s == "MEMORY") return CacheBackend::MEMORY;
  if (s == "SQLITE") return CacheBackend::SQLITE;
  return CacheBackend::NONE;
}

inline const char* ToString(CacheBackend b) {
  switch (b) {
    case CacheBackend::MEMORY: return "MEMORY";
    case CacheBackend::SQLITE: return "SQLITE";
    case CacheBackend::NONE:   return "NONE";
  }
  return "NONE";
}

struct CacheProfile {
  std::string id;
  CacheBackend backend = CacheBackend::MEMORY;
  double ttl_s = 5.0;
  int max_entries = 65536;      // MEMORY only
  std::string db_uri;           // SQLITE only; empty = in-memory
  int busy_timeout_ms = 50;     // SQLITE only
};

struct CacheCfg {
  std::map<std::string, CacheProfile> by_id;
};

// ------------------------------
// Performance (performance.xml)
// ------------------------------
struct DiagnosticsCfg {
  bool print_startup_summary = true;   // optional
  bool print_metrics_on_exit = true;   // optional
  double metrics_flush_interval_s = 0.0;  // optional; 0 disables periodic sink flush
  std::string log_level;               // optional; PROXIMITY_LOG_LEVEL wins when set
};

struct PerformanceCfg {
  DiagnosticsCfg diagnostics{};
};

// ------------------------------
// Demo scenario (demo_scenario.xml)
// ------------------------------
struct AccuracyBand {
  std::string source;   // LIDAR / GPS / NETWORK
  double fraction = 0.0;
  double min_m = 0.0;
  double max_m = 0.0;
};

struct DemoScenarioCfg {
  std::string id;
  std::uint32_t seed = 0;
  double extent_m = 200.0;        // half-width of the square around the origin
  int users = 0;
  int tags = 0;
  double tag_ttl_s = 3600.0;
  double walk_speed_mps = 1.4;
  double elite_fraction = 0.1;
  double rare_fraction = 0.02;
  double private_fraction = 0.05;
  std::vector<AccuracyBand> accuracy_bands;
};

// ------------------------------
// Resolved bundle (what the app uses)
// ------------------------------
struct ResolvedPaths {
  std::string system_xml;
  std::string xsd_dir; // optional
  std::string runtime_profiles_xml;
  std::string engine_xml;
  std::string cache_xml;
  std::string performance_xml;    // optional
  std::string demo_scenario_xml;  // optional
};

struct ConfigBundle {
  ResolvedPaths paths;

  SystemConfig system;
  RuntimeProfile runtime;
  EngineCfg engine;
  CacheProfile cache_profile;

  PerformanceCfg performance;   // default-initialized if not present
  bool has_performance = false;

  DemoScenarioCfg demo;         // default-initialized if not present
  bool has_demo = false;
};

} // namespace cfg
