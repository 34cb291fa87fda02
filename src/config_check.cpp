/**
 * @file config_check.cpp
 * @brief Minimal executable that loads + (optionally) validates + prints the proximity config bundle.
 */
#include "config/config_loader.h"

#include <iostream>
#include <string>

static void print_bundle(const cfg::ConfigBundle& b) {
  std::cout << "=== ConfigBundle Summary ===\n";
  std::cout << "system.xml: " << b.paths.system_xml << "\n";
  std::cout << "xsd_dir:    " << (b.paths.xsd_dir.empty() ? "(none)" : b.paths.xsd_dir) << "\n\n";

  std::cout << "[Active]\n";
  std::cout << "  RuntimeProfile: " << b.system.active.runtime_profile_id << "\n";
  std::cout << "  CacheProfile:   " << b.system.active.cache_profile_id << "\n\n";

  std::cout << "[Resolved Paths]\n";
  std::cout << "  runtime_profiles: " << b.paths.runtime_profiles_xml << "\n";
  std::cout << "  engine:           " << b.paths.engine_xml << "\n";
  std::cout << "  cache:            " << b.paths.cache_xml << "\n";
  if (!b.paths.performance_xml.empty()) std::cout << "  performance:      " << b.paths.performance_xml << "\n";
  if (!b.paths.demo_scenario_xml.empty()) std::cout << "  demo_scenario:    " << b.paths.demo_scenario_xml << "\n";
  std::cout << "\n";

  std::cout << "[RuntimeProfile]\n";
  std::cout << "  id=" << b.runtime.id
            << " request_threads=" << b.runtime.request_threads
            << " request_queue=" << b.runtime.request_queue_capacity
            << " worker_threads=" << b.runtime.worker_threads
            << " worker_queue=" << b.runtime.worker_queue_capacity << "\n";
  std::cout << "  time_budget_ms=" << b.runtime.time_budget_ms
            << " parallel_threshold=" << b.runtime.parallel_threshold
            << " parallel_chunk=" << b.runtime.parallel_chunk
            << " maintenance_interval_s=" << b.runtime.maintenance_interval_s << "\n\n";

  std::cout << "[Engine]\n";
  std::cout << "  origin=(" << b.engine.origin.lat_deg << "," << b.engine.origin.lon_deg << ","
            << b.engine.origin.alt_m << ") cell_m=" << b.engine.cell_size_m << "\n";
  std::cout << "  ingest.precision_threshold_m=" << b.engine.ingest.precision_threshold_m
            << " altitude=[" << b.engine.ingest.min_altitude_m << "," << b.engine.ingest.max_altitude_m << "]"
            << " max_accuracy_m=" << b.engine.ingest.max_accuracy_m
            << " tags_require_precision=" << (b.engine.ingest.tags_require_precision ? "true" : "false") << "\n";
  std::cout << "  query.radius=[" << b.engine.query.min_radius_m << "," << b.engine.query.max_radius_m << "]"
            << " default_max_results=" << b.engine.query.default_max_results
            << " max_results_cap=" << b.engine.query.max_results_cap
            << " user_staleness_s=" << b.engine.query.user_staleness_s << "\n";
  std::cout << "  quality.ultra=" << b.engine.quality.ultra_min_fraction
            << " high=" << b.engine.quality.high_min_fraction
            << " medium=" << b.engine.quality.medium_min_fraction << "\n\n";

  std::cout << "[CacheProfile]\n";
  std::cout << "  id=" << b.cache_profile.id
            << " backend=" << cfg::ToString(b.cache_profile.backend)
            << " ttl_s=" << b.cache_profile.ttl_s;
  if (b.cache_profile.backend == cfg::CacheBackend::MEMORY) {
    std::cout << " max_entries=" << b.cache_profile.max_entries;
  } else if (b.cache_profile.backend == cfg::CacheBackend::SQLITE) {
    std::cout << " db_uri=" << (b.cache_profile.db_uri.empty() ? "(memory)" : b.cache_profile.db_uri)
              << " busy_timeout_ms=" << b.cache_profile.busy_timeout_ms;
  }
  std::cout << "\n";

  if (b.has_performance) {
    const cfg::DiagnosticsCfg& d = b.performance.diagnostics;
    std::cout << "\n[Diagnostics]\n";
    std::cout << "  startup_summary=" << (d.print_startup_summary ? "true" : "false")
              << " metrics_on_exit=" << (d.print_metrics_on_exit ? "true" : "false")
              << " flush_interval_s=" << d.metrics_flush_interval_s
              << " log_level=" << (d.log_level.empty() ? "(env)" : d.log_level) << "\n";
  }

  if (b.has_demo) {
    std::cout << "\n[DemoScenario]\n";
    std::cout << "  id=" << b.demo.id << " seed=" << b.demo.seed
              << " users=" << b.demo.users << " tags=" << b.demo.tags
              << " extent_m=" << b.demo.extent_m << "\n";
    for (const auto& band : b.demo.accuracy_bands) {
      std::cout << "  band source=" << band.source << " fraction=" << band.fraction
                << " range_m=[" << band.min_m << "," << band.max_m << "]\n";
    }
  }
}

int main(int argc, char** argv) {
  std::string system_xml = "config/system.xml";
  std::string xsd_dir = ""; // e.g., "schemas"

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      system_xml = argv[++i];
    } else if (a == "--xsd-dir" && i + 1 < argc) {
      xsd_dir = argv[++i];
    } else if (a == "--help" || a == "-h") {
      std::cout << "Usage: config_check [--config <system.xml>] [--xsd-dir <dir>]\n";
      return 0;
    }
  }

  try {
    cfg::ConfigBundle bundle = cfg::ConfigLoader::Load(system_xml, xsd_dir);
    print_bundle(bundle);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Config load failed: " << e.what() << "\n";
    return 2;
  }
}
