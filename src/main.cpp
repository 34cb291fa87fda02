/**
 * @file main.cpp
 * @brief Config-driven demo driver for the proximity service.
 *
 * Flow:
 *  - Load the XML bundle (optional XSD validation) and build the service.
 *  - Populate synthetic users/tags from demo_scenario.xml through ProcessScans.
 *  - Run a tick loop: users random-walk and report through the async ingest
 *    path, while proximity queries around random users run at --query-hz.
 *  - Print throughput, latency and cache stats at the end.
 */

#include "common/log.h"
#include "config/config_loader.h"
#include "prox_api/proximity_service.h"
#include "sim/entity_generator.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string arg_value(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == key && i + 1 < argc) {
      return std::string(argv[i + 1]);
    }
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == key) return true;
  }
  return false;
}

double arg_double(int argc, char** argv, const std::string& key, double def) {
  const std::string s = arg_value(argc, argv, key, "");
  if (s.empty()) return def;
  return std::stod(s);
}

std::size_t arg_size_t(int argc, char** argv, const std::string& key, std::size_t def) {
  const std::string s = arg_value(argc, argv, key, "");
  if (s.empty()) return def;
  return static_cast<std::size_t>(std::stoull(s));
}

void print_metrics(const sched::MetricsSnapshot& m) {
  std::cout << "Metrics:\n";
  std::cout << "  uptime_s=" << m.uptime_s
            << " ingest_total=" << m.IngestTotal()
            << " ingest_rate_per_s=" << m.IngestRatePerS() << "\n";
  for (std::size_t i = 0; i < static_cast<std::size_t>(sched::Counter::COUNT); ++i) {
    const auto c = static_cast<sched::Counter>(i);
    std::cout << "  " << sched::ToString(c) << "=" << m.Get(c) << "\n";
  }
  for (std::size_t i = 0; i < static_cast<std::size_t>(sched::Timer::COUNT); ++i) {
    const auto t = static_cast<sched::Timer>(i);
    const sched::HistogramSnapshot& h = m.Get(t);
    std::cout << "  latency." << sched::ToString(t)
              << " n=" << h.count
              << " mean_ms=" << h.MeanMs()
              << " p50_ms<=" << h.QuantileMs(0.5)
              << " p99_ms<=" << h.QuantileMs(0.99)
              << " max_ms=" << h.max_ms << "\n";
  }
  std::cout << "  cache_hit_ratio=" << m.CacheHitRatio()
            << " cell_contention=" << m.cell_contention << "\n";
}

} // namespace

int main(int argc, char** argv) try {
  const std::string system_xml = arg_value(argc, argv, "--config",  "./config/system.xml");
  const std::string xsd_dir    = arg_value(argc, argv, "--xsd-dir", "./schemas");

  const double run_s      = arg_double(argc, argv, "--run-s", 3.0);
  const double tick_hz    = arg_double(argc, argv, "--tick-hz", 2.0);
  const double query_hz   = arg_double(argc, argv, "--query-hz", 50.0);
  const double radius_m   = arg_double(argc, argv, "--radius-m", 25.0);
  const std::size_t users_cli = arg_size_t(argc, argv, "--users", 0);  // 0 => scenario value
  const bool verbose = has_flag(argc, argv, "--verbose");

  const cfg::ConfigBundle cfg = cfg::ConfigLoader::Load(system_xml, xsd_dir);

  // PROXIMITY_LOG_LEVEL wins over performance.xml.
  if (cfg.has_performance && !cfg.performance.diagnostics.log_level.empty() &&
      std::getenv("PROXIMITY_LOG_LEVEL") == nullptr) {
    logu::set_log_level(logu::parse_log_level(cfg.performance.diagnostics.log_level, logu::LogLevel::INFO));
  }

  if (!cfg.has_demo) {
    std::cerr << "ERROR: system.xml does not reference a demo scenario.\n";
    return 2;
  }
  if (tick_hz <= 0.0 || query_hz <= 0.0) {
    std::cerr << "ERROR: --tick-hz and --query-hz must be > 0.\n";
    return 2;
  }

  cfg::DemoScenarioCfg scenario = cfg.demo;
  if (users_cli > 0) scenario.users = static_cast<int>(users_cli);

  const bool print_summary = !cfg.has_performance || cfg.performance.diagnostics.print_startup_summary;
  const bool print_exit = !cfg.has_performance || cfg.performance.diagnostics.print_metrics_on_exit;

  const prox_api::ServiceOptions opts = prox_api::ServiceOptions::FromConfig(cfg);

  std::shared_ptr<sched::IMetricsSink> sink;
  if (opts.metrics_flush_interval_s > 0.0) {
    sink = std::make_shared<sched::StreamMetricsSink>(std::cout, "proximity.");
  }

  prox_api::ProximityService svc(opts, prox_api::Clock{}, nullptr, sink);

  if (print_summary) {
    std::cout << "Config: " << system_xml << "\n";
    std::cout << "XSD:    " << xsd_dir << "\n";
    std::cout << "runtime=" << cfg.runtime.id
              << " request_threads=" << opts.request_threads
              << " worker_threads=" << opts.worker_threads
              << " budget_ms=" << opts.query.default_budget_ms << "\n";
    std::cout << "origin=(" << opts.origin.lat_deg << "," << opts.origin.lon_deg << "," << opts.origin.alt_m << ")"
              << " cell_m=" << opts.cell_size_m << "\n";
    std::cout << "cache=" << cfg.cache_profile.id
              << " backend=" << cfg::ToString(cfg.cache_profile.backend)
              << " enabled=" << (svc.Cache() && svc.Cache()->Enabled() ? "yes" : "no")
              << " ttl_s=" << opts.cache.ttl_s << "\n";
    std::cout << "scenario=" << scenario.id
              << " users=" << scenario.users
              << " tags=" << scenario.tags
              << " extent_m=" << scenario.extent_m << "\n\n";
  }

  // ------------------------------
  // Populate
  // ------------------------------
  sim::EntityGenerator gen(scenario, svc.Fusion());
  std::vector<sim::SyntheticEntity> entities = gen.Populate(svc.Now());

  std::size_t accepted = 0;
  std::size_t advisory = 0;
  std::size_t rejected = 0;
  std::vector<prox_api::ScanRequest> batch;
  batch.reserve(entities.size());
  for (const auto& e : entities) batch.push_back(prox_api::ScanRequest{e.id, e.kind, e.sample, e.attrs});

  const auto pop_t0 = std::chrono::high_resolution_clock::now();
  const std::vector<prox_api::ScanReply> replies = svc.ProcessScans(batch);
  for (std::size_t i = 0; i < replies.size(); ++i) {
    const prox_api::ScanReply& r = replies[i];
    if (!r.accepted) {
      ++rejected;
      if (verbose) {
        std::cout << "  rejected id=" << entities[i].id << " kind=" << prox::ToString(entities[i].kind)
                  << " reason=" << r.reason << "\n";
      }
    } else if (r.ack == ingest::AckKind::ACCEPTED_ADVISORY) {
      ++advisory;
    } else {
      ++accepted;
    }
  }
  const auto pop_t1 = std::chrono::high_resolution_clock::now();

  std::cout << "Populate: entities=" << entities.size()
            << " accepted=" << accepted
            << " advisory=" << advisory
            << " rejected=" << rejected
            << " time_s=" << std::chrono::duration<double>(pop_t1 - pop_t0).count() << "\n";

  // ------------------------------
  // Tick loop
  // ------------------------------
  std::vector<std::size_t> user_rows;
  for (std::size_t i = 0; i < entities.size(); ++i) {
    if (entities[i].kind == prox::EntityKind::USER) user_rows.push_back(i);
  }

  std::mt19937_64 rng(scenario.seed ^ 0x9E3779B97F4A7C15ull);
  const double dt_s = 1.0 / tick_hz;
  const std::size_t queries_per_tick =
      std::max<std::size_t>(1, static_cast<std::size_t>(query_hz / tick_hz));

  std::size_t ticks = 0;
  std::size_t queries_ok = 0;
  std::size_t queries_degraded = 0;
  std::size_t queries_failed = 0;
  std::size_t hits_total = 0;
  std::size_t ingest_failed = 0;

  const auto loop_t0 = std::chrono::steady_clock::now();
  const auto loop_end = loop_t0 + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      std::chrono::duration<double>(run_s));

  while (std::chrono::steady_clock::now() < loop_end) {
    const auto tick_t0 = std::chrono::steady_clock::now();
    ++ticks;

    gen.Walk(entities, dt_s, svc.Now());

    std::vector<std::future<prox_api::ScanReply>> scans;
    scans.reserve(user_rows.size());
    for (std::size_t row : user_rows) {
      scans.push_back(svc.SubmitScanAsync(entities[row].id, entities[row].kind, entities[row].sample,
                                          entities[row].attrs));
    }

    std::vector<std::future<prox_api::ProximityReply>> queries;
    if (!user_rows.empty()) {
      std::uniform_int_distribution<std::size_t> pick(0, user_rows.size() - 1);
      for (std::size_t q = 0; q < queries_per_tick; ++q) {
        const sim::SyntheticEntity& who = entities[user_rows[pick(rng)]];
        query::QueryRequest req;
        req.latitude_deg = who.sample.latitude_deg;
        req.longitude_deg = who.sample.longitude_deg;
        req.altitude_m = who.sample.altitude_m;
        req.radius_m = radius_m;
        req.requester.requester_id = who.id;
        req.requester.status_level = who.attrs.status_level;
        queries.push_back(svc.DetectProximityAsync(req));
      }
    }

    // Futures are all collected before any get().
    for (auto& f : scans) {
      if (!f.get().accepted) ++ingest_failed;
    }
    for (auto& f : queries) {
      const prox_api::ProximityReply r = f.get();
      if (!r.ok) {
        ++queries_failed;
        continue;
      }
      ++queries_ok;
      if (r.degraded) ++queries_degraded;
      hits_total += r.entities.size();
    }

    if (verbose && (ticks <= 3 || ticks % 10 == 0)) {
      std::cout << "  tick=" << ticks
                << " queries_ok=" << queries_ok
                << " avg_hits=" << (queries_ok ? static_cast<double>(hits_total) / queries_ok : 0.0)
                << " ingest_failed=" << ingest_failed << "\n";
    }

    const auto next = tick_t0 + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                    std::chrono::duration<double>(dt_s));
    if (next < loop_end) std::this_thread::sleep_until(next);
  }
  const double loop_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - loop_t0).count();

  svc.Flush();

  std::cout << "Loop: ticks=" << ticks
            << " loop_time_s=" << loop_s
            << " queries_ok=" << queries_ok
            << " degraded=" << queries_degraded
            << " failed=" << queries_failed
            << " avg_hits=" << (queries_ok ? static_cast<double>(hits_total) / queries_ok : 0.0)
            << " ingest_failed=" << ingest_failed << "\n\n";

  if (print_exit) print_metrics(svc.Metrics());

  svc.Shutdown();
  return 0;

} catch (const std::exception& e) {
  std::cerr << "FATAL: " << e.what() << "\n";
  return 1;
}
