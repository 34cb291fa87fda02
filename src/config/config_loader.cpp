#include "config/config_loader.h"

#include "config/xml_utils.h"
#include "config/path_utils.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace fs = std::filesystem;

namespace cfg {

static std::string schema_for_root(const std::string& root_name) {
  // Map root element names to schema filenames in xsd_dir.
  static const std::unordered_map<std::string, std::string> m = {
    {"SystemConfig", "system.xsd"},
    {"RuntimeProfiles", "runtime_profiles.xsd"},
    {"Engine", "engine.xsd"},
    {"Cache", "cache.xsd"},
    {"Performance", "performance.xsd"},
    {"DemoScenario", "demo_scenario.xsd"},
  };
  auto it = m.find(root_name);
  return (it == m.end()) ? std::string("") : it->second;
}

static void validate_if_enabled(void* doc,
                                const std::string& xsd_dir,
                                const std::string& xml_path) {
  if (xsd_dir.empty()) return;

  const std::string root = xmlu::RootName(doc);
  const std::string schema = schema_for_root(root);
  if (schema.empty()) {
    throw std::runtime_error("No schema mapping for root element '" + root + "' (file: " + xml_path + ")");
  }

  fs::path xsd_path = fs::path(xsd_dir) / schema;
  if (!fs::exists(xsd_path)) {
    throw std::runtime_error("Schema file not found: " + xsd_path.string());
  }

  xmlu::ValidateOrThrow(doc, xsd_path.string(), xml_path);
}

static void expect_root(void* doc, const std::string& expected, const std::string& xml_path) {
  const std::string root = xmlu::RootName(doc);
  if (root != expected) {
    throw std::runtime_error("Expected root <" + expected + "> but found <" + root + "> in " + xml_path);
  }
}

static SystemConfig parse_system(void* doc) {
  SystemConfig c;
  c.active.runtime_profile_id = xmlu::GetAttr(doc, "SystemConfig/Active/RuntimeProfile", "id");
  c.active.cache_profile_id   = xmlu::GetAttr(doc, "SystemConfig/Active/CacheProfile", "id");

  c.refs.base_dir              = xmlu::GetAttr(doc, "SystemConfig/Refs", "baseDir");
  c.refs.runtime_profiles_href = xmlu::GetAttr(doc, "SystemConfig/Refs/RuntimeProfiles", "href");
  c.refs.engine_href           = xmlu::GetAttr(doc, "SystemConfig/Refs/Engine", "href");
  c.refs.cache_href            = xmlu::GetAttr(doc, "SystemConfig/Refs/Cache", "href");
  c.refs.performance_href      = xmlu::GetAttr(doc, "SystemConfig/Refs/Performance", "href");
  c.refs.demo_scenario_href    = xmlu::GetAttr(doc, "SystemConfig/Refs/DemoScenario", "href");

  if (c.active.runtime_profile_id.empty() || c.active.cache_profile_id.empty()) {
    throw std::runtime_error("system.xml missing Active selection IDs.");
  }
  if (c.refs.runtime_profiles_href.empty() || c.refs.engine_href.empty() || c.refs.cache_href.empty()) {
    throw std::runtime_error("system.xml missing required Refs hrefs.");
  }
  return c;
}

static RuntimeProfiles parse_runtime_profiles(void* doc) {
  RuntimeProfiles out;
  auto nodes = xmlu::FindNodes(doc, "RuntimeProfiles/Profile");
  for (void* n : nodes) {
    RuntimeProfile p;
    p.id = xmlu::NodeGetAttr(n, "id");
    if (p.id.empty()) throw std::runtime_error("RuntimeProfiles/Profile missing id attribute.");

    p.request_threads        = xmlu::NodeGetIntChild(n, "RequestThreads", p.request_threads);
    p.request_queue_capacity = xmlu::NodeGetIntChild(n, "RequestQueueCapacity", p.request_queue_capacity);
    p.worker_threads         = xmlu::NodeGetIntChild(n, "WorkerThreads", p.worker_threads);
    p.worker_queue_capacity  = xmlu::NodeGetIntChild(n, "WorkerQueueCapacity", p.worker_queue_capacity);
    p.time_budget_ms         = xmlu::NodeGetDoubleChild(n, "TimeBudgetMs", p.time_budget_ms);
    p.parallel_threshold     = xmlu::NodeGetIntChild(n, "ParallelThreshold", p.parallel_threshold);
    p.parallel_chunk         = xmlu::NodeGetIntChild(n, "ParallelChunk", p.parallel_chunk);
    p.maintenance_interval_s = xmlu::NodeGetDoubleChild(n, "MaintenanceIntervalSeconds", p.maintenance_interval_s);

    const std::string where = "RuntimeProfiles/Profile '" + p.id + "'";
    if (p.request_threads <= 0) throw std::runtime_error(where + " has invalid RequestThreads.");
    if (p.request_queue_capacity <= 0) throw std::runtime_error(where + " has invalid RequestQueueCapacity.");
    if (p.worker_threads <= 0) throw std::runtime_error(where + " has invalid WorkerThreads.");
    if (p.worker_queue_capacity <= 0) throw std::runtime_error(where + " has invalid WorkerQueueCapacity.");
    if (p.time_budget_ms < 0.0) throw std::runtime_error(where + " has invalid TimeBudgetMs.");
    if (p.parallel_threshold <= 0 || p.parallel_chunk <= 0) throw std::runtime_error(where + " has invalid parallel settings.");
    if (p.maintenance_interval_s <= 0.0) throw std::runtime_error(where + " has invalid MaintenanceIntervalSeconds.");
    out.by_id[p.id] = p;
  }
  if (out.by_id.empty()) {
    throw std::runtime_error("No RuntimeProfiles/Profile entries found.");
  }
  return out;
}

static double req_attr_double(void* doc, const std::string& path, const std::string& attr) {
  const std::string s = xmlu::GetAttr(doc, path, attr);
  if (s.empty()) throw std::runtime_error("Missing attribute '" + attr + "' at " + path);
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid number '" + s + "' for attribute '" + attr + "' at " + path);
  }
  if (used != s.size()) throw std::runtime_error("Invalid number '" + s + "' for attribute '" + attr + "' at " + path);
  return v;
}

static EngineCfg parse_engine(void* doc) {
  EngineCfg e;
  e.origin.lat_deg = req_attr_double(doc, "Engine/Origin", "lat");
  e.origin.lon_deg = req_attr_double(doc, "Engine/Origin", "lon");
  const std::string alt = xmlu::GetAttr(doc, "Engine/Origin", "alt");
  if (!alt.empty()) e.origin.alt_m = req_attr_double(doc, "Engine/Origin", "alt");

  e.cell_size_m = xmlu::GetDouble(doc, "Engine/Index/CellSizeMeters", e.cell_size_m);

  e.ingest.precision_threshold_m  = xmlu::GetDouble(doc, "Engine/Ingest/PrecisionThresholdMeters", e.ingest.precision_threshold_m);
  e.ingest.min_altitude_m         = xmlu::GetDouble(doc, "Engine/Ingest/MinAltitudeMeters", e.ingest.min_altitude_m);
  e.ingest.max_altitude_m         = xmlu::GetDouble(doc, "Engine/Ingest/MaxAltitudeMeters", e.ingest.max_altitude_m);
  e.ingest.max_accuracy_m         = xmlu::GetDouble(doc, "Engine/Ingest/MaxAccuracyMeters", e.ingest.max_accuracy_m);
  e.ingest.tags_require_precision = xmlu::GetBoolText(doc, "Engine/Ingest/TagsRequirePrecision", e.ingest.tags_require_precision);

  e.query.min_radius_m        = xmlu::GetDouble(doc, "Engine/Query/MinRadiusMeters", e.query.min_radius_m);
  e.query.max_radius_m        = xmlu::GetDouble(doc, "Engine/Query/MaxRadiusMeters", e.query.max_radius_m);
  e.query.default_max_results = xmlu::GetInt(doc, "Engine/Query/DefaultMaxResults", e.query.default_max_results);
  e.query.max_results_cap     = xmlu::GetInt(doc, "Engine/Query/MaxResultsCap", e.query.max_results_cap);
  e.query.user_staleness_s    = xmlu::GetDouble(doc, "Engine/Query/UserStalenessSeconds", e.query.user_staleness_s);

  e.quality.ultra_min_fraction  = xmlu::GetDouble(doc, "Engine/ScanQuality/UltraMinFraction", e.quality.ultra_min_fraction);
  e.quality.high_min_fraction   = xmlu::GetDouble(doc, "Engine/ScanQuality/HighMinFraction", e.quality.high_min_fraction);
  e.quality.medium_min_fraction = xmlu::GetDouble(doc, "Engine/ScanQuality/MediumMinFraction", e.quality.medium_min_fraction);

  if (e.origin.lat_deg < -90.0 || e.origin.lat_deg > 90.0 || e.origin.lon_deg < -180.0 || e.origin.lon_deg > 180.0) {
    throw std::runtime_error("engine.xml Origin is out of range.");
  }
  if (e.cell_size_m <= 0.0) throw std::runtime_error("engine.xml has invalid CellSizeMeters.");
  if (e.ingest.precision_threshold_m <= 0.0) throw std::runtime_error("engine.xml has invalid PrecisionThresholdMeters.");
  if (e.query.min_radius_m <= 0.0 || e.query.max_radius_m < e.query.min_radius_m) {
    throw std::runtime_error("engine.xml has invalid Query radius range.");
  }
  if (e.query.max_results_cap <= 0 || e.query.default_max_results <= 0) {
    throw std::runtime_error("engine.xml has invalid Query result limits.");
  }
  if (!(e.quality.ultra_min_fraction >= e.quality.high_min_fraction &&
        e.quality.high_min_fraction >= e.quality.medium_min_fraction &&
        e.quality.medium_min_fraction >= 0.0 && e.quality.ultra_min_fraction <= 1.0)) {
    throw std::runtime_error("engine.xml ScanQuality fractions must satisfy 0 <= medium <= high <= ultra <= 1.");
  }
  return e;
}

static CacheCfg parse_cache(void* doc) {
  CacheCfg out;
  auto nodes = xmlu::FindNodes(doc, "Cache/Profile");
  for (void* n : nodes) {
    CacheProfile p;
    p.id = xmlu::NodeGetAttr(n, "id");
    if (p.id.empty()) throw std::runtime_error("Cache/Profile missing id attribute.");

    const std::string backend = xmlu::NodeGetTextChild(n, "Backend");
    p.backend = CacheBackendFromText(backend);
    if (p.backend == CacheBackend::NONE && backend != "NONE") {
      throw std::runtime_error("Cache/Profile '" + p.id + "' has unknown Backend '" + backend + "'.");
    }
    p.ttl_s = xmlu::NodeGetDoubleChild(n, "TtlSeconds", p.ttl_s);
    p.max_entries = xmlu::NodeGetIntChild(n, "MaxEntries", p.max_entries);

    const auto sqlite = xmlu::NodeChildren(n, "Sqlite");
    if (!sqlite.empty()) {
      p.db_uri = xmlu::NodeGetTextChild(sqlite.front(), "DbUri");
      p.busy_timeout_ms = xmlu::NodeGetIntChild(sqlite.front(), "BusyTimeoutMs", p.busy_timeout_ms);
    }

    if (p.ttl_s <= 0.0) throw std::runtime_error("Cache/Profile '" + p.id + "' has invalid TtlSeconds.");
    if (p.max_entries <= 0) throw std::runtime_error("Cache/Profile '" + p.id + "' has invalid MaxEntries.");
    if (p.busy_timeout_ms < 0) throw std::runtime_error("Cache/Profile '" + p.id + "' has invalid BusyTimeoutMs.");
    out.by_id[p.id] = p;
  }
  if (out.by_id.empty()) throw std::runtime_error("No Cache/Profile entries found.");
  return out;
}

static PerformanceCfg parse_performance(void* doc) {
  PerformanceCfg p;
  p.diagnostics.print_startup_summary    = xmlu::GetBoolText(doc, "Performance/Diagnostics/PrintStartupSummary", true);
  p.diagnostics.print_metrics_on_exit    = xmlu::GetBoolText(doc, "Performance/Diagnostics/PrintMetricsOnExit", true);
  p.diagnostics.metrics_flush_interval_s = xmlu::GetDouble(doc, "Performance/Diagnostics/MetricsFlushIntervalSeconds", 0.0);
  p.diagnostics.log_level                = xmlu::GetText(doc, "Performance/Diagnostics/LogLevel");
  if (p.diagnostics.metrics_flush_interval_s < 0.0) {
    throw std::runtime_error("performance.xml has invalid MetricsFlushIntervalSeconds.");
  }
  return p;
}

static DemoScenarioCfg parse_demo_scenario(void* doc) {
  DemoScenarioCfg d;
  d.id = xmlu::GetAttr(doc, "DemoScenario", "id");
  const int seed = xmlu::GetInt(doc, "DemoScenario/Seed", 0);
  if (seed < 0) throw std::runtime_error("DemoScenario/Seed invalid.");
  d.seed = static_cast<std::uint32_t>(seed);
  d.extent_m = xmlu::GetDouble(doc, "DemoScenario/ExtentMeters", d.extent_m);
  d.users = xmlu::GetInt(doc, "DemoScenario/Users", 0);
  d.tags = xmlu::GetInt(doc, "DemoScenario/Tags", 0);
  d.tag_ttl_s = xmlu::GetDouble(doc, "DemoScenario/TagTtlSeconds", d.tag_ttl_s);
  d.walk_speed_mps = xmlu::GetDouble(doc, "DemoScenario/WalkSpeedMps", d.walk_speed_mps);

  const auto pop = xmlu::FindNodes(doc, "DemoScenario/Population");
  if (!pop.empty()) {
    auto frac = [&](const char* attr, double def) {
      const std::string s = xmlu::NodeGetAttr(pop.front(), attr);
      return s.empty() ? def : std::stod(s);
    };
    d.elite_fraction = frac("elite", d.elite_fraction);
    d.rare_fraction = frac("rare", d.rare_fraction);
    d.private_fraction = frac("private", d.private_fraction);
  }

  for (void* n : xmlu::FindNodes(doc, "DemoScenario/AccuracyBands/Band")) {
    AccuracyBand b;
    b.source = xmlu::NodeGetAttr(n, "source");
    const std::string f = xmlu::NodeGetAttr(n, "fraction");
    const std::string lo = xmlu::NodeGetAttr(n, "min");
    const std::string hi = xmlu::NodeGetAttr(n, "max");
    b.fraction = f.empty() ? 0.0 : std::stod(f);
    b.min_m = lo.empty() ? 0.0 : std::stod(lo);
    b.max_m = hi.empty() ? 0.0 : std::stod(hi);
    if (b.source != "LIDAR" && b.source != "GPS" && b.source != "NETWORK") {
      throw std::runtime_error("DemoScenario/AccuracyBands/Band has unknown source '" + b.source + "'.");
    }
    if (b.max_m < b.min_m) std::swap(b.min_m, b.max_m);
    d.accuracy_bands.push_back(b);
  }

  if (d.users < 0 || d.tags < 0 || d.users + d.tags == 0) throw std::runtime_error("DemoScenario population is empty or invalid.");
  if (d.extent_m <= 0.0) throw std::runtime_error("DemoScenario/ExtentMeters invalid.");
  if (d.tag_ttl_s <= 0.0) throw std::runtime_error("DemoScenario/TagTtlSeconds invalid.");
  return d;
}

DemoScenarioCfg ConfigLoader::LoadDemoScenario(const std::string& xml_path, const std::string& xsd_dir) {
  void* doc = xmlu::ReadXmlDocOrThrow(xml_path);
  DemoScenarioCfg d;
  try {
    validate_if_enabled(doc, xsd_dir, xml_path);
    expect_root(doc, "DemoScenario", xml_path);
    d = parse_demo_scenario(doc);
  } catch (...) {
    xmlu::FreeXmlDoc(doc);
    throw;
  }
  xmlu::FreeXmlDoc(doc);
  return d;
}

ConfigBundle ConfigLoader::Load(const std::string& system_xml_path, const std::string& xsd_dir) {
  ConfigBundle bundle;
  bundle.paths.system_xml = fs::path(system_xml_path).lexically_normal().string();
  bundle.paths.xsd_dir = xsd_dir;

  // 1) system.xml
  void* sys_doc = xmlu::ReadXmlDocOrThrow(bundle.paths.system_xml);
  try {
    validate_if_enabled(sys_doc, xsd_dir, bundle.paths.system_xml);
    expect_root(sys_doc, "SystemConfig", bundle.paths.system_xml);
    bundle.system = parse_system(sys_doc);
  } catch (...) {
    xmlu::FreeXmlDoc(sys_doc);
    throw;
  }
  xmlu::FreeXmlDoc(sys_doc);

  // Resolve referenced XML paths relative to system.xml and baseDir
  const std::string& sys = bundle.paths.system_xml;
  const std::string base = bundle.system.refs.base_dir;
  bundle.paths.runtime_profiles_xml = pathu::ResolveHref(sys, base, bundle.system.refs.runtime_profiles_href);
  bundle.paths.engine_xml           = pathu::ResolveHref(sys, base, bundle.system.refs.engine_href);
  bundle.paths.cache_xml            = pathu::ResolveHref(sys, base, bundle.system.refs.cache_href);
  pathu::RequireFile(bundle.paths.runtime_profiles_xml, "RuntimeProfiles", sys);
  pathu::RequireFile(bundle.paths.engine_xml, "Engine", sys);
  pathu::RequireFile(bundle.paths.cache_xml, "Cache", sys);

  if (!bundle.system.refs.performance_href.empty()) {
    bundle.paths.performance_xml = pathu::ResolveHref(sys, base, bundle.system.refs.performance_href);
    pathu::RequireFile(bundle.paths.performance_xml, "Performance", sys);
  }
  if (!bundle.system.refs.demo_scenario_href.empty()) {
    bundle.paths.demo_scenario_xml = pathu::ResolveHref(sys, base, bundle.system.refs.demo_scenario_href);
    pathu::RequireFile(bundle.paths.demo_scenario_xml, "DemoScenario", sys);
  }

  // 2) runtime_profiles.xml
  void* rp_doc = xmlu::ReadXmlDocOrThrow(bundle.paths.runtime_profiles_xml);
  RuntimeProfiles rps;
  try {
    validate_if_enabled(rp_doc, xsd_dir, bundle.paths.runtime_profiles_xml);
    expect_root(rp_doc, "RuntimeProfiles", bundle.paths.runtime_profiles_xml);
    rps = parse_runtime_profiles(rp_doc);
  } catch (...) {
    xmlu::FreeXmlDoc(rp_doc);
    throw;
  }
  xmlu::FreeXmlDoc(rp_doc);

  auto it_rp = rps.by_id.find(bundle.system.active.runtime_profile_id);
  if (it_rp == rps.by_id.end()) {
    throw std::runtime_error("Active RuntimeProfile id not found: " + bundle.system.active.runtime_profile_id);
  }
  bundle.runtime = it_rp->second;

  // 3) engine.xml
  void* en_doc = xmlu::ReadXmlDocOrThrow(bundle.paths.engine_xml);
  try {
    validate_if_enabled(en_doc, xsd_dir, bundle.paths.engine_xml);
    expect_root(en_doc, "Engine", bundle.paths.engine_xml);
    bundle.engine = parse_engine(en_doc);
  } catch (...) {
    xmlu::FreeXmlDoc(en_doc);
    throw;
  }
  xmlu::FreeXmlDoc(en_doc);

  // 4) cache.xml
  void* ca_doc = xmlu::ReadXmlDocOrThrow(bundle.paths.cache_xml);
  CacheCfg cc;
  try {
    validate_if_enabled(ca_doc, xsd_dir, bundle.paths.cache_xml);
    expect_root(ca_doc, "Cache", bundle.paths.cache_xml);
    cc = parse_cache(ca_doc);
  } catch (...) {
    xmlu::FreeXmlDoc(ca_doc);
    throw;
  }
  xmlu::FreeXmlDoc(ca_doc);

  auto it_cp = cc.by_id.find(bundle.system.active.cache_profile_id);
  if (it_cp == cc.by_id.end()) {
    throw std::runtime_error("Active CacheProfile id not found: " + bundle.system.active.cache_profile_id);
  }
  bundle.cache_profile = it_cp->second;

  // SQLite db file resolves relative to cache.xml
  if (bundle.cache_profile.backend == CacheBackend::SQLITE &&
      !bundle.cache_profile.db_uri.empty() && bundle.cache_profile.db_uri != ":memory:") {
    bundle.cache_profile.db_uri = pathu::ResolveHref(bundle.paths.cache_xml, "", bundle.cache_profile.db_uri);
  }

  // 5) performance.xml (optional)
  if (!bundle.paths.performance_xml.empty()) {
    void* p_doc = xmlu::ReadXmlDocOrThrow(bundle.paths.performance_xml);
    try {
      validate_if_enabled(p_doc, xsd_dir, bundle.paths.performance_xml);
      expect_root(p_doc, "Performance", bundle.paths.performance_xml);
      bundle.performance = parse_performance(p_doc);
      bundle.has_performance = true;
    } catch (...) {
      xmlu::FreeXmlDoc(p_doc);
      throw;
    }
    xmlu::FreeXmlDoc(p_doc);
  }

  // 6) demo_scenario.xml (optional)
  if (!bundle.paths.demo_scenario_xml.empty()) {
    bundle.demo = LoadDemoScenario(bundle.paths.demo_scenario_xml, xsd_dir);
    bundle.has_demo = true;
  }

  return bundle;
}

} // namespace cfg
