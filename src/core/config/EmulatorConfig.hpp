#pragma once
#include <cstddef>
#include <string>

namespace lsdb {

struct EmulatorConfig {
  std::string data_dir   = "lsdbdata";   // one SQLite file per domain
  std::string bind_addr  = "0.0.0.0";
  int         port       = 8080;
  std::size_t domain_cap = 100;          // mimics the real service's default quota
  std::string log_level  = "info";
};

// Overlays keys present in a JSON object file onto cfg.
// Throws std::runtime_error on unreadable files, bad JSON or bad values.
void applyConfigFile(EmulatorConfig& cfg, const std::string& path);

// Overlays LSDB_DATA_DIR, LSDB_BIND_ADDR, LSDB_PORT, LSDB_DOMAIN_CAP, LSDB_LOG_LEVEL.
void applyEnvironment(EmulatorConfig& cfg);

// defaults -> configPath (or LSDB_CONFIG when empty) -> environment
EmulatorConfig loadConfig(const std::string& configPath);

} // namespace lsdb
