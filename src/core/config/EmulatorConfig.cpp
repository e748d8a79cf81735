#include "EmulatorConfig.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace lsdb {

static std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int checkedPort(long long v) {
  if (v < 1 || v > 65535) throw std::runtime_error("port out of range: " + std::to_string(v));
  return static_cast<int>(v);
}

static std::size_t checkedCap(long long v) {
  if (v < 1) throw std::runtime_error("domain_cap must be positive: " + std::to_string(v));
  return static_cast<std::size_t>(v);
}

static long long parseInt(const std::string& key, const std::string& s) {
  try {
    size_t used = 0;
    long long v = std::stoll(s, &used);
    if (used != s.size()) throw std::invalid_argument(s);
    return v;
  } catch (const std::exception&) {
    throw std::runtime_error(key + " is not an integer: " + s);
  }
}

void applyConfigFile(EmulatorConfig& cfg, const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open config file: " + path);

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("config root must be an object: " + path);

  try {
    if (j.contains("data_dir"))   cfg.data_dir   = j["data_dir"].get<std::string>();
    if (j.contains("bind_addr"))  cfg.bind_addr  = j["bind_addr"].get<std::string>();
    if (j.contains("port"))       cfg.port       = checkedPort(j["port"].get<long long>());
    if (j.contains("domain_cap")) cfg.domain_cap = checkedCap(j["domain_cap"].get<long long>());
    if (j.contains("log_level"))  cfg.log_level  = j["log_level"].get<std::string>();
  } catch (const json::type_error& e) {
    throw std::runtime_error("bad value type in " + path + ": " + e.what());
  }
}

void applyEnvironment(EmulatorConfig& cfg) {
  cfg.data_dir  = get_env_or("LSDB_DATA_DIR", cfg.data_dir);
  cfg.bind_addr = get_env_or("LSDB_BIND_ADDR", cfg.bind_addr);
  cfg.log_level = get_env_or("LSDB_LOG_LEVEL", cfg.log_level);

  const std::string port = get_env_or("LSDB_PORT", "");
  if (!port.empty()) cfg.port = checkedPort(parseInt("LSDB_PORT", port));

  const std::string cap = get_env_or("LSDB_DOMAIN_CAP", "");
  if (!cap.empty()) cfg.domain_cap = checkedCap(parseInt("LSDB_DOMAIN_CAP", cap));
}

EmulatorConfig loadConfig(const std::string& configPath) {
  EmulatorConfig cfg;
  const std::string path = configPath.empty() ? get_env_or("LSDB_CONFIG", "") : configPath;
  if (!path.empty()) applyConfigFile(cfg, path);
  applyEnvironment(cfg);
  return cfg;
}

} // namespace lsdb
