// src/main.cpp
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/EmulatorConfig.hpp"
#include "core/storage/DomainDirectory.hpp"
#include "services/api/ActionDispatcher.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// --config <file> anywhere after the command
static std::string configArg(int argc, char** argv) {
  for (int i = 2; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") return argv[i + 1];
  }
  return {};
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve [--config file.json]  # start the emulator (LSDB_PORT or 8080)\n"
            << "  " << argv0 << " --list  [--config file.json]  # print existing domains\n"
            << "Environment: LSDB_CONFIG, LSDB_DATA_DIR, LSDB_BIND_ADDR, LSDB_PORT,\n"
            << "             LSDB_DOMAIN_CAP, LSDB_LOG_LEVEL\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string cmd = argc > 1 ? argv[1] : "";
    if (cmd != "--serve" && cmd != "--list") {
      print_usage(argv[0]);
      return 1;
    }

    const lsdb::EmulatorConfig cfg = lsdb::loadConfig(configArg(argc, argv));
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    lsdb::DomainDirectory directory(cfg);

    if (cmd == "--list") {
      for (const auto& name : directory.listDomains()) std::cout << name << "\n";
      return 0;
    }

    spdlog::info("data directory {}, domain cap {}", directory.root(), directory.domainCap());
    lsdb::ActionDispatcher dispatcher(directory);
    return lsdb::run_http_server(dispatcher, cfg.bind_addr, cfg.port) ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
