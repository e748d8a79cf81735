#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/config/EmulatorConfig.hpp"
#include "core/storage/DomainStore.hpp"

namespace lsdb {

// The data directory: one SQLite file per domain, named exactly as the domain.
class DomainDirectory {
public:
  DomainDirectory(std::string root, std::size_t domainCap);
  explicit DomainDirectory(const EmulatorConfig& cfg)
    : DomainDirectory(cfg.data_dir, cfg.domain_cap) {}

  // Idempotent. Throws InvalidParameterValue / NumberDomainsExceeded.
  void createDomain(const std::string& name);
  // Silent when the domain does not exist.
  void deleteDomain(const std::string& name);
  std::vector<std::string> listDomains() const;

  bool exists(const std::string& name) const;
  // Backing file of a domain, or nullptr when it does not exist.
  std::unique_ptr<DomainStore> open(const std::string& name) const;
  // Throws InvalidParameterValue for invalid names (see isValidDomainName).
  std::string pathFor(const std::string& name) const;

  const std::string& root() const { return root_; }
  std::size_t domainCap() const { return domainCap_; }

  // [A-Za-z0-9_.-]{3,255}, not ending in -journal, -wal or -shm.
  static bool isValidDomainName(const std::string& name);

private:
  std::string root_;
  std::size_t domainCap_;
};

} // namespace lsdb
