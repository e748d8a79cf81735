#include "DomainDirectory.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

#include "core/errors/SdbError.hpp"

namespace fs = std::filesystem;

namespace lsdb {

// Every SQLite database file starts with this 16-byte string, NUL included.
static constexpr char kSqliteHeader[] = "SQLite format 3";

static bool hasSqliteHeader(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  char buf[sizeof(kSqliteHeader)] = {};
  if (!in.read(buf, sizeof(buf))) return false;
  return std::memcmp(buf, kSqliteHeader, sizeof(kSqliteHeader)) == 0;
}

// SQLite keeps its journal, WAL and shared-memory files next to the database
// as <file>-journal, <file>-wal and <file>-shm.
static constexpr const char* kSqliteSidecars[] = {"-journal", "-wal", "-shm"};

static bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool DomainDirectory::isValidDomainName(const std::string& name) {
  if (name.size() < 3 || name.size() > 255) return false;
  bool charset = std::all_of(name.begin(), name.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.';
  });
  if (!charset) return false;
  // such a domain file would be taken for another domain's sidecar
  for (const char* suffix : kSqliteSidecars) {
    if (endsWith(name, suffix)) return false;
  }
  return true;
}

DomainDirectory::DomainDirectory(std::string root, std::size_t domainCap)
  : root_(std::move(root)), domainCap_(domainCap) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) throw SdbError::internal("cannot create data directory " + root_ + ": " + ec.message());
}

std::string DomainDirectory::pathFor(const std::string& name) const {
  if (!isValidDomainName(name)) throw SdbError::invalidParameter("DomainName", name);
  return (fs::path(root_) / name).string();
}

bool DomainDirectory::exists(const std::string& name) const {
  if (!isValidDomainName(name)) return false;
  const fs::path file = fs::path(root_) / name;
  std::error_code ec;
  return fs::is_regular_file(file, ec) && hasSqliteHeader(file);
}

std::unique_ptr<DomainStore> DomainDirectory::open(const std::string& name) const {
  if (!exists(name)) return nullptr;
  return DomainStore::openExisting(pathFor(name));
}

void DomainDirectory::createDomain(const std::string& name) {
  const std::string path = pathFor(name);
  if (exists(name)) return;

  // not atomic against a concurrent creator; two creates at cap-1 can both pass
  if (listDomains().size() >= domainCap_) throw SdbError::domainsExceeded();

  DomainStore::create(path);
  spdlog::info("created domain {}", name);
}

void DomainDirectory::deleteDomain(const std::string& name) {
  if (!isValidDomainName(name)) return;
  const std::string path = pathFor(name);

  std::error_code ec;
  const bool removed = fs::remove(path, ec);
  if (ec) throw SdbError::internal("cannot delete " + path + ": " + ec.message());

  for (const char* suffix : kSqliteSidecars) {
    const fs::path sidecar = path + suffix;
    // journals and WAL files never carry the database header
    if (!fs::is_regular_file(sidecar, ec) || hasSqliteHeader(sidecar)) continue;
    fs::remove(sidecar, ec);
    if (ec) throw SdbError::internal("cannot delete " + sidecar.string() + ": " + ec.message());
  }
  if (removed) spdlog::info("deleted domain {}", name);
}

std::vector<std::string> DomainDirectory::listDomains() const {
  std::vector<std::string> out;
  std::error_code ec;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (exists(name)) out.push_back(name);
  }
  if (ec) throw SdbError::internal("cannot list " + root_ + ": " + ec.message());
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace lsdb
