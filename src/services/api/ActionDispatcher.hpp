#pragma once
#include <optional>
#include <string>

#include "core/errors/SdbError.hpp"
#include "core/metadata/AttributeTable.hpp"
#include "core/query/SelectTranslator.hpp"
#include "core/storage/DomainDirectory.hpp"
#include "services/api/RequestDecoder.hpp"

namespace lsdb {

struct DispatchResult {
  int status = 200;
  std::string contentType = "text/xml";
  std::string body;
};

// Maps one decoded request (Action + flat parameters) onto the emulator core
// and renders the outcome. Never throws: faults become error documents.
class ActionDispatcher {
public:
  explicit ActionDispatcher(DomainDirectory& directory)
    : directory_(directory), attributes_(directory), select_(directory) {}

  DispatchResult dispatch(const ParamMap& params);

private:
  // nullopt for an action the emulator does not implement
  std::optional<std::string> handle(const std::string& action, const ParamMap& params,
                                    const std::string& requestId);

  DomainDirectory& directory_;
  AttributeTable attributes_;
  SelectTranslator select_;
};

// HTTP status for a fault kind.
int httpStatusFor(ErrorKind kind);

} // namespace lsdb
