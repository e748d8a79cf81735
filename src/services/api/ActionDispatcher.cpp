#include "ActionDispatcher.hpp"

#include <spdlog/spdlog.h>

#include "services/api/ResponseWriter.hpp"

namespace lsdb {

int httpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidParameterValue:
    case ErrorKind::MissingParameter:      return 400;
    case ErrorKind::NumberDomainsExceeded: return 409;
    case ErrorKind::InternalError:         return 500;
  }
  return 500;
}

std::optional<std::string> ActionDispatcher::handle(const std::string& action,
                                                    const ParamMap& params,
                                                    const std::string& requestId) {
  if (action == "CreateDomain") {
    directory_.createDomain(requireParameter(params, "DomainName"));
    return renderEmpty(action, requestId);
  }
  if (action == "DeleteDomain") {
    directory_.deleteDomain(requireParameter(params, "DomainName"));
    return renderEmpty(action, requestId);
  }
  if (action == "ListDomains") {
    return renderListDomains(directory_.listDomains(), requestId);
  }
  if (action == "DeleteAttributes") {
    const std::string& domain = requireParameter(params, "DomainName");
    const std::string& item = requireParameter(params, "ItemName");
    if (!decodeAttributeNames(params).empty()) {
      spdlog::debug("DeleteAttributes on {}/{}: attribute subset ignored, deleting item", domain, item);
    }
    attributes_.deleteAttributes(domain, item);
    return renderEmpty(action, requestId);
  }
  if (action == "PutAttributes") {
    attributes_.putAttributes(requireParameter(params, "DomainName"),
                              requireParameter(params, "ItemName"),
                              decodeAttributes(params));
    return renderEmpty(action, requestId);
  }
  if (action == "GetAttributes") {
    auto attrs = attributes_.getAttributes(requireParameter(params, "DomainName"),
                                           requireParameter(params, "ItemName"));
    return renderGetAttributes(attrs, requestId);
  }
  if (action == "BatchPutAttributes") {
    attributes_.batchPutAttributes(requireParameter(params, "DomainName"), decodeBatchItems(params));
    return renderEmpty(action, requestId);
  }
  if (action == "Select") {
    return renderSelect(select_.selectItems(requireParameter(params, "SelectExpression")), requestId);
  }
  return std::nullopt;
}

DispatchResult ActionDispatcher::dispatch(const ParamMap& params) {
  const std::string requestId = newRequestId();
  DispatchResult res;

  try {
    const std::string& action = requireParameter(params, "Action");
    spdlog::debug("[{}] {}", requestId, action);

    auto body = handle(action, params, requestId);
    if (!body) {
      spdlog::warn("[{}] unsupported action {} ({} parameter(s))", requestId, action, params.size());
      res.contentType = "text/plain";
      res.body = "like, whatever.";
      return res;
    }
    res.body = std::move(*body);
  } catch (const SdbError& e) {
    if (e.kind() == ErrorKind::InternalError) {
      spdlog::error("[{}] {}", requestId, e.what());
    } else {
      spdlog::debug("[{}] {}: {}", requestId, e.code(), e.what());
    }
    res.status = httpStatusFor(e.kind());
    res.body = renderError(e, requestId);
  } catch (const std::exception& e) {
    spdlog::error("[{}] unexpected failure: {}", requestId, e.what());
    res.status = 500;
    res.body = renderError(SdbError::internal(e.what()), requestId);
  }
  return res;
}

} // namespace lsdb
