#pragma once
#include <string>
#include <vector>

#include "core/errors/SdbError.hpp"
#include "core/metadata/AttributeTable.hpp"
#include "core/query/SelectTranslator.hpp"

namespace lsdb {

inline constexpr const char* kSdbNamespace = "http://sdb.amazonaws.com/doc/2009-04-15/";

// Random UUIDv4 used as RequestId.
std::string newRequestId();

// <ActionResponse> with only ResponseMetadata (CreateDomain, PutAttributes, ...).
std::string renderEmpty(const std::string& action, const std::string& requestId);
std::string renderListDomains(const std::vector<std::string>& domains, const std::string& requestId);
std::string renderGetAttributes(const AttributeMap& attributes, const std::string& requestId);
// Null attribute values are left out.
std::string renderSelect(const std::vector<SelectedItem>& items, const std::string& requestId);
std::string renderError(const SdbError& error, const std::string& requestId);

} // namespace lsdb
