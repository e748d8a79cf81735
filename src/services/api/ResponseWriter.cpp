#include "ResponseWriter.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <cstdint>
#include <random>
#include <sstream>

using boost::property_tree::ptree;

namespace lsdb {

// Nominal machine-hours charge reported by the real service for small requests.
static const char* const kBoxUsage = "0.0000219907";

std::string newRequestId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

static std::string toXml(const ptree& pt) {
  std::ostringstream buf;
  boost::property_tree::write_xml(buf, pt, boost::property_tree::xml_writer_make_settings<std::string>(' ', 2));
  return buf.str();
}

static ptree& openResponse(ptree& doc, const std::string& action) {
  ptree& root = doc.add_child(action + "Response", ptree());
  root.put("<xmlattr>.xmlns", std::string(kSdbNamespace));
  return root;
}

static void addMetadata(ptree& root, const std::string& requestId) {
  ptree meta;
  meta.put("RequestId", requestId);
  meta.put("BoxUsage", std::string(kBoxUsage));
  root.add_child("ResponseMetadata", meta);
}

static ptree nameValue(const std::string& name, const std::string& value) {
  ptree attr;
  attr.put("Name", name);
  attr.put("Value", value);
  return attr;
}

std::string renderEmpty(const std::string& action, const std::string& requestId) {
  ptree doc;
  addMetadata(openResponse(doc, action), requestId);
  return toXml(doc);
}

std::string renderListDomains(const std::vector<std::string>& domains, const std::string& requestId) {
  ptree doc;
  ptree& root = openResponse(doc, "ListDomains");
  ptree& result = root.add_child("ListDomainsResult", ptree());
  for (const auto& d : domains) result.add("DomainName", d);
  addMetadata(root, requestId);
  return toXml(doc);
}

std::string renderGetAttributes(const AttributeMap& attributes, const std::string& requestId) {
  ptree doc;
  ptree& root = openResponse(doc, "GetAttributes");
  ptree& result = root.add_child("GetAttributesResult", ptree());
  for (const auto& [name, value] : attributes) result.add_child("Attribute", nameValue(name, value));
  addMetadata(root, requestId);
  return toXml(doc);
}

std::string renderSelect(const std::vector<SelectedItem>& items, const std::string& requestId) {
  ptree doc;
  ptree& root = openResponse(doc, "Select");
  ptree& result = root.add_child("SelectResult", ptree());
  for (const auto& item : items) {
    ptree node;
    node.put("Name", item.name);
    for (const auto& [name, value] : item.attributes) {
      if (value) node.add_child("Attribute", nameValue(name, *value));
    }
    result.add_child("Item", node);
  }
  addMetadata(root, requestId);
  return toXml(doc);
}

std::string renderError(const SdbError& error, const std::string& requestId) {
  ptree doc;
  ptree& root = doc.add_child("Response", ptree());
  ptree err;
  err.put("Code", std::string(error.code()));
  err.put("Message", std::string(error.what()));
  err.put("BoxUsage", std::string(kBoxUsage));
  root.add_child("Errors.Error", err);
  root.put("RequestID", requestId);
  return toXml(doc);
}

} // namespace lsdb
