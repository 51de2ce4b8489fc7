#include "internal/model/document.hpp"

#include <sstream>

namespace forecast::model {

Document Merge(const Document& base, const Document& overlay) {
  Document merged = base;
  for (const auto& [field, value] : overlay) {
    merged.insert_or_assign(field, value);
  }
  return merged;
}

std::vector<std::string> DivergentFields(const Document& delta, const Document& remote) {
  std::vector<std::string> fields;
  for (const auto& [field, local] : delta) {
    if (ValueOr(remote, field) != local) {
      fields.push_back(field);
    }
  }
  return fields;
}

std::set<std::string> FieldNames(const Document& doc) {
  std::set<std::string> names;
  for (const auto& [field, _] : doc) {
    names.insert(field);
  }
  return names;
}

FieldValue ValueOr(const Document& doc, const std::string& field) {
  auto it = doc.find(field);
  if (it == doc.end()) {
    return std::monostate{};
  }
  return it->second;
}

bool IsNull(const FieldValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

std::string DebugString(const FieldValue& value) {
  struct Visitor {
    std::string operator()(std::monostate) const {
      return "null";
    }
    std::string operator()(const std::string& s) const {
      return "\"" + s + "\"";
    }
    std::string operator()(double d) const {
      std::ostringstream out;
      out << d;
      return out.str();
    }
    std::string operator()(bool b) const {
      return b ? "true" : "false";
    }
    std::string operator()(const Timestamp& ts) const {
      return "@" + std::to_string(ts.unix_ms);
    }
  };
  return std::visit(Visitor{}, value);
}

std::string DebugString(const Document& doc) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto& [field, value] : doc) {
    if (!first) {
      out << ", ";
    }
    first = false;
    out << field << '=' << DebugString(value);
  }
  out << '}';
  return out.str();
}

} // namespace forecast::model
