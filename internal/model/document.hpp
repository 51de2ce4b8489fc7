#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace forecast::model {

struct Timestamp {
  int64_t unix_ms = 0;

  auto operator<=>(const Timestamp&) const = default;
};

using FieldValue = std::variant<std::monostate, std::string, double, bool, Timestamp>;

/*
  Flat, ordered field -> value mapping.

  Mirror documents, deltas and merged views all share this shape. Ordering
  by key keeps serialization and field diffs deterministic.
*/
using Document = std::map<std::string, FieldValue>;

// Shallow overlay: every key of `overlay` replaces the same key of `base`.
Document Merge(const Document& base, const Document& overlay);

// Delta fields whose value differs from `remote`; a field missing from
// `remote` counts as null.
std::vector<std::string> DivergentFields(const Document& delta, const Document& remote);

std::set<std::string> FieldNames(const Document& doc);

// Value of `field` or null when absent.
FieldValue ValueOr(const Document& doc, const std::string& field);

bool IsNull(const FieldValue& value);

// Human readable rendering for logs and CLI output.
std::string DebugString(const FieldValue& value);

std::string DebugString(const Document& doc);

} // namespace forecast::model
