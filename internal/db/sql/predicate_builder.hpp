#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/query.hpp"
#include "sql_params.hpp"

namespace forecast::db::sql {

enum class PlaceholderStyle {
  kQuestion, // sqlite
  kDollar,   // postgres
};

/*
  Builds a parameterized WHERE clause.

  Values are only ever bound, never spliced into SQL text; column names
  come from call sites, never from user input.
*/
class PredicateBuilder {
 public:
  explicit PredicateBuilder(PlaceholderStyle style);

  PredicateBuilder& Equals(std::string_view column, Param value);
  PredicateBuilder& LessThan(std::string_view column, Param value);
  PredicateBuilder& LessOrEqual(std::string_view column, Param value);

  // An empty list matches nothing.
  PredicateBuilder& In(std::string_view column, const std::vector<std::string>& values);

  // Substring match against any of the columns, ignoring the case of ASCII
  // letters only, the same on every backend.
  PredicateBuilder& ContainsAnyIgnoreCase(const std::vector<std::string_view>& columns, std::string_view needle);

  // Row-value comparison (a, b) > (x, y), spelled out for portability.
  PredicateBuilder& After(std::string_view first_column, Param first, std::string_view second_column, Param second);

  // Binds `value` and returns its placeholder, for LIMIT/OFFSET and friends.
  std::string Bind(Param value);

  // " WHERE ..." or empty when no condition was added.
  std::string Where() const;

  const Params& Parameters() const {
    return params_;
  }

 private:
  std::string FoldAscii(std::string_view column) const;

  void Add(std::string clause);

  PlaceholderStyle         style_;
  std::vector<std::string> clauses_;
  Params                   params_;
};

// Escapes %, _ and the escape character itself for a LIKE pattern using ESCAPE '\'.
std::string EscapeLike(std::string_view text);

// Mirror filter over the mirror table's indexed columns.
void ApplyMirrorFilter(PredicateBuilder& builder, const std::string& organization_id, const MirrorFilter& filter);

// Modification query over the modification table.
void ApplyModificationQuery(PredicateBuilder& builder, const ModificationQuery& query);

} // namespace forecast::db::sql
