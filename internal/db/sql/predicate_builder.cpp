#include "internal/db/sql/predicate_builder.hpp"

#include <algorithm>
#include <cctype>

namespace forecast::db::sql {

PredicateBuilder::PredicateBuilder(PlaceholderStyle style) : style_(style) {
}

std::string PredicateBuilder::Bind(Param value) {
  params_.push_back(std::move(value));
  if (style_ == PlaceholderStyle::kDollar) {
    return "$" + std::to_string(params_.size());
  }
  return "?";
}

void PredicateBuilder::Add(std::string clause) {
  clauses_.push_back(std::move(clause));
}

PredicateBuilder& PredicateBuilder::Equals(std::string_view column, Param value) {
  Add(std::string(column) + " = " + Bind(std::move(value)));
  return *this;
}

PredicateBuilder& PredicateBuilder::LessThan(std::string_view column, Param value) {
  Add(std::string(column) + " < " + Bind(std::move(value)));
  return *this;
}

PredicateBuilder& PredicateBuilder::LessOrEqual(std::string_view column, Param value) {
  Add(std::string(column) + " <= " + Bind(std::move(value)));
  return *this;
}

PredicateBuilder& PredicateBuilder::In(std::string_view column, const std::vector<std::string>& values) {
  if (values.empty()) {
    Add("1 = 0");
    return *this;
  }

  std::string clause = std::string(column) + " IN (";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) clause += ", ";
    clause += Bind(values[i]);
  }
  clause += ")";
  Add(std::move(clause));
  return *this;
}

std::string PredicateBuilder::FoldAscii(std::string_view column) const {
  // SQLite's LOWER only knows ASCII; Postgres' is collation aware, so it
  // gets an explicit ASCII translate to match.
  if (style_ == PlaceholderStyle::kDollar) {
    return "translate(" + std::string(column) + ", 'ABCDEFGHIJKLMNOPQRSTUVWXYZ', 'abcdefghijklmnopqrstuvwxyz')";
  }
  return "LOWER(" + std::string(column) + ")";
}

PredicateBuilder& PredicateBuilder::ContainsAnyIgnoreCase(const std::vector<std::string_view>& columns, std::string_view needle) {
  std::string lowered(needle);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const std::string pattern = "%" + EscapeLike(lowered) + "%";

  std::string clause = "(";
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) clause += " OR ";
    clause += FoldAscii(columns[i]) + " LIKE " + Bind(pattern) + " ESCAPE '\\'";
  }
  clause += ")";
  Add(std::move(clause));
  return *this;
}

PredicateBuilder& PredicateBuilder::After(std::string_view first_column, Param first, std::string_view second_column, Param second) {
  const std::string a  = std::string(first_column);
  const std::string b  = std::string(second_column);
  const std::string p1 = Bind(first);
  const std::string p2 = Bind(first);
  const std::string p3 = Bind(std::move(second));
  Add("(" + a + " > " + p1 + " OR (" + a + " = " + p2 + " AND " + b + " > " + p3 + "))");
  return *this;
}

std::string PredicateBuilder::Where() const {
  if (clauses_.empty()) {
    return {};
  }
  std::string where = " WHERE ";
  for (std::size_t i = 0; i < clauses_.size(); ++i) {
    if (i > 0) where += " AND ";
    where += clauses_[i];
  }
  return where;
}

std::string EscapeLike(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '%' || c == '_' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

void ApplyMirrorFilter(PredicateBuilder& builder, const std::string& organization_id, const MirrorFilter& filter) {
  builder.Equals("organization_id", organization_id);
  if (filter.category) builder.Equals("category", *filter.category);
  if (filter.class_name) builder.Equals("class_name", *filter.class_name);
  if (filter.source) builder.Equals("source", *filter.source);
  if (filter.dor) builder.Equals("dor", *filter.dor);
  if (filter.search && !filter.search->empty()) {
    builder.ContainsAnyIgnoreCase({"entity_id", "manufacturer", "model"}, *filter.search);
  }
}

void ApplyModificationQuery(PredicateBuilder& builder, const ModificationQuery& query) {
  builder.Equals("organization_id", query.organization_id);
  if (query.user_id) builder.Equals("user_id", *query.user_id);
  if (query.session_id) builder.Equals("session_id", *query.session_id);
  if (!query.mirror_ids.empty()) builder.In("mirror_id", query.mirror_ids);
  if (!query.states.empty()) {
    std::vector<std::string> states;
    states.reserve(query.states.size());
    for (auto state : query.states) {
      states.emplace_back(forecast::model::ToString(state));
    }
    builder.In("sync_state", states);
  }
}

} // namespace forecast::db::sql
