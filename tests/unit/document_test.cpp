#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/model/document.hpp"
#include "internal/model/document_codec.hpp"
#include "internal/model/forecast_fields.hpp"
#include "internal/model/state_machine.hpp"

namespace {

using forecast::model::Document;
using forecast::model::FieldValue;
using forecast::model::SyncState;
using forecast::model::Timestamp;

void TestMergeOverlayWinsAndKeepsBase() {
  const Document base{{"a", 1.0}, {"b", std::string("x")}};
  const Document overlay{{"b", std::string("y")}, {"c", true}};

  const auto merged = forecast::model::Merge(base, overlay);
  assert(merged.size() == 3);
  assert(merged.at("a") == FieldValue{1.0});
  assert(merged.at("b") == FieldValue{std::string("y")});
  assert(merged.at("c") == FieldValue{true});
}

void TestMergeLaws() {
  const Document base{{"a", 1.0}, {"b", std::string("x")}};
  const Document first{{"a", 2.0}};
  const Document second{{"a", 3.0}, {"c", Timestamp{5}}};

  // Identity.
  assert(forecast::model::Merge(base, Document{}) == base);
  assert(forecast::model::Merge(Document{}, base) == base);

  // Idempotence.
  assert(forecast::model::Merge(forecast::model::Merge(base, first), first) == forecast::model::Merge(base, first));

  // Successive overlays fold into one.
  assert(forecast::model::Merge(forecast::model::Merge(base, first), second) ==
         forecast::model::Merge(base, forecast::model::Merge(first, second)));
}

void TestExplicitNullOverridesBase() {
  const Document base{{"monthlyRate", 100.0}};
  const Document overlay{{"monthlyRate", std::monostate{}}};

  const auto merged = forecast::model::Merge(base, overlay);
  assert(merged.contains("monthlyRate"));
  assert(forecast::model::IsNull(merged.at("monthlyRate")));
}

void TestDivergentFieldsTreatsMissingAsNull() {
  const Document delta{{"a", 1.0}, {"b", std::monostate{}}, {"c", std::string("same")}};
  const Document remote{{"a", 2.0}, {"c", std::string("same")}};

  const auto fields = forecast::model::DivergentFields(delta, remote);
  assert(fields.size() == 1);
  assert(fields[0] == "a");
}

void TestIndexedColumnsIgnoreNonStrings() {
  Document doc{{forecast::model::fields::kCategory, std::string("Heavy")}, {forecast::model::fields::kSource, 3.0}};

  const auto columns = forecast::model::ExtractIndexedColumns(doc);
  assert(columns.category == "Heavy");
  assert(columns.source.empty());
  assert(columns.dor.empty());
}

void TestJsonCodecKeepsValueKinds() {
  const Document doc{{"s", std::string("text")}, {"n", 12.5}, {"b", false}, {"t", Timestamp{1700000000123}}, {"z", std::monostate{}}};

  const auto decoded = forecast::model::FromJson(forecast::model::ToJson(doc));
  assert(decoded == doc);

  assert(forecast::model::FromJson("").empty());

  bool rejected = false;
  try {
    forecast::model::FromJson("{not json");
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);
}

void TestFieldSetCodec() {
  const std::set<std::string> fields{"monthlyRate", "forecastEnd"};
  assert(forecast::model::FieldSetFromJson(forecast::model::FieldSetToJson(fields)) == fields);
  assert(forecast::model::FieldSetFromJson("").empty());
}

void TestStateMachineTransitions() {
  using forecast::model::CanTransition;

  assert(CanTransition(SyncState::kDraft, SyncState::kCommitted));
  assert(CanTransition(SyncState::kCommitted, SyncState::kSyncing));
  assert(CanTransition(SyncState::kSyncing, SyncState::kConflict));
  assert(CanTransition(SyncState::kSyncing, SyncState::kCommitted));
  assert(CanTransition(SyncState::kConflict, SyncState::kDraft));
  assert(CanTransition(SyncState::kSyncError, SyncState::kCommitted));

  assert(!CanTransition(SyncState::kDraft, SyncState::kSyncing));
  assert(!CanTransition(SyncState::kSynced, SyncState::kDraft));
  assert(!CanTransition(SyncState::kConflict, SyncState::kCommitted));

  assert(forecast::model::IsActive(SyncState::kSyncing));
  assert(!forecast::model::IsActive(SyncState::kConflict));
  assert(!forecast::model::IsActive(SyncState::kSynced));

  assert(forecast::model::ParseSyncState("sync_error") == SyncState::kSyncError);
  assert(!forecast::model::ParseSyncState("pristine").has_value());
}

} // namespace

int main() {
  TestMergeOverlayWinsAndKeepsBase();
  TestMergeLaws();
  TestExplicitNullOverridesBase();
  TestDivergentFieldsTreatsMissingAsNull();
  TestIndexedColumnsIgnoreNonStrings();
  TestJsonCodecKeepsValueKinds();
  TestFieldSetCodec();
  TestStateMachineTransitions();

  std::cout << "document_test: pass\n";
  return 0;
}
