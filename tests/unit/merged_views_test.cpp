#include <cassert>
#include <iostream>
#include <string>

#include "internal/core/merge_engine.hpp"
#include "tests/support/fixture.hpp"

namespace {

using forecast::db::MirrorFilter;
using forecast::model::Document;
using forecast::model::FieldValue;
using forecast::model::SyncState;
using forecast::testing::ExpectThrows;
using forecast::testing::Fixture;
using forecast::testing::kOrg;

namespace f = forecast::model::fields;

void TestPristineRowsShowMirrorDocument() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));

  const auto views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});
  assert(views.size() == 1);
  assert(views[0].entity_id == "E-1");
  assert(views[0].mirror_version == 1);
  assert(!views[0].has_modification);
  assert(!views[0].sync_state.has_value());
  assert(views[0].document == forecast::testing::EquipmentDoc("Acme", 100.0));
}

void TestDraftIsOverlaid() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));
  const auto draft = fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}});

  const auto views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});
  assert(views.size() == 1);
  assert(views[0].has_modification);
  assert(views[0].sync_state == SyncState::kDraft);
  assert(views[0].modification_id == draft.id);
  assert(views[0].modified_by == "alice");
  assert(views[0].document.at(f::kMonthlyRate) == FieldValue{150.0});
  assert(views[0].modified_fields.count(f::kMonthlyRate) == 1);

  // The mirror itself is untouched.
  assert(fx.Mirror("E-1").document.at(f::kMonthlyRate) == FieldValue{100.0});
}

void TestLatestOverlayWinsAcrossUsers() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));

  fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}});
  fx.clock->Advance(std::chrono::seconds(1));
  fx.deltas->SaveDraft(kOrg, "bob", "E-1", Document{{f::kMonthlyRate, 175.0}});

  auto views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});
  assert(views[0].modified_by == "bob");
  assert(views[0].document.at(f::kMonthlyRate) == FieldValue{175.0});

  // Scoped to one user, only that user's delta is visible.
  views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{}, std::string("alice"));
  assert(views[0].modified_by == "alice");
  assert(views[0].document.at(f::kMonthlyRate) == FieldValue{150.0});

  views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{}, std::string("carol"));
  assert(!views[0].has_modification);
}

void TestFiltersAndPaging() {
  Fixture fx;
  for (int i = 0; i < 5; ++i) {
    auto doc = forecast::testing::EquipmentDoc(i % 2 == 0 ? "Acme" : "Bolt", 100.0 + i);
    if (i == 4) doc[f::kDor] = std::string("BEO");
    fx.Promote("E-" + std::to_string(i), doc);
  }
  fx.mirrors->PromoteMirror("org-2", "E-0", forecast::testing::EquipmentDoc("Acme", 1.0), std::nullopt, "upstream");

  assert(fx.mirrors->GetCount(kOrg, MirrorFilter{}) == 5);

  MirrorFilter dor;
  dor.dor = "BEO";
  assert(fx.mirrors->GetCount(kOrg, dor) == 1);

  MirrorFilter search;
  search.search = "bOLt";
  auto views    = fx.mirrors->GetMergedViews(kOrg, search);
  assert(views.size() == 2);
  assert(views[0].entity_id == "E-1");
  assert(views[1].entity_id == "E-3");

  MirrorFilter page;
  page.limit  = 2;
  page.offset = 2;
  views       = fx.mirrors->GetMergedViews(kOrg, page);
  assert(views.size() == 2);
  assert(views[0].entity_id == "E-2");
  assert(views[1].entity_id == "E-3");

  // Counting ignores paging.
  assert(fx.mirrors->GetCount(kOrg, page) == 5);

  MirrorFilter wildcard;
  wildcard.search = "%";
  assert(fx.mirrors->GetCount(kOrg, wildcard) == 0);
}

void TestOverlaySelectionSkipsInactiveRows() {
  forecast::db::model::ModificationRecord conflict;
  conflict.id            = "m-1";
  conflict.mirror_id     = "mirror";
  conflict.sync_state    = SyncState::kConflict;
  conflict.updated_at_ms = 10;

  forecast::db::model::ModificationRecord draft = conflict;
  draft.id                                      = "m-2";
  draft.sync_state                              = SyncState::kDraft;
  draft.updated_at_ms                           = 5;

  const std::vector<forecast::db::model::ModificationRecord> active{conflict, draft};
  const auto overlays = forecast::core::MergeEngine::SelectOverlays(active);
  assert(overlays.size() == 1);
  assert(overlays.at("mirror")->id == "m-2");
}

void TestPromotionKeepsHistory() {
  Fixture fx;
  auto    created = fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0), 7);
  assert(created.created);
  assert(created.version == 7);

  auto replaced = fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 120.0));
  assert(!replaced.created);
  assert(replaced.version == 8);

  ExpectThrows<forecast::util::InvalidState>([&] { fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 90.0), 8); });

  const auto history = fx.mirrors->GetMirrorHistory(kOrg, "E-1");
  assert(history.size() == 1);
  assert(history[0].version == 7);
  assert(history[0].document.at(f::kMonthlyRate) == FieldValue{100.0});

  ExpectThrows<forecast::util::NotFound>([&] { fx.mirrors->GetMirrorHistory(kOrg, "missing"); });

  // The simulated system of record follows promotions.
  auto remote = fx.external->Get(kOrg, "E-1");
  assert(remote && remote->version == 8);
}

void TestIngestRaw() {
  Fixture fx;
  const auto ids = fx.mirrors->IngestRaw(kOrg, {{"a", std::nullopt}, {"b", int64_t{5}}});
  assert(ids.size() == 2);
  assert(ids[0] != ids[1]);
  assert(fx.mirrors->IngestRaw(kOrg, {}).empty());

  ExpectThrows<forecast::util::InvalidArgument>([&] { fx.mirrors->GetMergedViews("", MirrorFilter{}); });
}

} // namespace

int main() {
  TestPristineRowsShowMirrorDocument();
  TestDraftIsOverlaid();
  TestLatestOverlayWinsAcrossUsers();
  TestFiltersAndPaging();
  TestOverlaySelectionSkipsInactiveRows();
  TestPromotionKeepsHistory();
  TestIngestRaw();

  std::cout << "merged_views_test: pass\n";
  return 0;
}
