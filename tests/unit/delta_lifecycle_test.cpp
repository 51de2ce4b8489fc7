#include <cassert>
#include <iostream>
#include <string>

#include "tests/support/fixture.hpp"

namespace {

using forecast::core::DraftSelector;
using forecast::db::MirrorFilter;
using forecast::model::Document;
using forecast::model::FieldValue;
using forecast::model::SyncState;
using forecast::model::Timestamp;
using forecast::testing::ExpectThrows;
using forecast::testing::Fixture;
using forecast::testing::kOrg;

namespace f = forecast::model::fields;

DraftSelector AllDrafts(const std::string& user) {
  return DraftSelector{.organization_id = kOrg, .user_id = user};
}

void TestSaveDraftCreatesThenAccumulates() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0), 3);

  const auto first = fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}}, std::string("s-1"));
  assert(first.sync_state == SyncState::kDraft);
  assert(first.base_version == 3);
  assert(first.edit_count == 1);
  assert(first.session_id == "s-1");

  fx.clock->Advance(std::chrono::seconds(5));
  const auto second = fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kDor, std::string("BEO")}, {f::kMonthlyRate, 160.0}});
  assert(second.id == first.id);
  assert(second.edit_count == 2);
  assert(second.delta.size() == 2);
  assert(second.delta.at(f::kMonthlyRate) == FieldValue{160.0});
  assert(second.modified_fields.size() == 2);
  assert(second.created_at_ms == first.created_at_ms);
  assert(second.updated_at_ms == first.updated_at_ms + 5000);

  assert(fx.deltas->GetDraftCount(kOrg, "alice") == 1);
  assert(fx.deltas->GetDraftCount(kOrg, "bob") == 0);
}

void TestSaveDraftRejectsBadInput() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));

  ExpectThrows<forecast::util::NotFound>([&] { fx.deltas->SaveDraft(kOrg, "alice", "missing", Document{{f::kMonthlyRate, 1.0}}); });
  ExpectThrows<forecast::util::InvalidArgument>([&] { fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{}); });
  ExpectThrows<forecast::util::InvalidArgument>([&] { fx.deltas->SaveDraft(kOrg, "", "E-1", Document{{f::kMonthlyRate, 1.0}}); });

  bool rejected = false;
  try {
    fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, -3.0}});
  } catch (const forecast::util::ValidationFailed& ex) {
    rejected = true;
    assert(ex.Errors().size() == 1);
    assert(ex.Errors()[0].code == "INVALID_VALUE");
  }
  assert(rejected);
  assert(fx.deltas->GetDraftCount(kOrg, "alice") == 0);
}

void TestCommittedRowBlocksNewDrafts() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));
  fx.SaveAndCommit("alice", "E-1", Document{{f::kMonthlyRate, 150.0}});

  ExpectThrows<forecast::util::InvalidState>([&] { fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 175.0}}); });

  // Other users are unaffected.
  fx.deltas->SaveDraft(kOrg, "bob", "E-1", Document{{f::kMonthlyRate, 175.0}});
}

void TestCommitIsIdempotent() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));
  fx.Promote("E-2", forecast::testing::EquipmentDoc("Bolt", 100.0));
  const auto a = fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}});
  fx.deltas->SaveDraft(kOrg, "alice", "E-2", Document{{f::kMonthlyRate, 250.0}});

  assert(fx.deltas->CommitDrafts(AllDrafts("alice")) == 2);
  assert(fx.deltas->CommitDrafts(AllDrafts("alice")) == 0);

  const auto row = fx.Modification(a.id);
  assert(row.sync_state == SyncState::kCommitted);
  assert(row.committed_at_ms == forecast::testing::kStartMs);
  assert(row.next_attempt_at_ms == forecast::testing::kStartMs);
  assert(fx.deltas->GetDraftCount(kOrg, "alice") == 0);
}

void TestCommitIsAllOrNothing() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));
  auto doc              = forecast::testing::EquipmentDoc("Bolt", 100.0);
  doc[f::kActualStart]  = Timestamp{1000};
  fx.Promote("E-2", doc);

  fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}});
  fx.deltas->SaveDraft(kOrg, "alice", "E-2", Document{{f::kActualStart, Timestamp{2000}}});

  // E-2 gets actualized upstream; its draft now breaks a business rule.
  doc[f::kIsActualized] = true;
  fx.Promote("E-2", doc);

  bool rejected = false;
  try {
    fx.deltas->CommitDrafts(AllDrafts("alice"));
  } catch (const forecast::util::ValidationFailed& ex) {
    rejected = true;
    assert(ex.Errors().size() == 1);
    assert(ex.Errors()[0].field == "E-2.actualStart");
  }
  assert(rejected);
  assert(fx.deltas->GetDraftCount(kOrg, "alice") == 2);

  // Narrowing the selection commits the valid one.
  DraftSelector only_e1 = AllDrafts("alice");
  only_e1.entity_ids    = {"E-1", "does-not-exist"};
  assert(fx.deltas->CommitDrafts(only_e1) == 1);

  DraftSelector unknown = AllDrafts("alice");
  unknown.entity_ids    = {"does-not-exist"};
  assert(fx.deltas->CommitDrafts(unknown) == 0);
}

void TestDiscardIsIdempotentAndEquivalentToNeverSaving() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));

  const auto before = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});

  fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}});
  assert(fx.deltas->DiscardDrafts(AllDrafts("alice")) == 1);
  assert(fx.deltas->DiscardDrafts(AllDrafts("alice")) == 0);

  const auto after = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});
  assert(after.size() == before.size());
  assert(after[0].document == before[0].document);
  assert(!after[0].has_modification);

  // A save after a discard starts from scratch.
  const auto fresh = fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kDor, std::string("BEO")}});
  assert(fresh.edit_count == 1);
  assert(fresh.delta.size() == 1);
  assert(!fresh.delta.contains(f::kMonthlyRate));
}

void TestSessionScopedDiscard() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));
  fx.Promote("E-2", forecast::testing::EquipmentDoc("Bolt", 100.0));
  fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, 150.0}}, std::string("tab-1"));
  fx.deltas->SaveDraft(kOrg, "alice", "E-2", Document{{f::kMonthlyRate, 150.0}}, std::string("tab-2"));

  DraftSelector tab1 = AllDrafts("alice");
  tab1.session_id    = "tab-1";
  assert(fx.deltas->DiscardDrafts(tab1) == 1);
  assert(fx.deltas->GetDraftCount(kOrg, "alice") == 1);
}

void TestModificationHistoryNewestFirst() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));
  fx.SaveAndCommit("alice", "E-1", Document{{f::kMonthlyRate, 150.0}});
  fx.clock->Advance(std::chrono::seconds(1));
  fx.deltas->SaveDraft(kOrg, "bob", "E-1", Document{{f::kMonthlyRate, 175.0}});

  const auto history = fx.deltas->GetModificationHistory(kOrg, "E-1");
  assert(history.size() == 2);
  assert(history[0].record.user_id == "bob");
  assert(history[0].username == "bob");
  assert(history[0].entity_id == "E-1");
  assert(history[1].record.sync_state == SyncState::kCommitted);

  ExpectThrows<forecast::util::NotFound>([&] { fx.deltas->GetModificationHistory(kOrg, "missing"); });
}

} // namespace

int main() {
  TestSaveDraftCreatesThenAccumulates();
  TestSaveDraftRejectsBadInput();
  TestCommittedRowBlocksNewDrafts();
  TestCommitIsIdempotent();
  TestCommitIsAllOrNothing();
  TestDiscardIsIdempotentAndEquivalentToNeverSaving();
  TestSessionScopedDiscard();
  TestModificationHistoryNewestFirst();

  std::cout << "delta_lifecycle_test: pass\n";
  return 0;
}
