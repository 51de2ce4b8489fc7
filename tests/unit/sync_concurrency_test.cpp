#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/transact.hpp"
#include "tests/support/fixture.hpp"

namespace {

using forecast::db::MirrorFilter;
using forecast::model::Document;
using forecast::model::FieldValue;
using forecast::model::SyncState;
using forecast::testing::Fixture;
using forecast::testing::kOrg;
using forecast::testing::kStartMs;

namespace f = forecast::model::fields;

constexpr int kRows = 40;

void CommitRows(Fixture& fx) {
  for (int i = 0; i < kRows; ++i) {
    const auto entity = "E-" + std::to_string(i);
    fx.Promote(entity, forecast::testing::EquipmentDoc("Acme", 100.0));
    fx.deltas->SaveDraft(kOrg, "user-" + std::to_string(i % 4), entity, Document{{f::kMonthlyRate, 101.0 + i}});
  }
  for (int u = 0; u < 4; ++u) {
    fx.deltas->CommitDrafts(forecast::core::DraftSelector{.organization_id = kOrg, .user_id = "user-" + std::to_string(u)});
  }
}

void TestConcurrentClaimsNeverOverlap() {
  Fixture fx;
  CommitRows(fx);

  std::mutex               mutex;
  std::vector<std::string> claimed;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      while (true) {
        std::vector<forecast::db::model::ModificationRecord> batch;
        try {
          batch = forecast::core::Transact(*fx.repository,
                                           [&](forecast::db::Transaction& tx) { return fx.repository->ClaimDueModifications(tx, kStartMs, 3); });
        } catch (const forecast::util::TransactionConflict&) {
          continue;
        }
        if (batch.empty()) {
          return;
        }
        std::lock_guard lock(mutex);
        for (const auto& row : batch) {
          claimed.push_back(row.id);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> unique(claimed.begin(), claimed.end());
  assert(claimed.size() == static_cast<std::size_t>(kRows));
  assert(unique.size() == claimed.size());
}

void TestConcurrentWorkersPushEachRowOnce() {
  auto options       = Fixture::FastSyncOptions();
  options.batch_size = 5;
  Fixture fx(options);
  CommitRows(fx);
  fx.external->SetLatency(std::chrono::milliseconds(2));

  auto second = std::make_shared<forecast::sync::SyncWorker>(fx.repository, fx.external, fx.clock, options);

  std::atomic<uint32_t> synced{0};
  const auto            run = [&](const std::shared_ptr<forecast::sync::SyncWorker>& worker) {
    for (int round = 0; round < 200 && synced.load() < static_cast<uint32_t>(kRows); ++round) {
      try {
        synced += worker->RunCycle().synced;
      } catch (const forecast::util::TransactionConflict&) {
        // Lost the claim race; the next round tries again.
      }
    }
  };

  std::thread a(run, fx.worker);
  std::thread b(run, second);
  a.join();
  b.join();

  assert(synced.load() == static_cast<uint32_t>(kRows));
  assert(fx.external->PushCalls() == static_cast<std::size_t>(kRows));

  auto tx     = fx.repository->Begin();
  auto counts = fx.repository->CountModificationsByState(*tx, kOrg);
  tx->Commit();
  assert(counts[SyncState::kSynced] == static_cast<uint64_t>(kRows));
  assert(counts[SyncState::kSyncing] == 0);

  for (int i = 0; i < kRows; ++i) {
    const auto mirror = fx.Mirror("E-" + std::to_string(i));
    assert(mirror.version == 2);
    assert(mirror.document.at(f::kMonthlyRate) == FieldValue{101.0 + i});
  }
}

void TestReadersNeverSeeTornDeltas() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));

  std::atomic<bool> done{false};
  std::atomic<int>  observed{0};

  std::thread writer([&] {
    for (int i = 1; i <= 200; ++i) {
      const double value = i;
      fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, value}, {f::kPurchasePrice, value}});
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        const auto views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});
        assert(views.size() == 1);
        if (views[0].has_modification) {
          assert(views[0].document.at(f::kMonthlyRate) == views[0].document.at(f::kPurchasePrice));
          ++observed;
        }
      }
    });
  }

  writer.join();
  for (auto& reader : readers) {
    reader.join();
  }

  const auto views = fx.mirrors->GetMergedViews(kOrg, MirrorFilter{});
  assert(views[0].document.at(f::kMonthlyRate) == FieldValue{200.0});
  assert(views[0].document.at(f::kPurchasePrice) == FieldValue{200.0});
}

void TestConcurrentSavesKeepOneActiveRow() {
  Fixture fx;
  fx.Promote("E-1", forecast::testing::EquipmentDoc("Acme", 100.0));

  const auto save = [&](double base) {
    for (int i = 0; i < 50; ++i) {
      while (true) {
        try {
          fx.deltas->SaveDraft(kOrg, "alice", "E-1", Document{{f::kMonthlyRate, base + i}});
          break;
        } catch (const forecast::util::TransactionConflict&) {
        }
      }
    }
  };

  std::thread a(save, 1000.0);
  std::thread b(save, 2000.0);
  a.join();
  b.join();

  const auto mirror = fx.Mirror("E-1");
  auto       tx     = fx.repository->Begin();
  const auto rows   = fx.repository->ListModificationsForMirror(*tx, mirror.id);
  tx->Commit();
  assert(rows.size() == 1);
  assert(rows[0].edit_count == 100);
}

} // namespace

int main() {
  TestConcurrentClaimsNeverOverlap();
  TestConcurrentWorkersPushEachRowOnce();
  TestReadersNeverSeeTornDeltas();
  TestConcurrentSavesKeepOneActiveRow();

  std::cout << "sync_concurrency_test: pass\n";
  return 0;
}
