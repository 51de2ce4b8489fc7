#include "pg_repository.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/db/sql/predicate_builder.hpp"
#include "internal/model/document_codec.hpp"
#include "internal/model/forecast_fields.hpp"
#include "internal/util/errors.hpp"

namespace forecast::db::postgres {

using forecast::model::SyncState;

namespace {

constexpr const char* kMirrorColumns = "id,organization_id,entity_id,document::text,version,created_at_ms,updated_at_ms,last_synced_at_ms";

constexpr const char* kModificationColumns =
    "id,mirror_id,organization_id,user_id,delta::text,modified_fields::text,session_id,change_reason,base_version,edit_count,sync_state,"
    "created_at_ms,updated_at_ms,committed_at_ms,attempt_count,next_attempt_at_ms,claimed_at_ms,synced_at_ms,last_error";

constexpr const char* kConflictColumns =
    "id,modification_id,mirror_id,organization_id,entity_id,field,local_value::text,remote_value::text,local_version,remote_version,"
    "remote_modified_by,created_at_ms";

pqxx::params ToPqxx(const sql::Params& in) {
  pqxx::params out;
  for (const auto& p : in) {
    std::visit(
        [&out](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append(std::optional<std::string>{});
          } else {
            out.append(v);
          }
        },
        p);
  }
  return out;
}

// Reads have no Result channel: lost races surface as TransactionConflict so callers can retry.
template <typename Fn>
auto Guard(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(e.what());
  }
}

std::string HexEncode(const std::string& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0f]);
  }
  return out;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  throw std::runtime_error("invalid hex digit in bytea column");
}

std::string HexDecode(std::string_view hex) {
  std::string out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<char>((HexDigit(hex[i]) << 4) | HexDigit(hex[i + 1])));
  }
  return out;
}

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::string StateText(SyncState s) {
  return std::string(forecast::model::ToString(s));
}

SyncState ParseState(const pqxx::field& f) {
  const auto text  = f.as<std::string>();
  const auto state = forecast::model::ParseSyncState(text);
  if (!state) throw std::runtime_error("unknown sync_state in database: " + text);
  return *state;
}

model::MirrorRecord ReadMirror(const pqxx::row& row) {
  model::MirrorRecord r;
  r.id                = row[0].as<std::string>();
  r.organization_id   = row[1].as<std::string>();
  r.entity_id         = row[2].as<std::string>();
  r.document          = forecast::model::FromJson(row[3].as<std::string>());
  r.version           = row[4].as<uint64_t>();
  r.created_at_ms     = row[5].as<int64_t>();
  r.updated_at_ms     = row[6].as<int64_t>();
  r.last_synced_at_ms = row[7].as<int64_t>();
  return r;
}

model::ModificationRecord ReadModification(const pqxx::row& row) {
  model::ModificationRecord r;
  r.id                 = row[0].as<std::string>();
  r.mirror_id          = row[1].as<std::string>();
  r.organization_id    = row[2].as<std::string>();
  r.user_id            = row[3].as<std::string>();
  r.delta              = forecast::model::FromJson(row[4].as<std::string>());
  r.modified_fields    = forecast::model::FieldSetFromJson(row[5].as<std::string>());
  r.session_id         = row[6].as<std::string>();
  r.change_reason      = row[7].as<std::string>();
  r.base_version       = row[8].as<uint64_t>();
  r.edit_count         = row[9].as<uint32_t>();
  r.sync_state         = ParseState(row[10]);
  r.created_at_ms      = row[11].as<int64_t>();
  r.updated_at_ms      = row[12].as<int64_t>();
  r.committed_at_ms    = row[13].as<int64_t>();
  r.attempt_count      = row[14].as<uint32_t>();
  r.next_attempt_at_ms = row[15].as<int64_t>();
  r.claimed_at_ms      = row[16].as<int64_t>();
  r.synced_at_ms       = row[17].as<int64_t>();
  r.last_error         = row[18].as<std::string>();
  return r;
}

model::SyncConflictRecord ReadConflict(const pqxx::row& row) {
  model::SyncConflictRecord r;
  r.id                 = row[0].as<std::string>();
  r.modification_id    = row[1].as<std::string>();
  r.mirror_id          = row[2].as<std::string>();
  r.organization_id    = row[3].as<std::string>();
  r.entity_id          = row[4].as<std::string>();
  r.field              = row[5].as<std::string>();
  r.local_value        = forecast::model::FieldValueFromJson(row[6].as<std::string>());
  r.remote_value       = forecast::model::FieldValueFromJson(row[7].as<std::string>());
  r.local_version      = row[8].as<uint64_t>();
  r.remote_version     = row[9].as<uint64_t>();
  r.remote_modified_by = row[10].as<std::string>();
  r.created_at_ms      = row[11].as<int64_t>();
  return r;
}

std::vector<model::ModificationRecord> Modifications(const pqxx::result& res) {
  std::vector<model::ModificationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadModification(row));
  }
  return out;
}

std::vector<model::SyncConflictRecord> Conflicts(const pqxx::result& res) {
  std::vector<model::SyncConflictRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadConflict(row));
  }
  return out;
}

std::vector<std::string> ActiveStates() {
  return {StateText(SyncState::kDraft), StateText(SyncState::kCommitted), StateText(SyncState::kSyncing)};
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    // the partial index guarding one active delta per (mirror, user) is a rule, not a duplicate
    if (std::string_view(e.what()).find("modification_active_idx") != std::string_view::npos) {
      return Result::Err(ErrorCode::ConstraintViolation, e.what());
    }
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Raw intake
// ------------------------------------------------------------------

Result PgRepository::InsertRawIntake(Transaction& t, const model::RawIntakeRecord& r) {
  try {
    TX(t).Tx().exec_prepared("insert_raw_intake", r.id, r.organization_id, r.ingested_at_ms, HexEncode(r.payload));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountRawIntakeBefore(Transaction& t, int64_t cutoff_ms) {
  return Guard([&] {
    auto res = TX(t).Tx().exec_params("SELECT COUNT(*) FROM raw_intake WHERE ingested_at_ms < $1;", cutoff_ms);
    return res[0][0].as<uint64_t>();
  });
}

std::vector<model::RawIntakeRecord> PgRepository::ListRawIntakeBefore(Transaction& t, int64_t cutoff_ms,
                                                                      const std::optional<model::IntakeCursor>& after,
                                                                      std::size_t limit) {
  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  where.LessThan("ingested_at_ms", cutoff_ms);
  if (after) where.After("ingested_at_ms", after->ingested_at_ms, "id", after->id);
  const auto limit_ph = where.Bind(static_cast<int64_t>(limit));

  return Guard([&] {
    auto res = TX(t).Tx().exec_params("SELECT id,organization_id,ingested_at_ms,encode(payload,'hex') FROM raw_intake" + where.Where() +
                                          " ORDER BY ingested_at_ms, id LIMIT " + limit_ph + ";",
                                      ToPqxx(where.Parameters()));

    std::vector<model::RawIntakeRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::RawIntakeRecord r;
      r.id              = row[0].as<std::string>();
      r.organization_id = row[1].as<std::string>();
      r.ingested_at_ms  = row[2].as<int64_t>();
      r.payload         = HexDecode(row[3].as<std::string>());
      out.push_back(std::move(r));
    }
    return out;
  });
}

Result PgRepository::DeleteRawIntake(Transaction& t, const std::vector<std::string>& ids) {
  if (ids.empty()) return Result::Ok();
  try {
    TX(t).Tx().exec_prepared("delete_raw_intake", ids);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::IntakeStats PgRepository::GetIntakeStats(Transaction& t, int64_t cutoff_ms) {
  return Guard([&] {
    auto res = TX(t).Tx().exec_params(
        "SELECT COUNT(*), COUNT(*) FILTER (WHERE ingested_at_ms < $1), COALESCE(MIN(ingested_at_ms),0), COALESCE(MAX(ingested_at_ms),0) "
        "FROM raw_intake;",
        cutoff_ms);

    model::IntakeStats stats;
    stats.total            = res[0][0].as<uint64_t>();
    stats.eligible         = res[0][1].as<uint64_t>();
    stats.oldest_ingest_ms = res[0][2].as<int64_t>();
    stats.newest_ingest_ms = res[0][3].as<int64_t>();
    return stats;
  });
}

// ------------------------------------------------------------------
// Mirror
// ------------------------------------------------------------------

Result PgRepository::InsertMirror(Transaction& t, const model::MirrorRecord& r) {
  const auto idx = forecast::model::ExtractIndexedColumns(r.document);
  try {
    TX(t).Tx().exec_params(
        "INSERT INTO mirror(id,organization_id,entity_id,document,version,category,class_name,source,dor,manufacturer,model,"
        "created_at_ms,updated_at_ms,last_synced_at_ms) VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14);",
        r.id, r.organization_id, r.entity_id, forecast::model::ToJson(r.document), I64(r.version), idx.category, idx.class_name, idx.source,
        idx.dor, idx.manufacturer, idx.model, r.created_at_ms, r.updated_at_ms, r.last_synced_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateMirror(Transaction& t, const model::MirrorRecord& r) {
  const auto idx = forecast::model::ExtractIndexedColumns(r.document);
  try {
    auto res = TX(t).Tx().exec_params(
        "UPDATE mirror SET document=$4::jsonb,version=$5,category=$6,class_name=$7,source=$8,dor=$9,manufacturer=$10,model=$11,"
        "created_at_ms=$12,updated_at_ms=$13,last_synced_at_ms=$14 WHERE id=$1 AND organization_id=$2 AND entity_id=$3;",
        r.id, r.organization_id, r.entity_id, forecast::model::ToJson(r.document), I64(r.version), idx.category, idx.class_name, idx.source,
        idx.dor, idx.manufacturer, idx.model, r.created_at_ms, r.updated_at_ms, r.last_synced_at_ms);

    if (res.affected_rows() == 0) {
      if (GetMirror(t, r.id)) return Result::Err(ErrorCode::ConstraintViolation, "mirror identity is immutable");
      return Result::Err(ErrorCode::NotFound, "mirror " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MirrorRecord> PgRepository::GetMirror(Transaction& t, const std::string& id) {
  return Guard([&]() -> std::optional<model::MirrorRecord> {
    auto res = TX(t).Tx().exec_prepared("get_mirror", id);
    if (res.empty()) return std::nullopt;
    return ReadMirror(res[0]);
  });
}

std::optional<model::MirrorRecord> PgRepository::GetMirrorByEntity(Transaction& t, const std::string& organization_id,
                                                                   const std::string& entity_id) {
  return Guard([&]() -> std::optional<model::MirrorRecord> {
    auto res = TX(t).Tx().exec_prepared("get_mirror_by_entity", organization_id, entity_id);
    if (res.empty()) return std::nullopt;
    return ReadMirror(res[0]);
  });
}

std::vector<model::MirrorRecord> PgRepository::ListMirrors(Transaction& t, const std::string& organization_id, const MirrorFilter& filter) {
  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  sql::ApplyMirrorFilter(where, organization_id, filter);
  const auto limit_ph  = where.Bind(static_cast<int64_t>(filter.limit));
  const auto offset_ph = where.Bind(static_cast<int64_t>(filter.offset));

  return Guard([&] {
    auto res = TX(t).Tx().exec_params(std::string("SELECT ") + kMirrorColumns + " FROM mirror" + where.Where() +
                                          " ORDER BY entity_id, id LIMIT " + limit_ph + " OFFSET " + offset_ph + ";",
                                      ToPqxx(where.Parameters()));

    std::vector<model::MirrorRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadMirror(row));
    }
    return out;
  });
}

uint64_t PgRepository::CountMirrors(Transaction& t, const std::string& organization_id, const MirrorFilter& filter) {
  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  sql::ApplyMirrorFilter(where, organization_id, filter);

  return Guard([&] {
    auto res = TX(t).Tx().exec_params("SELECT COUNT(*) FROM mirror" + where.Where() + ";", ToPqxx(where.Parameters()));
    return res[0][0].as<uint64_t>();
  });
}

Result PgRepository::InsertMirrorHistory(Transaction& t, const model::MirrorHistoryRecord& r) {
  try {
    TX(t).Tx().exec_params(
        "INSERT INTO mirror_history(id,mirror_id,organization_id,document,version,changed_by,change_reason,archived_at_ms) "
        "VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8);",
        r.id, r.mirror_id, r.organization_id, forecast::model::ToJson(r.document), I64(r.version), r.changed_by, r.change_reason,
        r.archived_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MirrorHistoryRecord> PgRepository::ListMirrorHistory(Transaction& t, const std::string& mirror_id) {
  return Guard([&] {
    auto res = TX(t).Tx().exec_params(
        "SELECT id,mirror_id,organization_id,document::text,version,changed_by,change_reason,archived_at_ms FROM mirror_history "
        "WHERE mirror_id=$1 ORDER BY version DESC, archived_at_ms DESC, id DESC;",
        mirror_id);

    std::vector<model::MirrorHistoryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::MirrorHistoryRecord r;
      r.id              = row[0].as<std::string>();
      r.mirror_id       = row[1].as<std::string>();
      r.organization_id = row[2].as<std::string>();
      r.document        = forecast::model::FromJson(row[3].as<std::string>());
      r.version         = row[4].as<uint64_t>();
      r.changed_by      = row[5].as<std::string>();
      r.change_reason   = row[6].as<std::string>();
      r.archived_at_ms  = row[7].as<int64_t>();
      out.push_back(std::move(r));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Modifications
// ------------------------------------------------------------------

Result PgRepository::InsertModification(Transaction& t, const model::ModificationRecord& r) {
  try {
    TX(t).Tx().exec_params("INSERT INTO modification(id,mirror_id,organization_id,user_id,delta,modified_fields,session_id,change_reason,base_version,edit_count,"
                               "sync_state,created_at_ms,updated_at_ms,committed_at_ms,attempt_count,next_attempt_at_ms,claimed_at_ms,"
                               "synced_at_ms,last_error) VALUES($1,$2,$3,$4,$5::jsonb,$6::jsonb,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19);",
                           r.id, r.mirror_id, r.organization_id, r.user_id, forecast::model::ToJson(r.delta),
                           forecast::model::FieldSetToJson(r.modified_fields), r.session_id, r.change_reason, I64(r.base_version),
                           static_cast<int64_t>(r.edit_count), StateText(r.sync_state), r.created_at_ms, r.updated_at_ms, r.committed_at_ms,
                           static_cast<int64_t>(r.attempt_count), r.next_attempt_at_ms, r.claimed_at_ms, r.synced_at_ms, r.last_error);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateModification(Transaction& t, const model::ModificationRecord& r) {
  try {
    auto res = TX(t).Tx().exec_params(
        "UPDATE modification SET mirror_id=$2,organization_id=$3,user_id=$4,delta=$5::jsonb,modified_fields=$6::jsonb,session_id=$7,"
        "change_reason=$8,base_version=$9,edit_count=$10,sync_state=$11,created_at_ms=$12,updated_at_ms=$13,committed_at_ms=$14,"
        "attempt_count=$15,next_attempt_at_ms=$16,claimed_at_ms=$17,synced_at_ms=$18,last_error=$19 WHERE id=$1;",
        r.id, r.mirror_id, r.organization_id, r.user_id, forecast::model::ToJson(r.delta), forecast::model::FieldSetToJson(r.modified_fields),
        r.session_id, r.change_reason, I64(r.base_version), static_cast<int64_t>(r.edit_count), StateText(r.sync_state), r.created_at_ms,
        r.updated_at_ms, r.committed_at_ms, static_cast<int64_t>(r.attempt_count), r.next_attempt_at_ms, r.claimed_at_ms, r.synced_at_ms,
        r.last_error);

    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "modification " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteModification(Transaction& t, const std::string& id) {
  try {
    // sync_conflict rows go with it (ON DELETE CASCADE)
    TX(t).Tx().exec_prepared("delete_modification", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ModificationRecord> PgRepository::GetModification(Transaction& t, const std::string& id) {
  return Guard([&]() -> std::optional<model::ModificationRecord> {
    auto res = TX(t).Tx().exec_params(std::string("SELECT ") + kModificationColumns + " FROM modification WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadModification(res[0]);
  });
}

std::optional<model::ModificationRecord> PgRepository::GetActiveModification(Transaction& t, const std::string& mirror_id,
                                                                             const std::string& user_id) {
  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  where.Equals("mirror_id", mirror_id).Equals("user_id", user_id).In("sync_state", ActiveStates());

  return Guard([&]() -> std::optional<model::ModificationRecord> {
    auto res = TX(t).Tx().exec_params(std::string("SELECT ") + kModificationColumns + " FROM modification" + where.Where() + ";",
                                      ToPqxx(where.Parameters()));
    if (res.empty()) return std::nullopt;
    return ReadModification(res[0]);
  });
}

std::vector<model::ModificationRecord> PgRepository::ListActiveModifications(Transaction& t, const std::vector<std::string>& mirror_ids,
                                                                             const std::optional<std::string>& user_id) {
  if (mirror_ids.empty()) return {};

  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  where.In("mirror_id", mirror_ids).In("sync_state", ActiveStates());
  if (user_id) where.Equals("user_id", *user_id);

  return Guard([&] {
    return Modifications(TX(t).Tx().exec_params(
        std::string("SELECT ") + kModificationColumns + " FROM modification" + where.Where() + " ORDER BY id;", ToPqxx(where.Parameters())));
  });
}

std::vector<model::ModificationRecord> PgRepository::ListModifications(Transaction& t, const ModificationQuery& q) {
  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  sql::ApplyModificationQuery(where, q);

  return Guard([&] {
    return Modifications(TX(t).Tx().exec_params(
        std::string("SELECT ") + kModificationColumns + " FROM modification" + where.Where() + " ORDER BY created_at_ms, id;",
        ToPqxx(where.Parameters())));
  });
}

uint64_t PgRepository::CountModifications(Transaction& t, const ModificationQuery& q) {
  sql::PredicateBuilder where(sql::PlaceholderStyle::kDollar);
  sql::ApplyModificationQuery(where, q);

  return Guard([&] {
    auto res = TX(t).Tx().exec_params("SELECT COUNT(*) FROM modification" + where.Where() + ";", ToPqxx(where.Parameters()));
    return res[0][0].as<uint64_t>();
  });
}

std::vector<model::ModificationRecord> PgRepository::ListModificationsForMirror(Transaction& t, const std::string& mirror_id) {
  return Guard([&] {
    return Modifications(TX(t).Tx().exec_params(
        std::string("SELECT ") + kModificationColumns + " FROM modification WHERE mirror_id=$1 ORDER BY created_at_ms DESC, id DESC;",
        mirror_id));
  });
}

std::vector<model::ModificationRecord> PgRepository::ClaimDueModifications(Transaction& t, int64_t now_ms, std::size_t limit) {
  // SKIP LOCKED lets overlapping claimers take disjoint rows instead of blocking
  auto claimed = Guard([&] {
    return Modifications(TX(t).Tx().exec_params(
        std::string("UPDATE modification SET sync_state='syncing', claimed_at_ms=$1 WHERE id IN ("
                    "SELECT id FROM modification WHERE sync_state='committed' AND next_attempt_at_ms<=$1 "
                    "ORDER BY committed_at_ms, id LIMIT $2 FOR UPDATE SKIP LOCKED) RETURNING ") +
            kModificationColumns + ";",
        now_ms, static_cast<int64_t>(limit)));
  });

  std::sort(claimed.begin(), claimed.end(), [](const auto& a, const auto& b) {
    if (a.committed_at_ms != b.committed_at_ms) return a.committed_at_ms < b.committed_at_ms;
    return a.id < b.id;
  });
  return claimed;
}

uint64_t PgRepository::ReleaseStaleClaims(Transaction& t, int64_t claimed_before_ms) {
  return Guard([&] {
    auto res = TX(t).Tx().exec_prepared("release_stale_claims", claimed_before_ms);
    return static_cast<uint64_t>(res.affected_rows());
  });
}

std::map<SyncState, uint64_t> PgRepository::CountModificationsByState(Transaction& t, const std::string& organization_id) {
  return Guard([&] {
    auto res = TX(t).Tx().exec_params("SELECT sync_state, COUNT(*) FROM modification WHERE organization_id=$1 GROUP BY sync_state;",
                                      organization_id);

    std::map<SyncState, uint64_t> counts;
    for (const auto& row : res) {
      counts[ParseState(row[0])] = row[1].as<uint64_t>();
    }
    return counts;
  });
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result PgRepository::InsertConflict(Transaction& t, const model::SyncConflictRecord& r) {
  try {
    TX(t).Tx().exec_params(
        "INSERT INTO sync_conflict(id,modification_id,mirror_id,organization_id,entity_id,field,local_value,remote_value,local_version,"
        "remote_version,remote_modified_by,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8::jsonb,$9,$10,$11,$12);",
        r.id, r.modification_id, r.mirror_id, r.organization_id, r.entity_id, r.field, forecast::model::FieldValueToJson(r.local_value),
        forecast::model::FieldValueToJson(r.remote_value), I64(r.local_version), I64(r.remote_version), r.remote_modified_by, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SyncConflictRecord> PgRepository::ListConflicts(Transaction& t, const std::string& organization_id) {
  return Guard([&] {
    return Conflicts(TX(t).Tx().exec_params(std::string("SELECT ") + kConflictColumns +
                                                " FROM sync_conflict WHERE organization_id=$1 ORDER BY created_at_ms DESC, modification_id, field;",
                                            organization_id));
  });
}

std::vector<model::SyncConflictRecord> PgRepository::ListConflictsForModification(Transaction& t, const std::string& modification_id) {
  return Guard([&] {
    return Conflicts(TX(t).Tx().exec_params(
        std::string("SELECT ") + kConflictColumns + " FROM sync_conflict WHERE modification_id=$1 ORDER BY field;", modification_id));
  });
}

Result PgRepository::DeleteConflictsForModification(Transaction& t, const std::string& modification_id) {
  try {
    TX(t).Tx().exec_params("DELETE FROM sync_conflict WHERE modification_id=$1;", modification_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result PgRepository::UpsertUser(Transaction& t, const model::UserRecord& r) {
  try {
    TX(t).Tx().exec_params(
        "INSERT INTO app_user(id,username,display_name) VALUES($1,$2,$3) "
        "ON CONFLICT(id) DO UPDATE SET username=EXCLUDED.username, display_name=EXCLUDED.display_name;",
        r.id, r.username, r.display_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, const std::string& id) {
  return Guard([&]() -> std::optional<model::UserRecord> {
    auto res = TX(t).Tx().exec_params("SELECT id,username,display_name FROM app_user WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;

    model::UserRecord r;
    r.id           = res[0][0].as<std::string>();
    r.username     = res[0][1].as<std::string>();
    r.display_name = res[0][2].as<std::string>();
    return r;
  });
}

} // namespace forecast::db::postgres
