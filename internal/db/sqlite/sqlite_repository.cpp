#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/predicate_builder.hpp"
#include "internal/model/document_codec.hpp"
#include "internal/model/forecast_fields.hpp"

namespace forecast::db::sqlite {

using forecast::db::ErrorCode;
using forecast::db::Result;
using forecast::model::SyncState;

namespace {

// Finalizes on scope exit; st is null when prepare failed.
struct Statement {
    sqlite3_stmt* st = nullptr;

    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
            st = nullptr;
        }
    }
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const {
        return st != nullptr;
    }
};

// Reads have no Result channel; a statement that fails to prepare throws.
void Require(const Statement& s, sqlite3* db) {
    if (!s) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

void RequireStep(int rc, sqlite3* db) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindParams(sqlite3_stmt* st, const sql::Params& params) {
    int idx = 1;
    for (const auto& p : params) {
        if (std::holds_alternative<std::nullptr_t>(p)) {
            sqlite3_bind_null(st, idx);
        } else if (const auto* i = std::get_if<int64_t>(&p)) {
            BindI64(st, idx, *i);
        } else {
            BindText(st, idx, std::get<std::string>(p));
        }
        ++idx;
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   n    = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(n)) : std::string{};
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

SyncState ColState(sqlite3_stmt* st, int col) {
    const auto text  = ColText(st, col);
    const auto state = forecast::model::ParseSyncState(text);
    if (!state) throw std::runtime_error("unknown sync_state in database: " + text);
    return *state;
}

// ------------------------------------------------------------------
// Row mapping
// ------------------------------------------------------------------

constexpr const char* kMirrorColumns = "id,organization_id,entity_id,document,version,created_at_ms,updated_at_ms,last_synced_at_ms";

model::MirrorRecord ReadMirror(sqlite3_stmt* st) {
    model::MirrorRecord r;
    r.id                = ColText(st, 0);
    r.organization_id   = ColText(st, 1);
    r.entity_id         = ColText(st, 2);
    r.document          = forecast::model::FromJson(ColText(st, 3));
    r.version           = ColU64(st, 4);
    r.created_at_ms     = ColI64(st, 5);
    r.updated_at_ms     = ColI64(st, 6);
    r.last_synced_at_ms = ColI64(st, 7);
    return r;
}

constexpr const char* kModificationColumns =
    "id,mirror_id,organization_id,user_id,delta,modified_fields,session_id,change_reason,base_version,edit_count,sync_state,"
    "created_at_ms,updated_at_ms,committed_at_ms,attempt_count,next_attempt_at_ms,claimed_at_ms,synced_at_ms,last_error";

model::ModificationRecord ReadModification(sqlite3_stmt* st) {
    model::ModificationRecord r;
    r.id                 = ColText(st, 0);
    r.mirror_id          = ColText(st, 1);
    r.organization_id    = ColText(st, 2);
    r.user_id            = ColText(st, 3);
    r.delta              = forecast::model::FromJson(ColText(st, 4));
    r.modified_fields    = forecast::model::FieldSetFromJson(ColText(st, 5));
    r.session_id         = ColText(st, 6);
    r.change_reason      = ColText(st, 7);
    r.base_version       = ColU64(st, 8);
    r.edit_count         = static_cast<uint32_t>(ColU64(st, 9));
    r.sync_state         = ColState(st, 10);
    r.created_at_ms      = ColI64(st, 11);
    r.updated_at_ms      = ColI64(st, 12);
    r.committed_at_ms    = ColI64(st, 13);
    r.attempt_count      = static_cast<uint32_t>(ColU64(st, 14));
    r.next_attempt_at_ms = ColI64(st, 15);
    r.claimed_at_ms      = ColI64(st, 16);
    r.synced_at_ms       = ColI64(st, 17);
    r.last_error         = ColText(st, 18);
    return r;
}

// Binds every modification column except id, starting at `idx`.
int BindModificationBody(sqlite3_stmt* st, int idx, const model::ModificationRecord& r) {
    BindText(st, idx++, r.mirror_id);
    BindText(st, idx++, r.organization_id);
    BindText(st, idx++, r.user_id);
    BindText(st, idx++, forecast::model::ToJson(r.delta));
    BindText(st, idx++, forecast::model::FieldSetToJson(r.modified_fields));
    BindText(st, idx++, r.session_id);
    BindText(st, idx++, r.change_reason);
    BindU64(st, idx++, r.base_version);
    BindU64(st, idx++, r.edit_count);
    BindText(st, idx++, std::string(forecast::model::ToString(r.sync_state)));
    BindI64(st, idx++, r.created_at_ms);
    BindI64(st, idx++, r.updated_at_ms);
    BindI64(st, idx++, r.committed_at_ms);
    BindU64(st, idx++, r.attempt_count);
    BindI64(st, idx++, r.next_attempt_at_ms);
    BindI64(st, idx++, r.claimed_at_ms);
    BindI64(st, idx++, r.synced_at_ms);
    BindText(st, idx++, r.last_error);
    return idx;
}

constexpr const char* kConflictColumns =
    "id,modification_id,mirror_id,organization_id,entity_id,field,local_value,remote_value,local_version,remote_version,"
    "remote_modified_by,created_at_ms";

model::SyncConflictRecord ReadConflict(sqlite3_stmt* st) {
    model::SyncConflictRecord r;
    r.id                 = ColText(st, 0);
    r.modification_id    = ColText(st, 1);
    r.mirror_id          = ColText(st, 2);
    r.organization_id    = ColText(st, 3);
    r.entity_id          = ColText(st, 4);
    r.field              = ColText(st, 5);
    r.local_value        = forecast::model::FieldValueFromJson(ColText(st, 6));
    r.remote_value       = forecast::model::FieldValueFromJson(ColText(st, 7));
    r.local_version      = ColU64(st, 8);
    r.remote_version     = ColU64(st, 9);
    r.remote_modified_by = ColText(st, 10);
    r.created_at_ms      = ColI64(st, 11);
    return r;
}

std::vector<model::ModificationRecord> QueryModifications(sqlite3* db, const std::string& sql, const sql::Params& params) {
    Statement s(db, sql);
    Require(s, db);
    BindParams(s.st, params);

    std::vector<model::ModificationRecord> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back(ReadModification(s.st));
    }
    RequireStep(rc, db);
    return out;
}

std::vector<model::SyncConflictRecord> QueryConflicts(sqlite3* db, const std::string& sql, const std::string& key) {
    Statement s(db, sql);
    Require(s, db);
    BindText(s.st, 1, key);

    std::vector<model::SyncConflictRecord> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back(ReadConflict(s.st));
    }
    RequireStep(rc, db);
    return out;
}

uint64_t QueryCount(sqlite3* db, const std::string& sql, const sql::Params& params) {
    Statement s(db, sql);
    Require(s, db);
    BindParams(s.st, params);

    const int rc = sqlite3_step(s.st);
    RequireStep(rc, db);
    return rc == SQLITE_ROW ? ColU64(s.st, 0) : 0;
}

std::vector<std::string> ActiveStates() {
    return {std::string(forecast::model::ToString(SyncState::kDraft)), std::string(forecast::model::ToString(SyncState::kCommitted)),
            std::string(forecast::model::ToString(SyncState::kSyncing))};
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Raw intake
// ------------------------------------------------------------------

Result SqliteRepository::InsertRawIntake(Transaction& t, const model::RawIntakeRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db, "INSERT INTO raw_intake(id,organization_id,ingested_at_ms,payload) VALUES(?,?,?,?);");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.organization_id);
    BindI64(s.st, 3, r.ingested_at_ms);
    BindBlob(s.st, 4, r.payload);

    return Translate(db, sqlite3_step(s.st));
}

uint64_t SqliteRepository::CountRawIntakeBefore(Transaction& t, int64_t cutoff_ms) {
    return QueryCount(TX(t).Handle(), "SELECT COUNT(*) FROM raw_intake WHERE ingested_at_ms < ?;", {cutoff_ms});
}

std::vector<model::RawIntakeRecord> SqliteRepository::ListRawIntakeBefore(Transaction& t, int64_t cutoff_ms,
                                                                          const std::optional<model::IntakeCursor>& after,
                                                                          std::size_t limit) {
    auto* db = TX(t).Handle();

    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    where.LessThan("ingested_at_ms", cutoff_ms);
    if (after) where.After("ingested_at_ms", after->ingested_at_ms, "id", after->id);
    const auto limit_ph = where.Bind(static_cast<int64_t>(limit));

    Statement s(db, "SELECT id,organization_id,ingested_at_ms,payload FROM raw_intake" + where.Where() +
                        " ORDER BY ingested_at_ms, id LIMIT " + limit_ph + ";");
    Require(s, db);
    BindParams(s.st, where.Parameters());

    std::vector<model::RawIntakeRecord> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        model::RawIntakeRecord r;
        r.id              = ColText(s.st, 0);
        r.organization_id = ColText(s.st, 1);
        r.ingested_at_ms  = ColI64(s.st, 2);
        r.payload         = ColBlob(s.st, 3);
        out.push_back(std::move(r));
    }
    RequireStep(rc, db);
    return out;
}

Result SqliteRepository::DeleteRawIntake(Transaction& t, const std::vector<std::string>& ids) {
    auto* db = TX(t).Handle();

    Statement s(db, "DELETE FROM raw_intake WHERE id=?;");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& id : ids) {
        BindText(s.st, 1, id);
        const int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
        sqlite3_reset(s.st);
        sqlite3_clear_bindings(s.st);
    }
    return Result::Ok();
}

model::IntakeStats SqliteRepository::GetIntakeStats(Transaction& t, int64_t cutoff_ms) {
    auto* db = TX(t).Handle();

    Statement s(db, "SELECT COUNT(*), COALESCE(MIN(ingested_at_ms),0), COALESCE(MAX(ingested_at_ms),0) FROM raw_intake;");
    Require(s, db);
    RequireStep(sqlite3_step(s.st), db);

    model::IntakeStats stats;
    stats.total            = ColU64(s.st, 0);
    stats.oldest_ingest_ms = ColI64(s.st, 1);
    stats.newest_ingest_ms = ColI64(s.st, 2);
    stats.eligible         = CountRawIntakeBefore(t, cutoff_ms);
    return stats;
}

// ------------------------------------------------------------------
// Mirror
// ------------------------------------------------------------------

Result SqliteRepository::InsertMirror(Transaction& t, const model::MirrorRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db,
                "INSERT INTO mirror(id,organization_id,entity_id,document,version,category,class_name,source,dor,manufacturer,model,"
                "created_at_ms,updated_at_ms,last_synced_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const auto idx = forecast::model::ExtractIndexedColumns(r.document);
    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.organization_id);
    BindText(s.st, 3, r.entity_id);
    BindText(s.st, 4, forecast::model::ToJson(r.document));
    BindU64(s.st, 5, r.version);
    BindText(s.st, 6, idx.category);
    BindText(s.st, 7, idx.class_name);
    BindText(s.st, 8, idx.source);
    BindText(s.st, 9, idx.dor);
    BindText(s.st, 10, idx.manufacturer);
    BindText(s.st, 11, idx.model);
    BindI64(s.st, 12, r.created_at_ms);
    BindI64(s.st, 13, r.updated_at_ms);
    BindI64(s.st, 14, r.last_synced_at_ms);

    auto res = Translate(db, sqlite3_step(s.st));
    // (organization_id, entity_id) is the natural key
    if (res.code == ErrorCode::ConstraintViolation) res.code = ErrorCode::AlreadyExists;
    return res;
}

Result SqliteRepository::UpdateMirror(Transaction& t, const model::MirrorRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db,
                "UPDATE mirror SET document=?,version=?,category=?,class_name=?,source=?,dor=?,manufacturer=?,model=?,"
                "created_at_ms=?,updated_at_ms=?,last_synced_at_ms=? WHERE id=? AND organization_id=? AND entity_id=?;");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const auto idx = forecast::model::ExtractIndexedColumns(r.document);
    BindText(s.st, 1, forecast::model::ToJson(r.document));
    BindU64(s.st, 2, r.version);
    BindText(s.st, 3, idx.category);
    BindText(s.st, 4, idx.class_name);
    BindText(s.st, 5, idx.source);
    BindText(s.st, 6, idx.dor);
    BindText(s.st, 7, idx.manufacturer);
    BindText(s.st, 8, idx.model);
    BindI64(s.st, 9, r.created_at_ms);
    BindI64(s.st, 10, r.updated_at_ms);
    BindI64(s.st, 11, r.last_synced_at_ms);
    BindText(s.st, 12, r.id);
    BindText(s.st, 13, r.organization_id);
    BindText(s.st, 14, r.entity_id);

    const int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
        if (GetMirror(t, r.id)) return Result::Err(ErrorCode::ConstraintViolation, "mirror identity is immutable");
        return Result::Err(ErrorCode::NotFound, "mirror " + r.id);
    }
    return Result::Ok();
}

std::optional<model::MirrorRecord> SqliteRepository::GetMirror(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement s(db, std::string("SELECT ") + kMirrorColumns + " FROM mirror WHERE id=?;");
    Require(s, db);
    BindText(s.st, 1, id);

    const int rc = sqlite3_step(s.st);
    RequireStep(rc, db);
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadMirror(s.st);
}

std::optional<model::MirrorRecord> SqliteRepository::GetMirrorByEntity(Transaction& t, const std::string& organization_id,
                                                                       const std::string& entity_id) {
    auto* db = TX(t).Handle();

    Statement s(db, std::string("SELECT ") + kMirrorColumns + " FROM mirror WHERE organization_id=? AND entity_id=?;");
    Require(s, db);
    BindText(s.st, 1, organization_id);
    BindText(s.st, 2, entity_id);

    const int rc = sqlite3_step(s.st);
    RequireStep(rc, db);
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadMirror(s.st);
}

std::vector<model::MirrorRecord> SqliteRepository::ListMirrors(Transaction& t, const std::string& organization_id, const MirrorFilter& filter) {
    auto* db = TX(t).Handle();

    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    sql::ApplyMirrorFilter(where, organization_id, filter);
    const auto limit_ph  = where.Bind(static_cast<int64_t>(filter.limit));
    const auto offset_ph = where.Bind(static_cast<int64_t>(filter.offset));

    Statement s(db, std::string("SELECT ") + kMirrorColumns + " FROM mirror" + where.Where() + " ORDER BY entity_id, id LIMIT " + limit_ph +
                        " OFFSET " + offset_ph + ";");
    Require(s, db);
    BindParams(s.st, where.Parameters());

    std::vector<model::MirrorRecord> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back(ReadMirror(s.st));
    }
    RequireStep(rc, db);
    return out;
}

uint64_t SqliteRepository::CountMirrors(Transaction& t, const std::string& organization_id, const MirrorFilter& filter) {
    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    sql::ApplyMirrorFilter(where, organization_id, filter);
    return QueryCount(TX(t).Handle(), "SELECT COUNT(*) FROM mirror" + where.Where() + ";", where.Parameters());
}

Result SqliteRepository::InsertMirrorHistory(Transaction& t, const model::MirrorHistoryRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db,
                "INSERT INTO mirror_history(id,mirror_id,organization_id,document,version,changed_by,change_reason,archived_at_ms) "
                "VALUES(?,?,?,?,?,?,?,?);");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.mirror_id);
    BindText(s.st, 3, r.organization_id);
    BindText(s.st, 4, forecast::model::ToJson(r.document));
    BindU64(s.st, 5, r.version);
    BindText(s.st, 6, r.changed_by);
    BindText(s.st, 7, r.change_reason);
    BindI64(s.st, 8, r.archived_at_ms);

    return Translate(db, sqlite3_step(s.st));
}

std::vector<model::MirrorHistoryRecord> SqliteRepository::ListMirrorHistory(Transaction& t, const std::string& mirror_id) {
    auto* db = TX(t).Handle();

    Statement s(db,
                "SELECT id,mirror_id,organization_id,document,version,changed_by,change_reason,archived_at_ms FROM mirror_history "
                "WHERE mirror_id=? ORDER BY version DESC, archived_at_ms DESC, id DESC;");
    Require(s, db);
    BindText(s.st, 1, mirror_id);

    std::vector<model::MirrorHistoryRecord> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        model::MirrorHistoryRecord r;
        r.id              = ColText(s.st, 0);
        r.mirror_id       = ColText(s.st, 1);
        r.organization_id = ColText(s.st, 2);
        r.document        = forecast::model::FromJson(ColText(s.st, 3));
        r.version         = ColU64(s.st, 4);
        r.changed_by      = ColText(s.st, 5);
        r.change_reason   = ColText(s.st, 6);
        r.archived_at_ms  = ColI64(s.st, 7);
        out.push_back(std::move(r));
    }
    RequireStep(rc, db);
    return out;
}

// ------------------------------------------------------------------
// Modifications
// ------------------------------------------------------------------

Result SqliteRepository::InsertModification(Transaction& t, const model::ModificationRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db, std::string("INSERT INTO modification(") + kModificationColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.id);
    BindModificationBody(s.st, 2, r);

    return Translate(db, sqlite3_step(s.st));
}

Result SqliteRepository::UpdateModification(Transaction& t, const model::ModificationRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db,
                "UPDATE modification SET mirror_id=?,organization_id=?,user_id=?,delta=?,modified_fields=?,session_id=?,change_reason=?,"
                "base_version=?,edit_count=?,sync_state=?,created_at_ms=?,updated_at_ms=?,committed_at_ms=?,attempt_count=?,"
                "next_attempt_at_ms=?,claimed_at_ms=?,synced_at_ms=?,last_error=? WHERE id=?;");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const int next = BindModificationBody(s.st, 1, r);
    BindText(s.st, next, r.id);

    const int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "modification " + r.id);
    return Result::Ok();
}

Result SqliteRepository::DeleteModification(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    // sync_conflict rows go with it (ON DELETE CASCADE)
    Statement s(db, "DELETE FROM modification WHERE id=?;");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, id);
    return Translate(db, sqlite3_step(s.st));
}

std::optional<model::ModificationRecord> SqliteRepository::GetModification(Transaction& t, const std::string& id) {
    auto rows = QueryModifications(TX(t).Handle(), std::string("SELECT ") + kModificationColumns + " FROM modification WHERE id=?;", {id});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<model::ModificationRecord> SqliteRepository::GetActiveModification(Transaction& t, const std::string& mirror_id,
                                                                                 const std::string& user_id) {
    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    where.Equals("mirror_id", mirror_id).Equals("user_id", user_id).In("sync_state", ActiveStates());

    auto rows = QueryModifications(TX(t).Handle(), std::string("SELECT ") + kModificationColumns + " FROM modification" + where.Where() + ";",
                                   where.Parameters());
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<model::ModificationRecord> SqliteRepository::ListActiveModifications(Transaction& t, const std::vector<std::string>& mirror_ids,
                                                                                 const std::optional<std::string>& user_id) {
    if (mirror_ids.empty()) return {};

    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    where.In("mirror_id", mirror_ids).In("sync_state", ActiveStates());
    if (user_id) where.Equals("user_id", *user_id);

    return QueryModifications(TX(t).Handle(),
                              std::string("SELECT ") + kModificationColumns + " FROM modification" + where.Where() + " ORDER BY id;",
                              where.Parameters());
}

std::vector<model::ModificationRecord> SqliteRepository::ListModifications(Transaction& t, const ModificationQuery& q) {
    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    sql::ApplyModificationQuery(where, q);

    return QueryModifications(TX(t).Handle(),
                              std::string("SELECT ") + kModificationColumns + " FROM modification" + where.Where() +
                                  " ORDER BY created_at_ms, id;",
                              where.Parameters());
}

uint64_t SqliteRepository::CountModifications(Transaction& t, const ModificationQuery& q) {
    sql::PredicateBuilder where(sql::PlaceholderStyle::kQuestion);
    sql::ApplyModificationQuery(where, q);
    return QueryCount(TX(t).Handle(), "SELECT COUNT(*) FROM modification" + where.Where() + ";", where.Parameters());
}

std::vector<model::ModificationRecord> SqliteRepository::ListModificationsForMirror(Transaction& t, const std::string& mirror_id) {
    return QueryModifications(TX(t).Handle(),
                              std::string("SELECT ") + kModificationColumns +
                                  " FROM modification WHERE mirror_id=? ORDER BY created_at_ms DESC, id DESC;",
                              {mirror_id});
}

std::vector<model::ModificationRecord> SqliteRepository::ClaimDueModifications(Transaction& t, int64_t now_ms, std::size_t limit) {
    auto* db = TX(t).Handle();

    // The transaction holds the database write lock, so select-then-update is exclusive.
    auto due = QueryModifications(db,
                                  std::string("SELECT ") + kModificationColumns +
                                      " FROM modification WHERE sync_state='committed' AND next_attempt_at_ms<=? "
                                      "ORDER BY committed_at_ms, id LIMIT ?;",
                                  {now_ms, static_cast<int64_t>(limit)});
    if (due.empty()) return due;

    Statement s(db, "UPDATE modification SET sync_state='syncing', claimed_at_ms=? WHERE id=?;");
    Require(s, db);

    for (auto& r : due) {
        BindI64(s.st, 1, now_ms);
        BindText(s.st, 2, r.id);
        const int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) throw std::runtime_error(std::string("claim modification: ") + sqlite3_errmsg(db));
        sqlite3_reset(s.st);

        r.sync_state    = SyncState::kSyncing;
        r.claimed_at_ms = now_ms;
    }
    return due;
}

uint64_t SqliteRepository::ReleaseStaleClaims(Transaction& t, int64_t claimed_before_ms) {
    auto* db = TX(t).Handle();

    Statement s(db, "UPDATE modification SET sync_state='committed', claimed_at_ms=0 WHERE sync_state='syncing' AND claimed_at_ms<?;");
    Require(s, db);
    BindI64(s.st, 1, claimed_before_ms);
    RequireStep(sqlite3_step(s.st), db);
    return static_cast<uint64_t>(sqlite3_changes(db));
}

std::map<SyncState, uint64_t> SqliteRepository::CountModificationsByState(Transaction& t, const std::string& organization_id) {
    auto* db = TX(t).Handle();

    Statement s(db, "SELECT sync_state, COUNT(*) FROM modification WHERE organization_id=? GROUP BY sync_state;");
    Require(s, db);
    BindText(s.st, 1, organization_id);

    std::map<SyncState, uint64_t> counts;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        counts[ColState(s.st, 0)] = ColU64(s.st, 1);
    }
    RequireStep(rc, db);
    return counts;
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result SqliteRepository::InsertConflict(Transaction& t, const model::SyncConflictRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db, std::string("INSERT INTO sync_conflict(") + kConflictColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.modification_id);
    BindText(s.st, 3, r.mirror_id);
    BindText(s.st, 4, r.organization_id);
    BindText(s.st, 5, r.entity_id);
    BindText(s.st, 6, r.field);
    BindText(s.st, 7, forecast::model::FieldValueToJson(r.local_value));
    BindText(s.st, 8, forecast::model::FieldValueToJson(r.remote_value));
    BindU64(s.st, 9, r.local_version);
    BindU64(s.st, 10, r.remote_version);
    BindText(s.st, 11, r.remote_modified_by);
    BindI64(s.st, 12, r.created_at_ms);

    return Translate(db, sqlite3_step(s.st));
}

std::vector<model::SyncConflictRecord> SqliteRepository::ListConflicts(Transaction& t, const std::string& organization_id) {
    return QueryConflicts(TX(t).Handle(),
                          std::string("SELECT ") + kConflictColumns +
                              " FROM sync_conflict WHERE organization_id=? ORDER BY created_at_ms DESC, modification_id, field;",
                          organization_id);
}

std::vector<model::SyncConflictRecord> SqliteRepository::ListConflictsForModification(Transaction& t, const std::string& modification_id) {
    return QueryConflicts(TX(t).Handle(),
                          std::string("SELECT ") + kConflictColumns + " FROM sync_conflict WHERE modification_id=? ORDER BY field;",
                          modification_id);
}

Result SqliteRepository::DeleteConflictsForModification(Transaction& t, const std::string& modification_id) {
    auto* db = TX(t).Handle();

    Statement s(db, "DELETE FROM sync_conflict WHERE modification_id=?;");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, modification_id);
    return Translate(db, sqlite3_step(s.st));
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result SqliteRepository::UpsertUser(Transaction& t, const model::UserRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db,
                "INSERT INTO app_user(id,username,display_name) VALUES(?,?,?) "
                "ON CONFLICT(id) DO UPDATE SET username=excluded.username, display_name=excluded.display_name;");
    if (!s) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.username);
    BindText(s.st, 3, r.display_name);

    return Translate(db, sqlite3_step(s.st));
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement s(db, "SELECT id,username,display_name FROM app_user WHERE id=?;");
    Require(s, db);
    BindText(s.st, 1, id);

    const int rc = sqlite3_step(s.st);
    RequireStep(rc, db);
    if (rc != SQLITE_ROW) return std::nullopt;

    model::UserRecord r;
    r.id           = ColText(s.st, 0);
    r.username     = ColText(s.st, 1);
    r.display_name = ColText(s.st, 2);
    return r;
}

} // namespace forecast::db::sqlite
