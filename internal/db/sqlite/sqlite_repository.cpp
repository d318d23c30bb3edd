#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/model/record_codec.hpp"
#include "jobflow/v1.hpp"

namespace jobflow::db::sqlite {

using jobflow::db::ErrorCode;
using jobflow::db::Result;

namespace {

constexpr const char* kTasksTable       = "tasks";
constexpr const char* kElementsTable    = "elements";
constexpr const char* kIterationsTable  = "iterations";
constexpr const char* kRunsTable        = "runs";
constexpr const char* kParametersTable  = "parameters";
constexpr const char* kLoopsTable       = "loops";
constexpr const char* kSubmissionsTable = "submissions";
constexpr const char* kWorkflowTable    = "workflow_info";

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static std::string Serialize(const google::protobuf::Message& m) {
    std::string bytes;
    if (!m.SerializeToString(&bytes)) {
        throw std::runtime_error("failed to serialise " + m.GetTypeName());
    }
    return bytes;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema() {
    static const std::vector<std::string> kBootstrapSql = {
        "CREATE TABLE IF NOT EXISTS tasks (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS elements (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS iterations (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS runs (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS parameters (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS loops (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS submissions (id INTEGER PRIMARY KEY, body BLOB NOT NULL);",
        "CREATE TABLE IF NOT EXISTS template_components (type TEXT NOT NULL, hash TEXT NOT NULL, body BLOB NOT NULL, PRIMARY KEY (type, hash));",
        "CREATE TABLE IF NOT EXISTS workflow_info (id INTEGER PRIMARY KEY CHECK (id = 0), body BLOB NOT NULL);"};

    const int version = db_->UserVersion();
    if (version > kSchemaVersion)
        throw std::runtime_error(db_->Path() + " has workflow schema " + std::to_string(version) + "; this build reads up to " +
                                 std::to_string(kSchemaVersion));

    for (const auto& sql : kBootstrapSql) {
        db_->Exec(sql);
    }
    if (version < kSchemaVersion) db_->SetUserVersion(kSchemaVersion);
}

std::vector<std::string> SqliteRepository::ResourcesFor(EntityKind) const {
    return {kDatabaseResource};
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(const std::vector<std::string>&, AccessMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
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
// Generic row access
// ------------------------------------------------------------------

uint64_t SqliteRepository::CountRows(Transaction& t, const char* table) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT COUNT(*) FROM ") + table + ";";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    uint64_t count = 0;
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) count = ColU64(st, 0);
    sqlite3_finalize(st);

    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
    return count;
}

template <typename Record>
Result SqliteRepository::InsertRow(Transaction& t, const char* table, EntityKind kind, const Record& r) {
    auto* db = TX(t).Handle();

    // ids are dense: the next row must take exactly the next id
    const uint64_t count = CountRows(t, table);
    if (r.id < count)
        return Result::Err(ErrorCode::AlreadyExists, std::string(EntityKindName(kind)) + " " + std::to_string(r.id) + " already exists");
    if (r.id > count)
        return Result::Err(ErrorCode::Conflict, std::string(EntityKindName(kind)) + " " + std::to_string(r.id) + " would leave a gap after " + std::to_string(count));

    const std::string sql = std::string("INSERT INTO ") + table + "(id,body) VALUES(?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.id);
    BindBlob(st, 2, Serialize(model::Encode(r)));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

template <typename Record>
Result SqliteRepository::UpdateRow(Transaction& t, const char* table, EntityKind kind, const Record& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("UPDATE ") + table + " SET body=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, Serialize(model::Encode(r)));
    BindU64(st, 2, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, std::string(EntityKindName(kind)) + " " + std::to_string(r.id));
    return result;
}

template <typename Message>
std::optional<Message> SqliteRepository::GetRow(Transaction& t, const char* table, uint64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT body FROM ") + table + " WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindU64(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE)
            throw std::runtime_error(std::string("sqlite select: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    Message m;
    const auto bytes = ColBlob(st, 0);
    sqlite3_finalize(st);

    if (!m.ParseFromString(bytes))
        throw std::runtime_error(std::string("corrupt row in ") + table + " id=" + std::to_string(id));
    return m;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
    return InsertRow(t, kTasksTable, EntityKind::kTask, r);
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
    return UpdateRow(t, kTasksTable, EntityKind::kTask, r);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::Task>(t, kTasksTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountTasks(Transaction& t) {
    return CountRows(t, kTasksTable);
}

// ------------------------------------------------------------------
// Elements
// ------------------------------------------------------------------

Result SqliteRepository::InsertElement(Transaction& t, const model::ElementRecord& r) {
    return InsertRow(t, kElementsTable, EntityKind::kElement, r);
}

Result SqliteRepository::UpdateElement(Transaction& t, const model::ElementRecord& r) {
    return UpdateRow(t, kElementsTable, EntityKind::kElement, r);
}

std::optional<model::ElementRecord> SqliteRepository::GetElement(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::Element>(t, kElementsTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountElements(Transaction& t) {
    return CountRows(t, kElementsTable);
}

// ------------------------------------------------------------------
// Iterations
// ------------------------------------------------------------------

Result SqliteRepository::InsertIteration(Transaction& t, const model::IterationRecord& r) {
    return InsertRow(t, kIterationsTable, EntityKind::kIteration, r);
}

Result SqliteRepository::UpdateIteration(Transaction& t, const model::IterationRecord& r) {
    return UpdateRow(t, kIterationsTable, EntityKind::kIteration, r);
}

std::optional<model::IterationRecord> SqliteRepository::GetIteration(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::ElementIteration>(t, kIterationsTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountIterations(Transaction& t) {
    return CountRows(t, kIterationsTable);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
    return InsertRow(t, kRunsTable, EntityKind::kRun, r);
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
    return UpdateRow(t, kRunsTable, EntityKind::kRun, r);
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::Run>(t, kRunsTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountRuns(Transaction& t) {
    return CountRows(t, kRunsTable);
}

// ------------------------------------------------------------------
// Parameters
// ------------------------------------------------------------------

Result SqliteRepository::InsertParameter(Transaction& t, const model::ParameterRecord& r) {
    return InsertRow(t, kParametersTable, EntityKind::kParameter, r);
}

Result SqliteRepository::UpdateParameter(Transaction& t, const model::ParameterRecord& r) {
    return UpdateRow(t, kParametersTable, EntityKind::kParameter, r);
}

std::optional<model::ParameterRecord> SqliteRepository::GetParameter(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::Parameter>(t, kParametersTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountParameters(Transaction& t) {
    return CountRows(t, kParametersTable);
}

// ------------------------------------------------------------------
// Loops
// ------------------------------------------------------------------

Result SqliteRepository::InsertLoop(Transaction& t, const model::LoopRecord& r) {
    return InsertRow(t, kLoopsTable, EntityKind::kLoop, r);
}

Result SqliteRepository::UpdateLoop(Transaction& t, const model::LoopRecord& r) {
    return UpdateRow(t, kLoopsTable, EntityKind::kLoop, r);
}

std::optional<model::LoopRecord> SqliteRepository::GetLoop(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::Loop>(t, kLoopsTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountLoops(Transaction& t) {
    return CountRows(t, kLoopsTable);
}

// ------------------------------------------------------------------
// Submissions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubmission(Transaction& t, const model::SubmissionRecord& r) {
    return InsertRow(t, kSubmissionsTable, EntityKind::kSubmission, r);
}

Result SqliteRepository::UpdateSubmission(Transaction& t, const model::SubmissionRecord& r) {
    return UpdateRow(t, kSubmissionsTable, EntityKind::kSubmission, r);
}

std::optional<model::SubmissionRecord> SqliteRepository::GetSubmission(Transaction& t, uint64_t id) {
    auto m = GetRow<v1::Submission>(t, kSubmissionsTable, id);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

uint64_t SqliteRepository::CountSubmissions(Transaction& t) {
    return CountRows(t, kSubmissionsTable);
}

// ------------------------------------------------------------------
// Template components
// ------------------------------------------------------------------

model::TemplateComponents SqliteRepository::GetTemplateComponents(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT type,hash,body FROM template_components ORDER BY type,hash;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    model::TemplateComponents components;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        google::protobuf::Struct doc;
        if (!doc.ParseFromString(ColBlob(st, 2))) {
            sqlite3_finalize(st);
            throw std::runtime_error("corrupt template component row");
        }
        components[ColText(st, 0)].emplace(ColText(st, 1), std::move(doc));
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite select: ") + sqlite3_errmsg(db));
    return components;
}

Result SqliteRepository::MergeTemplateComponents(Transaction& t, const model::TemplateComponents& components) {
    auto* db = TX(t).Handle();

    const char* sql = "INSERT OR IGNORE INTO template_components(type,hash,body) VALUES(?,?,?);";

    for (const auto& [type, by_hash] : components) {
        for (const auto& [hash, doc] : by_hash) {
            sqlite3_stmt* st = nullptr;
            if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
                return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

            BindText(st, 1, type);
            BindText(st, 2, hash);
            BindBlob(st, 3, Serialize(doc));

            int rc = sqlite3_step(st);
            sqlite3_finalize(st);

            auto result = Translate(db, rc);
            if (!result) return result;
        }
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Workflow metadata
// ------------------------------------------------------------------

// A single row with id 0.
std::optional<model::WorkflowInfo> SqliteRepository::GetWorkflowInfo(Transaction& t) {
    auto m = GetRow<v1::WorkflowInfo>(t, kWorkflowTable, 0);
    if (!m) return std::nullopt;
    return model::Decode(*m);
}

Result SqliteRepository::InsertWorkflowInfo(Transaction& t, const model::WorkflowInfo& info) {
    auto* db = TX(t).Handle();

    if (CountRows(t, kWorkflowTable) != 0)
        return Result::Err(ErrorCode::AlreadyExists, "workflow metadata already exists");

    const std::string sql = std::string("INSERT INTO ") + kWorkflowTable + "(id,body) VALUES(0,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, Serialize(model::Encode(info)));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace jobflow::db::sqlite
