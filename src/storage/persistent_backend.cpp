// File: src/storage/persistent_backend.cpp
#include "storage/persistent_backend.hpp"
#include "core/errors.hpp"
#include "util/text.hpp"
#include "util/vector_math.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <sys/stat.h>

namespace engram {

namespace {

// WHERE fragment for RecordFilter: ?2 owner, ?3 tier, ?4 include_archived.
// Statements using it keep ?1 and ?5 for their own parameters. Tags, tier
// sets and creation range live in the record blob and are checked with
// RecordFilter::Matches after the row is read.
constexpr const char* kFilterClause =
    "(?2 IS NULL OR owner = ?2) AND (?3 IS NULL OR tier = ?3) AND (?4 = 1 OR archived = 0)";

// SQL LIMIT for a filtered scan; unbounded (-1) when rows may still be
// rejected after they are read
int64_t RowLimit(const RecordFilter& filter, size_t wanted) {
    return filter.HasRecordPredicates() ? -1 : static_cast<int64_t>(wanted);
}

/// Prepared statement that finalizes itself
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw UpstreamUnavailable(UpstreamKind::UNAVAILABLE, "SQLite prepare failed: " + error);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void Bind(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }
    void Bind(int index, int64_t value) { Check(sqlite3_bind_int64(stmt_, index, value)); }
    void Bind(int index, double value) { Check(sqlite3_bind_double(stmt_, index, value)); }
    void BindBlob(int index, const std::string& blob) {
        Check(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                SQLITE_TRANSIENT));
    }
    void BindNull(int index) { Check(sqlite3_bind_null(stmt_, index)); }

    /// Rewind for another execution with fresh bindings
    void Reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    void BindFilter(const RecordFilter& filter) {
        if (filter.owner) Bind(2, *filter.owner); else BindNull(2);
        if (filter.tier) Bind(3, static_cast<int64_t>(*filter.tier)); else BindNull(3);
        Bind(4, static_cast<int64_t>(filter.include_archived ? 1 : 0));
    }

    /// Advance; true when a row is available
    bool Step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        Fail(rc);
        return false;
    }

    std::string ColumnText(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? std::string(reinterpret_cast<const char*>(text),
                                  static_cast<size_t>(sqlite3_column_bytes(stmt_, col)))
                    : std::string();
    }
    int64_t ColumnInt(int col) const { return sqlite3_column_int64(stmt_, col); }
    double ColumnDouble(int col) const { return sqlite3_column_double(stmt_, col); }
    bool ColumnIsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    const void* ColumnBlob(int col) const { return sqlite3_column_blob(stmt_, col); }
    int ColumnBytes(int col) const { return sqlite3_column_bytes(stmt_, col); }

private:
    void Check(int rc) {
        if (rc != SQLITE_OK) Fail(rc);
    }

    [[noreturn]] void Fail(int rc) {
        UpstreamKind kind = (rc == SQLITE_BUSY || rc == SQLITE_LOCKED)
                                ? UpstreamKind::TIMEOUT
                                : UpstreamKind::UNAVAILABLE;
        throw UpstreamUnavailable(kind, std::string("SQLite: ") + sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

/// BEGIN IMMEDIATE ... COMMIT, rolled back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        Run("BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void Commit() {
        Run("COMMIT;");
        committed_ = true;
    }

private:
    void Run(const char* sql) {
        char* error_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
            sqlite3_free(error_msg);
            throw UpstreamUnavailable(UpstreamKind::UNAVAILABLE, "SQLite transaction: " + error);
        }
    }

    sqlite3* db_;
    bool committed_{false};
};

// Highest score first, then smaller id
void SortScored(std::vector<ScoredID>& results) {
    std::sort(results.begin(), results.end(), [](const ScoredID& a, const ScoredID& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
}

// FTS5 query matching any of the content terms, each quoted as a phrase
std::string BuildMatchExpression(const std::string& query) {
    std::vector<std::string> terms = text::ContentTokens(query);
    std::sort(terms.begin(), terms.end());
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());

    std::string expression;
    for (const auto& term : terms) {
        if (!expression.empty()) {
            expression += " OR ";
        }
        expression += "\"" + term + "\"";
    }
    return expression;
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

PersistentBackend::PersistentBackend(const Config& config)
    : config_(config) {

    // Open SQLite database
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // Initialize database schema and settings
    InitializeDatabase();
}

PersistentBackend::~PersistentBackend() {
    if (db_) {
        // sqlite3_close_v2 handles WAL checkpointing and outstanding statements
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            log_.Error("close failed: " + std::string(sqlite3_errmsg(db_)));
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void PersistentBackend::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Set busy timeout to prevent infinite waiting on locks
    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    // Set pragmas
    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");
    ExecuteSQL("PRAGMA foreign_keys=ON;");

    CreateTables();
}

void PersistentBackend::CreateTables() {
    ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS records (
            id TEXT PRIMARY KEY,
            owner TEXT NOT NULL,
            content_hash TEXT NOT NULL,
            tier INTEGER NOT NULL,
            archived INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            version INTEGER NOT NULL,
            data BLOB NOT NULL,
            UNIQUE(owner, content_hash)
        );
    )");
    ExecuteOrThrow("CREATE INDEX IF NOT EXISTS idx_records_tier ON records(tier, archived);");
    ExecuteOrThrow("CREATE INDEX IF NOT EXISTS idx_records_owner ON records(owner);");

    ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS tombstones (
            discarded TEXT PRIMARY KEY,
            survivor TEXT NOT NULL
        );
    )");

    ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS cursors (
            name TEXT PRIMARY KEY,
            after_id TEXT NOT NULL
        );
    )");

    ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS entities (
            id TEXT PRIMARY KEY,
            label TEXT NOT NULL,
            type TEXT NOT NULL
        );
    )");

    ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS relations (
            id TEXT PRIMARY KEY,
            source TEXT NOT NULL,
            target TEXT NOT NULL,
            relation_type TEXT NOT NULL,
            weight REAL NOT NULL,
            valid_from INTEGER NOT NULL,
            valid_to INTEGER,
            recorded_at INTEGER NOT NULL
        );
    )");
    ExecuteOrThrow("CREATE INDEX IF NOT EXISTS idx_relations_source ON relations(source);");
    ExecuteOrThrow("CREATE INDEX IF NOT EXISTS idx_relations_target ON relations(target);");

    ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS mentions (
            record_id TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            PRIMARY KEY (record_id, entity_id)
        );
    )");
    ExecuteOrThrow("CREATE INDEX IF NOT EXISTS idx_mentions_entity ON mentions(entity_id);");

    // Keyword index; SQLite builds without FTS5 degrade keyword search only
    fts_available_ = ExecuteSQL(
        "CREATE VIRTUAL TABLE IF NOT EXISTS records_fts USING fts5(content, record_id UNINDEXED);");
    if (!fts_available_) {
        log_.Warning("FTS5 unavailable, keyword search disabled");
    }
}

bool PersistentBackend::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            log_.Debug(std::string("statement failed: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void PersistentBackend::ExecuteOrThrow(const std::string& sql) {
    if (!ExecuteSQL(sql)) {
        throw UpstreamUnavailable(UpstreamKind::UNAVAILABLE,
                                  std::string("SQLite: ") + sqlite3_errmsg(db_));
    }
}

// ============================================================================
// Records
// ============================================================================

UpsertResult PersistentBackend::UpsertByContent(const MemoryRecord& candidate) {
    std::lock_guard<std::mutex> lock(mutex_);

    // BEGIN IMMEDIATE takes the write lock before the lookup, so writers in
    // other processes cannot slip between the conflict check and the update
    Transaction txn(db_);

    MemoryRecord stored = candidate;
    stored.SetVersion(1);

    {
        Statement insert(db_, R"(
            INSERT INTO records (id, owner, content_hash, tier, archived, created_at, version, data)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
            ON CONFLICT(owner, content_hash) DO NOTHING;
        )");
        insert.Bind(1, stored.GetID().value());
        insert.Bind(2, stored.GetOwner());
        insert.Bind(3, stored.GetContentHash());
        insert.Bind(4, static_cast<int64_t>(stored.GetTier()));
        insert.Bind(5, static_cast<int64_t>(stored.IsArchived() ? 1 : 0));
        insert.Bind(6, stored.GetCreatedAt().ToMicros());
        insert.Bind(7, static_cast<int64_t>(stored.GetVersion()));
        insert.BindBlob(8, SerializeRecord(stored));
        insert.Step();
    }

    if (sqlite3_changes(db_) > 0) {
        if (fts_available_) {
            Statement fts(db_, "INSERT INTO records_fts (content, record_id) VALUES (?1, ?2);");
            fts.Bind(1, stored.GetContent());
            fts.Bind(2, stored.GetID().value());
            fts.Step();
        }
        txn.Commit();
        return UpsertResult{stored.GetID(), true, stored.GetAccessCount(), stored.GetVersion()};
    }

    // Same content already stored for this owner: count the access
    Statement select(db_, "SELECT data FROM records WHERE owner = ?1 AND content_hash = ?2;");
    select.Bind(1, candidate.GetOwner());
    select.Bind(2, candidate.GetContentHash());
    if (!select.Step()) {
        throw CorruptedState("Upsert conflict without a matching record");
    }
    MemoryRecord existing = DeserializeRecord(select.ColumnBlob(0), select.ColumnBytes(0));

    existing.RecordAccess(candidate.GetLastAccessed());
    existing.AddTags(candidate.GetTags());
    existing.Touch(candidate.GetLastModified());
    existing.SetVersion(existing.GetVersion() + 1);

    Statement update(db_, "UPDATE records SET version = ?1, data = ?2 WHERE id = ?3;");
    update.Bind(1, static_cast<int64_t>(existing.GetVersion()));
    update.BindBlob(2, SerializeRecord(existing));
    update.Bind(3, existing.GetID().value());
    update.Step();

    txn.Commit();
    return UpsertResult{existing.GetID(), false, existing.GetAccessCount(), existing.GetVersion()};
}

std::optional<MemoryRecord> PersistentBackend::Get(const RecordID& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT data, version FROM records WHERE id = ?1;");
    stmt.Bind(1, id.value());
    if (!stmt.Step()) {
        return std::nullopt;
    }

    MemoryRecord record = DeserializeRecord(stmt.ColumnBlob(0), stmt.ColumnBytes(0));
    if (record.GetVersion() != static_cast<uint64_t>(stmt.ColumnInt(1))) {
        throw CorruptedState("Version column disagrees with record " + id.value());
    }
    return record;
}

std::optional<RecordID> PersistentBackend::FindByContentHash(const std::string& owner,
                                                             const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT id FROM records WHERE owner = ?1 AND content_hash = ?2;");
    stmt.Bind(1, owner);
    stmt.Bind(2, content_hash);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return RecordID(stmt.ColumnText(0));
}

bool PersistentBackend::UpdateIfVersion(const MemoryRecord& record, uint64_t expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);

    {
        Statement check(db_, "SELECT owner, content_hash FROM records WHERE id = ?1;");
        check.Bind(1, record.GetID().value());
        if (!check.Step()) {
            return false;
        }
        if (check.ColumnText(0) != record.GetOwner() ||
            check.ColumnText(1) != record.GetContentHash()) {
            throw ValidationError("Content and owner of record " + record.GetID().value() +
                                  " are immutable");
        }
    }

    MemoryRecord stored = record;
    stored.SetVersion(expected_version + 1);

    // The version predicate is the compare-and-swap
    Statement stmt(db_, R"(
        UPDATE records SET tier = ?1, archived = ?2, version = ?3, data = ?4
        WHERE id = ?5 AND version = ?6;
    )");
    stmt.Bind(1, static_cast<int64_t>(stored.GetTier()));
    stmt.Bind(2, static_cast<int64_t>(stored.IsArchived() ? 1 : 0));
    stmt.Bind(3, static_cast<int64_t>(stored.GetVersion()));
    stmt.BindBlob(4, SerializeRecord(stored));
    stmt.Bind(5, stored.GetID().value());
    stmt.Bind(6, static_cast<int64_t>(expected_version));
    stmt.Step();

    return sqlite3_changes(db_) > 0;
}

bool PersistentBackend::Delete(const RecordID& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction txn(db_);

    {
        Statement stmt(db_, "DELETE FROM records WHERE id = ?1;");
        stmt.Bind(1, id.value());
        stmt.Step();
    }
    bool deleted = sqlite3_changes(db_) > 0;

    {
        Statement stmt(db_, "DELETE FROM mentions WHERE record_id = ?1;");
        stmt.Bind(1, id.value());
        stmt.Step();
    }
    if (fts_available_) {
        Statement stmt(db_, "DELETE FROM records_fts WHERE record_id = ?1;");
        stmt.Bind(1, id.value());
        stmt.Step();
    }

    txn.Commit();
    return deleted;
}

RecordPage PersistentBackend::ListPage(const PageRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    RecordPage page;
    if (request.limit == 0) {
        return page;
    }

    // Ask for one extra row to learn whether another page follows
    Statement stmt(db_, std::string("SELECT data FROM records WHERE (?1 IS NULL OR id > ?1) AND ") +
                        kFilterClause + " ORDER BY id LIMIT ?5;");
    if (request.after) stmt.Bind(1, request.after->value()); else stmt.BindNull(1);
    stmt.BindFilter(request.filter);
    stmt.Bind(5, RowLimit(request.filter, request.limit + 1));

    while (stmt.Step()) {
        MemoryRecord record = DeserializeRecord(stmt.ColumnBlob(0), stmt.ColumnBytes(0));
        if (!request.filter.Matches(record)) {
            continue;
        }
        if (page.records.size() == request.limit) {
            page.next_after = page.records.back().GetID();
            break;
        }
        page.records.push_back(std::move(record));
    }
    return page;
}

size_t PersistentBackend::Count(const RecordFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!filter.HasRecordPredicates()) {
        Statement stmt(db_, std::string("SELECT COUNT(*) FROM records WHERE ") + kFilterClause + ";");
        stmt.BindFilter(filter);
        stmt.Step();
        return static_cast<size_t>(stmt.ColumnInt(0));
    }

    Statement stmt(db_, std::string("SELECT data FROM records WHERE ") + kFilterClause + ";");
    stmt.BindFilter(filter);
    size_t count = 0;
    while (stmt.Step()) {
        if (filter.Matches(DeserializeRecord(stmt.ColumnBlob(0), stmt.ColumnBytes(0)))) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Search
// ============================================================================

std::vector<ScoredID> PersistentBackend::VectorTopK(const Embedding& query, size_t k,
                                                    const RecordFilter& filter) {
    std::vector<ScoredID> results;
    if (query.empty() || k == 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Exact scan; records without an embedding are skipped
    Statement stmt(db_, std::string("SELECT data FROM records WHERE ") + kFilterClause + ";");
    stmt.BindFilter(filter);

    while (stmt.Step()) {
        MemoryRecord record = DeserializeRecord(stmt.ColumnBlob(0), stmt.ColumnBytes(0));
        if (!record.HasEmbedding() || !filter.Matches(record)) {
            continue;
        }
        results.push_back(ScoredID{record.GetID(), CosineSimilarity(query, record.GetEmbedding())});
    }

    SortScored(results);
    if (results.size() > k) {
        results.resize(k);
    }
    return results;
}

std::vector<ScoredID> PersistentBackend::KeywordTopK(const std::string& query, size_t k,
                                                     const RecordFilter& filter) {
    if (!fts_available_) {
        throw UpstreamUnavailable(UpstreamKind::UNAVAILABLE, "keyword index unavailable");
    }

    std::vector<ScoredID> results;
    std::string expression = BuildMatchExpression(query);
    if (expression.empty() || k == 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // bm25() is lower-is-better; negate so higher is better like every other signal
    Statement stmt(db_, std::string(R"(
        SELECT r.id, -bm25(records_fts) AS score, r.data
        FROM records_fts JOIN records r ON r.id = records_fts.record_id
        WHERE records_fts MATCH ?1 AND )") + kFilterClause + R"(
        ORDER BY score DESC, r.id ASC
        LIMIT ?5;
    )");
    stmt.Bind(1, expression);
    stmt.BindFilter(filter);
    stmt.Bind(5, RowLimit(filter, k));

    while (results.size() < k && stmt.Step()) {
        if (filter.HasRecordPredicates() &&
            !filter.Matches(DeserializeRecord(stmt.ColumnBlob(2), stmt.ColumnBytes(2)))) {
            continue;
        }
        results.push_back(ScoredID{RecordID(stmt.ColumnText(0)),
                                   static_cast<float>(stmt.ColumnDouble(1))});
    }
    return results;
}

// ============================================================================
// Tombstones and cursors
// ============================================================================

void PersistentBackend::PutTombstone(const RecordID& discarded, const RecordID& survivor) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO tombstones (discarded, survivor) VALUES (?1, ?2)
        ON CONFLICT(discarded) DO UPDATE SET survivor = excluded.survivor;
    )");
    stmt.Bind(1, discarded.value());
    stmt.Bind(2, survivor.value());
    stmt.Step();
}

std::optional<RecordID> PersistentBackend::GetTombstone(const RecordID& discarded) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT survivor FROM tombstones WHERE discarded = ?1;");
    stmt.Bind(1, discarded.value());
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return RecordID(stmt.ColumnText(0));
}

void PersistentBackend::SaveCursor(const std::string& name, const RecordID& after) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO cursors (name, after_id) VALUES (?1, ?2)
        ON CONFLICT(name) DO UPDATE SET after_id = excluded.after_id;
    )");
    stmt.Bind(1, name);
    stmt.Bind(2, after.value());
    stmt.Step();
}

std::optional<RecordID> PersistentBackend::LoadCursor(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT after_id FROM cursors WHERE name = ?1;");
    stmt.Bind(1, name);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return RecordID(stmt.ColumnText(0));
}

void PersistentBackend::ClearCursor(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM cursors WHERE name = ?1;");
    stmt.Bind(1, name);
    stmt.Step();
}

// ============================================================================
// Graph
// ============================================================================

void PersistentBackend::UpsertEntity(const EntityNode& entity) {
    if (entity.id.empty() || entity.label.empty()) {
        throw ValidationError("Entity needs an id and a label");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO entities (id, label, type) VALUES (?1, ?2, ?3)
        ON CONFLICT(id) DO UPDATE SET label = excluded.label, type = excluded.type;
    )");
    stmt.Bind(1, entity.id);
    stmt.Bind(2, entity.label);
    stmt.Bind(3, entity.type);
    stmt.Step();
}

void PersistentBackend::UpsertRelation(const RelationEdge& relation) {
    if (relation.id.empty() || relation.source.empty() || relation.target.empty()) {
        throw ValidationError("Relation needs an id, a source and a target");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO relations (id, source, target, relation_type, weight, valid_from, valid_to, recorded_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        ON CONFLICT(id) DO UPDATE SET
            source = excluded.source, target = excluded.target,
            relation_type = excluded.relation_type, weight = excluded.weight,
            valid_from = excluded.valid_from, valid_to = excluded.valid_to,
            recorded_at = excluded.recorded_at;
    )");
    stmt.Bind(1, relation.id);
    stmt.Bind(2, relation.source);
    stmt.Bind(3, relation.target);
    stmt.Bind(4, relation.relation_type);
    stmt.Bind(5, static_cast<double>(relation.weight));
    stmt.Bind(6, relation.valid_from.ToMicros());
    if (relation.valid_to) stmt.Bind(7, relation.valid_to->ToMicros()); else stmt.BindNull(7);
    stmt.Bind(8, relation.recorded_at.ToMicros());
    stmt.Step();
}

void PersistentBackend::LinkRecordEntity(const RecordID& record, const EntityID& entity) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "INSERT OR IGNORE INTO mentions (record_id, entity_id) VALUES (?1, ?2);");
    stmt.Bind(1, record.value());
    stmt.Bind(2, entity);
    stmt.Step();
}

std::vector<EntityNode> PersistentBackend::FindEntitiesInText(const std::string& text,
                                                              size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT id, label, type FROM entities
        WHERE instr(?1, lower(label)) > 0
        ORDER BY length(label) DESC, id ASC
        LIMIT ?2;
    )");
    stmt.Bind(1, text::ToLower(text));
    stmt.Bind(2, static_cast<int64_t>(limit));

    std::vector<EntityNode> found;
    while (stmt.Step()) {
        found.push_back(EntityNode{stmt.ColumnText(0), stmt.ColumnText(1), stmt.ColumnText(2)});
    }
    return found;
}

std::vector<RelationEdge> PersistentBackend::GetRelations(const EntityID& entity, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        SELECT id, source, target, relation_type, weight, valid_from, valid_to, recorded_at
        FROM relations
        WHERE (source = ?1 OR target = ?1)
          AND valid_from <= ?2 AND (valid_to IS NULL OR valid_to > ?2)
        ORDER BY id;
    )");
    stmt.Bind(1, entity);
    stmt.Bind(2, at.ToMicros());

    std::vector<RelationEdge> edges;
    while (stmt.Step()) {
        RelationEdge edge;
        edge.id = stmt.ColumnText(0);
        edge.source = stmt.ColumnText(1);
        edge.target = stmt.ColumnText(2);
        edge.relation_type = stmt.ColumnText(3);
        edge.weight = static_cast<float>(stmt.ColumnDouble(4));
        edge.valid_from = Timestamp::FromMicros(stmt.ColumnInt(5));
        if (!stmt.ColumnIsNull(6)) {
            edge.valid_to = Timestamp::FromMicros(stmt.ColumnInt(6));
        }
        edge.recorded_at = Timestamp::FromMicros(stmt.ColumnInt(7));
        edges.push_back(std::move(edge));
    }
    return edges;
}

std::vector<EntityMention> PersistentBackend::RecordsForEntities(
        const std::vector<EntityID>& entities) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<EntityMention> mentions;
    std::set<EntityID> seen;

    Statement stmt(db_, "SELECT record_id FROM mentions WHERE entity_id = ?1 ORDER BY record_id;");
    for (const auto& entity : entities) {
        if (!seen.insert(entity).second) {
            continue;
        }
        stmt.Reset();
        stmt.Bind(1, entity);
        while (stmt.Step()) {
            mentions.push_back(EntityMention{entity, RecordID(stmt.ColumnText(0))});
        }
    }
    return mentions;
}

std::vector<EntityID> PersistentBackend::EntitiesForRecord(const RecordID& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT entity_id FROM mentions WHERE record_id = ?1 ORDER BY entity_id;");
    stmt.Bind(1, record.value());

    std::vector<EntityID> entities;
    while (stmt.Step()) {
        entities.push_back(stmt.ColumnText(0));
    }
    return entities;
}

// ============================================================================
// Maintenance Operations
// ============================================================================

size_t PersistentBackend::CountTableUnlocked(const char* sql) const {
    Statement stmt(db_, sql);
    stmt.Step();
    return static_cast<size_t>(stmt.ColumnInt(0));
}

StorageStats PersistentBackend::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStats stats;
    stats.total_records = CountTableUnlocked("SELECT COUNT(*) FROM records;");
    stats.total_tombstones = CountTableUnlocked("SELECT COUNT(*) FROM tombstones;");
    stats.total_entities = CountTableUnlocked("SELECT COUNT(*) FROM entities;");
    stats.total_relations = CountTableUnlocked("SELECT COUNT(*) FROM relations;");
    stats.disk_usage_bytes = GetDatabaseSize();
    return stats;
}

void PersistentBackend::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    // WAL checkpoint
    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

void PersistentBackend::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction txn(db_);
    ExecuteOrThrow("DELETE FROM records;");
    ExecuteOrThrow("DELETE FROM tombstones;");
    ExecuteOrThrow("DELETE FROM cursors;");
    ExecuteOrThrow("DELETE FROM entities;");
    ExecuteOrThrow("DELETE FROM relations;");
    ExecuteOrThrow("DELETE FROM mentions;");
    if (fts_available_) {
        ExecuteOrThrow("DELETE FROM records_fts;");
    }
    txn.Commit();
}

bool PersistentBackend::CreateSnapshot(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Flush WAL first
    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }

    // Use SQLite backup API
    sqlite3* backup_db = nullptr;
    if (sqlite3_open(path.c_str(), &backup_db) != SQLITE_OK) {
        log_.Error("cannot open snapshot target " + path);
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(backup_db, "main", db_, "main");
    if (!backup) {
        log_.Error("backup init failed: " + std::string(sqlite3_errmsg(backup_db)));
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup_step(backup, -1);  // Copy all pages
    sqlite3_backup_finish(backup);

    int rc = sqlite3_errcode(backup_db);
    sqlite3_close(backup_db);

    return rc == SQLITE_OK;
}

// ============================================================================
// Helper Methods
// ============================================================================

std::string PersistentBackend::SerializeRecord(const MemoryRecord& record) {
    std::ostringstream oss(std::ios::binary);
    record.Serialize(oss);
    return oss.str();
}

MemoryRecord PersistentBackend::DeserializeRecord(const void* data, int size) {
    if (!data || size <= 0) {
        throw CorruptedState("Empty record blob");
    }
    std::string str(static_cast<const char*>(data), static_cast<size_t>(size));
    std::istringstream iss(str, std::ios::binary);
    return MemoryRecord::Deserialize(iss);
}

size_t PersistentBackend::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

} // namespace engram
