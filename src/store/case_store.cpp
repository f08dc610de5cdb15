#include "store/case_store.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "common/id_utils.hpp"
#include "common/json_utils.hpp"

namespace inspector {

namespace {

constexpr const char *kSchemaVersion = "3";

constexpr const char *kCreateSchemaMetaTable =
    "CREATE TABLE IF NOT EXISTS schema_meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCreateCasesTable =
    "CREATE TABLE IF NOT EXISTS cases ("
    "    case_id TEXT PRIMARY KEY,"
    "    case_no TEXT,"
    "    title TEXT,"
    "    status TEXT NOT NULL DEFAULT 'open' CHECK (status IN ('open', 'closed', 'archived')),"
    "    created_by TEXT,"
    "    note TEXT,"
    "    created_at INTEGER NOT NULL,"
    "    updated_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateDevicesTable =
    "CREATE TABLE IF NOT EXISTS case_devices ("
    "    device_id TEXT PRIMARY KEY,"
    "    case_id TEXT NOT NULL REFERENCES cases(case_id),"
    "    os_type TEXT NOT NULL CHECK (os_type IN ('windows', 'macos', 'android', 'ios')),"
    "    device_name TEXT,"
    "    identifier TEXT,"
    "    connection_type TEXT NOT NULL DEFAULT 'local' CHECK (connection_type IN ('local', 'usb')),"
    "    is_authorized INTEGER NOT NULL DEFAULT 0 CHECK (is_authorized IN (0, 1)),"
    "    auth_note TEXT,"
    "    first_seen_at INTEGER NOT NULL,"
    "    last_seen_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateArtifactsTable =
    "CREATE TABLE IF NOT EXISTS artifacts ("
    "    artifact_id TEXT PRIMARY KEY,"
    "    case_id TEXT NOT NULL REFERENCES cases(case_id),"
    "    device_id TEXT NOT NULL,"
    "    artifact_type TEXT NOT NULL CHECK (artifact_type IN ("
    "        'installed_apps', 'browser_history', 'browser_extension',"
    "        'browser_history_db', 'mobile_packages', 'mobile_backup', 'chain_balance')),"
    "    source_ref TEXT,"
    "    snapshot_path TEXT NOT NULL,"
    "    sha256 TEXT NOT NULL CHECK (length(sha256) = 64),"
    "    size_bytes INTEGER NOT NULL CHECK (size_bytes >= 0),"
    "    collected_at INTEGER NOT NULL,"
    "    collector_name TEXT NOT NULL,"
    "    collector_version TEXT NOT NULL,"
    "    parser_version TEXT,"
    "    acquisition_method TEXT,"
    "    payload_json TEXT,"
    "    record_hash TEXT NOT NULL CHECK (length(record_hash) = 64),"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateRuleHitsTable =
    "CREATE TABLE IF NOT EXISTS rule_hits ("
    "    hit_id TEXT PRIMARY KEY,"
    "    case_id TEXT NOT NULL REFERENCES cases(case_id),"
    "    device_id TEXT NOT NULL,"
    "    hit_type TEXT NOT NULL,"
    "    rule_id TEXT NOT NULL,"
    "    rule_name TEXT,"
    "    rule_version TEXT,"
    "    matched_value TEXT NOT NULL,"
    "    first_seen_at INTEGER,"
    "    last_seen_at INTEGER,"
    "    confidence REAL NOT NULL CHECK (confidence >= 0 AND confidence <= 1),"
    "    verdict TEXT NOT NULL DEFAULT 'suspected' CHECK (verdict IN ('confirmed', 'suspected', 'unsupported')),"
    "    detail_json TEXT,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateHitLinksTable =
    "CREATE TABLE IF NOT EXISTS hit_artifact_links ("
    "    hit_id TEXT NOT NULL REFERENCES rule_hits(hit_id),"
    "    artifact_id TEXT NOT NULL REFERENCES artifacts(artifact_id),"
    "    relation TEXT NOT NULL DEFAULT 'direct' CHECK (relation IN ('direct', 'derived')),"
    "    created_at INTEGER NOT NULL,"
    "    PRIMARY KEY (hit_id, artifact_id)"
    ");";

constexpr const char *kCreatePrechecksTable =
    "CREATE TABLE IF NOT EXISTS precheck_results ("
    "    check_id TEXT PRIMARY KEY,"
    "    case_id TEXT NOT NULL REFERENCES cases(case_id),"
    "    device_id TEXT,"
    "    scan_scope TEXT NOT NULL CHECK (scan_scope IN ('host', 'mobile', 'general')),"
    "    check_code TEXT NOT NULL,"
    "    check_name TEXT NOT NULL,"
    "    required INTEGER NOT NULL DEFAULT 1 CHECK (required IN (0, 1)),"
    "    status TEXT NOT NULL CHECK (status IN ('passed', 'failed', 'skipped')),"
    "    message TEXT,"
    "    detail_json TEXT,"
    "    checked_at INTEGER NOT NULL,"
    "    record_hash TEXT NOT NULL CHECK (length(record_hash) = 64),"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateAuditLogsTable =
    "CREATE TABLE IF NOT EXISTS audit_logs ("
    "    event_id TEXT PRIMARY KEY,"
    "    case_id TEXT NOT NULL REFERENCES cases(case_id),"
    "    device_id TEXT,"
    "    event_type TEXT NOT NULL,"
    "    action TEXT NOT NULL,"
    "    status TEXT NOT NULL CHECK (status IN ('started', 'success', 'failed', 'skipped')),"
    "    actor TEXT,"
    "    source TEXT,"
    "    detail_json TEXT,"
    "    occurred_at INTEGER NOT NULL,"
    "    chain_prev_hash TEXT,"
    "    chain_hash TEXT NOT NULL CHECK (length(chain_hash) = 64)"
    ");";

constexpr const char *kCreateReportsTable =
    "CREATE TABLE IF NOT EXISTS reports ("
    "    report_id TEXT PRIMARY KEY,"
    "    case_id TEXT NOT NULL REFERENCES cases(case_id),"
    "    report_type TEXT NOT NULL CHECK (report_type IN ("
    "        'internal_html', 'internal_json', 'forensic_pdf', 'forensic_zip')),"
    "    file_path TEXT NOT NULL,"
    "    sha256 TEXT NOT NULL CHECK (length(sha256) = 64),"
    "    generated_at INTEGER NOT NULL,"
    "    generator_version TEXT NOT NULL,"
    "    status TEXT NOT NULL DEFAULT 'ready' CHECK (status IN ('ready', 'failed'))"
    ");";

constexpr const char *kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_case_devices_case_id ON case_devices(case_id);"
    "CREATE INDEX IF NOT EXISTS idx_artifacts_case_id ON artifacts(case_id);"
    "CREATE INDEX IF NOT EXISTS idx_artifacts_sha256 ON artifacts(sha256);"
    "CREATE INDEX IF NOT EXISTS idx_rule_hits_case_id ON rule_hits(case_id);"
    "CREATE INDEX IF NOT EXISTS idx_hit_artifact_links_artifact ON hit_artifact_links(artifact_id);"
    "CREATE INDEX IF NOT EXISTS idx_precheck_case_time ON precheck_results(case_id, checked_at);"
    "CREATE INDEX IF NOT EXISTS idx_audit_logs_case_time ON audit_logs(case_id, occurred_at, event_id);"
    "CREATE INDEX IF NOT EXISTS idx_reports_case_type ON reports(case_id, report_type);";

// Evidence rows and the audit trail are append-only at the storage level too.
constexpr const char *kCreateAppendOnlyTriggers =
    "CREATE TRIGGER IF NOT EXISTS trg_audit_logs_prevent_update "
    "BEFORE UPDATE ON audit_logs BEGIN "
    "    SELECT RAISE(ABORT, 'audit_logs is append-only'); "
    "END;"
    "CREATE TRIGGER IF NOT EXISTS trg_audit_logs_prevent_delete "
    "BEFORE DELETE ON audit_logs BEGIN "
    "    SELECT RAISE(ABORT, 'audit_logs is append-only'); "
    "END;"
    "CREATE TRIGGER IF NOT EXISTS trg_artifacts_prevent_update "
    "BEFORE UPDATE ON artifacts BEGIN "
    "    SELECT RAISE(ABORT, 'artifacts are immutable'); "
    "END;"
    "CREATE TRIGGER IF NOT EXISTS trg_artifacts_prevent_delete "
    "BEFORE DELETE ON artifacts BEGIN "
    "    SELECT RAISE(ABORT, 'artifacts are immutable'); "
    "END;";

std::string errorMessage(sqlite3 *db, const std::string &what)
{
    return what + ": " + (db ? sqlite3_errmsg(db) : "no database");
}

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(errorMessage(db, "sqlite prepare failed"));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    void execute(const std::string &what)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            throw StorageError(errorMessage(m_db, what));
        }
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    Transaction(sqlite3 *db, bool immediate)
        : m_db(db)
    {
        execOrThrow(m_db, immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_committed = false;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    const int length = sqlite3_column_bytes(stmt, index);
    return std::string(reinterpret_cast<const char *>(text), static_cast<std::size_t>(length));
}

// Enum columns are read strictly: an unknown stored value is an error, never
// silently mapped to another member.
template <typename Enum>
Enum requireStored(const std::optional<Enum> &parsed, const std::string &raw, const char *column)
{
    if (!parsed) {
        throw StorageError(std::string("unknown ") + column + " '" + raw + "' in database");
    }
    return *parsed;
}

template <typename Enum, typename Format>
Enum requireStored(Enum parsed, Format format, const std::string &raw, const char *column)
{
    if (format(parsed) != raw) {
        throw StorageError(std::string("unknown ") + column + " '" + raw + "' in database");
    }
    return parsed;
}

Artifact readArtifact(sqlite3_stmt *stmt)
{
    Artifact artifact;
    artifact.id = columnText(stmt, 0);
    artifact.caseId = columnText(stmt, 1);
    artifact.deviceId = columnText(stmt, 2);
    const std::string type = columnText(stmt, 3);
    artifact.type = requireStored(parseArtifactTypeString(type), type, "artifact_type");
    artifact.sourceRef = columnText(stmt, 4);
    artifact.snapshotPath = columnText(stmt, 5);
    artifact.sha256 = columnText(stmt, 6);
    artifact.sizeBytes = sqlite3_column_int64(stmt, 7);
    artifact.collectedAt = sqlite3_column_int64(stmt, 8);
    artifact.collectorName = columnText(stmt, 9);
    artifact.collectorVersion = columnText(stmt, 10);
    artifact.parserVersion = columnText(stmt, 11);
    artifact.acquisitionMethod = columnText(stmt, 12);
    artifact.payloadBytes = columnText(stmt, 13);
    artifact.recordHash = columnText(stmt, 14);
    return artifact;
}

constexpr const char *kArtifactColumns =
    "SELECT artifact_id, case_id, device_id, artifact_type, source_ref, "
    "snapshot_path, sha256, size_bytes, collected_at, collector_name, "
    "collector_version, parser_version, acquisition_method, payload_json, "
    "record_hash FROM artifacts ";

ReportInfo readReport(sqlite3_stmt *stmt)
{
    ReportInfo report;
    report.reportId = columnText(stmt, 0);
    report.caseId = columnText(stmt, 1);
    const std::string type = columnText(stmt, 2);
    report.reportType = requireStored(parseReportTypeString(type), type, "report_type");
    report.filePath = columnText(stmt, 3);
    report.sha256 = columnText(stmt, 4);
    report.generatedAt = sqlite3_column_int64(stmt, 5);
    report.generatorVersion = columnText(stmt, 6);
    const std::string status = columnText(stmt, 7);
    report.status = requireStored(parseReportStatusString(status), toReportStatusString,
                                  status, "report status");
    return report;
}

constexpr const char *kReportColumns =
    "SELECT report_id, case_id, report_type, file_path, sha256, generated_at, "
    "generator_version, status FROM reports ";

} // namespace

struct CaseStore::Impl {
    sqlite3 *db = nullptr;
    std::string dbPath;
    // One connection; multi-statement sequences must not interleave.
    mutable std::mutex mutex;
};

CaseStore::CaseStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->dbPath = dbPath;

    const std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) {
        std::error_code error;
        std::filesystem::create_directories(parent, error);
        if (error) {
            throw IOError("create db directory " + parent.string() + ": " + error.message());
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = errorMessage(impl->db, "failed to open case database " + dbPath);
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageError(message);
    }

    sqlite3_busy_timeout(impl->db, 5000);
    execOrThrow(impl->db, "PRAGMA foreign_keys = ON;");
    execOrThrow(impl->db, "PRAGMA journal_mode = WAL;");

    execOrThrow(impl->db, kCreateSchemaMetaTable);
    execOrThrow(impl->db, kCreateCasesTable);
    execOrThrow(impl->db, kCreateDevicesTable);
    execOrThrow(impl->db, kCreateArtifactsTable);
    execOrThrow(impl->db, kCreateRuleHitsTable);
    execOrThrow(impl->db, kCreateHitLinksTable);
    execOrThrow(impl->db, kCreatePrechecksTable);
    execOrThrow(impl->db, kCreateAuditLogsTable);
    execOrThrow(impl->db, kCreateReportsTable);
    execOrThrow(impl->db, kCreateIndexes);
    execOrThrow(impl->db, kCreateAppendOnlyTriggers);

    Statement meta(impl->db,
                   "INSERT OR REPLACE INTO schema_meta (key, value) VALUES "
                   "('schema_version', ?), ('schema_name', 'crypto_inspector');");
    bindText(meta.get(), 1, kSchemaVersion);
    meta.execute("failed to write schema_meta");
}

CaseStore::~CaseStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

const std::string &CaseStore::databasePath() const
{
    return impl->dbPath;
}

std::string CaseStore::ensureCase(const std::string &caseId,
                                  const std::string &caseNo,
                                  const std::string &title,
                                  const std::string &createdBy,
                                  const std::string &note)
{
    const std::string id = caseId.empty() ? newId("case") : caseId;
    const std::int64_t now = unixNowSeconds();

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO cases (case_id, case_no, title, status, created_by, note, "
                   "created_at, updated_at) VALUES (?, ?, ?, 'open', ?, ?, ?, ?) "
                   "ON CONFLICT(case_id) DO UPDATE SET "
                   "case_no = COALESCE(cases.case_no, excluded.case_no), "
                   "title = COALESCE(cases.title, excluded.title), "
                   "note = COALESCE(cases.note, excluded.note);");
    bindText(stmt.get(), 1, id);
    bindOptionalText(stmt.get(), 2, caseNo);
    bindOptionalText(stmt.get(), 3, title);
    bindOptionalText(stmt.get(), 4, createdBy);
    bindOptionalText(stmt.get(), 5, note);
    sqlite3_bind_int64(stmt.get(), 6, now);
    sqlite3_bind_int64(stmt.get(), 7, now);
    stmt.execute("failed to upsert case");
    return id;
}

std::optional<CaseOverview> CaseStore::getCaseOverview(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT c.case_id, COALESCE(c.case_no, ''), COALESCE(c.title, ''), "
                   "c.status, COALESCE(c.created_by, ''), COALESCE(c.note, ''), "
                   "c.created_at, c.updated_at, "
                   "(SELECT COUNT(*) FROM case_devices d WHERE d.case_id = c.case_id), "
                   "(SELECT COUNT(*) FROM artifacts a WHERE a.case_id = c.case_id), "
                   "(SELECT COUNT(*) FROM rule_hits h WHERE h.case_id = c.case_id), "
                   "(SELECT COUNT(*) FROM reports r WHERE r.case_id = c.case_id) "
                   "FROM cases c WHERE c.case_id = ? LIMIT 1;");
    bindText(stmt.get(), 1, caseId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    CaseOverview overview;
    overview.caseId = columnText(stmt.get(), 0);
    overview.caseNo = columnText(stmt.get(), 1);
    overview.title = columnText(stmt.get(), 2);
    overview.status = columnText(stmt.get(), 3);
    overview.createdBy = columnText(stmt.get(), 4);
    overview.note = columnText(stmt.get(), 5);
    overview.createdAt = sqlite3_column_int64(stmt.get(), 6);
    overview.updatedAt = sqlite3_column_int64(stmt.get(), 7);
    overview.deviceCount = sqlite3_column_int(stmt.get(), 8);
    overview.artifactCount = sqlite3_column_int(stmt.get(), 9);
    overview.hitCount = sqlite3_column_int(stmt.get(), 10);
    overview.reportCount = sqlite3_column_int(stmt.get(), 11);
    return overview;
}

void CaseStore::upsertDevice(const CaseDevice &device)
{
    const std::int64_t now = unixNowSeconds();

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO case_devices (device_id, case_id, os_type, device_name, "
                   "identifier, connection_type, is_authorized, auth_note, first_seen_at, "
                   "last_seen_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                   "ON CONFLICT(device_id) DO UPDATE SET "
                   "last_seen_at = excluded.last_seen_at, "
                   "connection_type = excluded.connection_type, "
                   "is_authorized = excluded.is_authorized, "
                   "auth_note = excluded.auth_note;");
    bindText(stmt.get(), 1, device.deviceId);
    bindText(stmt.get(), 2, device.caseId);
    bindText(stmt.get(), 3, device.osType);
    bindOptionalText(stmt.get(), 4, device.deviceName);
    bindOptionalText(stmt.get(), 5, device.identifier);
    bindText(stmt.get(), 6, device.connectionType.empty() ? "local" : device.connectionType);
    sqlite3_bind_int(stmt.get(), 7, device.authorized ? 1 : 0);
    bindOptionalText(stmt.get(), 8, device.authNote);
    sqlite3_bind_int64(stmt.get(), 9, device.firstSeenAt > 0 ? device.firstSeenAt : now);
    sqlite3_bind_int64(stmt.get(), 10, device.lastSeenAt > 0 ? device.lastSeenAt : now);
    stmt.execute("failed to upsert device " + device.deviceId);
}

std::vector<CaseDevice> CaseStore::listCaseDevices(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT device_id, case_id, os_type, COALESCE(device_name, ''), "
                   "COALESCE(identifier, ''), connection_type, is_authorized, "
                   "COALESCE(auth_note, ''), first_seen_at, last_seen_at "
                   "FROM case_devices WHERE case_id = ? "
                   "ORDER BY os_type, device_name, device_id;");
    bindText(stmt.get(), 1, caseId);

    std::vector<CaseDevice> devices;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        CaseDevice device;
        device.deviceId = columnText(stmt.get(), 0);
        device.caseId = columnText(stmt.get(), 1);
        device.osType = columnText(stmt.get(), 2);
        device.deviceName = columnText(stmt.get(), 3);
        device.identifier = columnText(stmt.get(), 4);
        device.connectionType = columnText(stmt.get(), 5);
        device.authorized = sqlite3_column_int(stmt.get(), 6) != 0;
        device.authNote = columnText(stmt.get(), 7);
        device.firstSeenAt = sqlite3_column_int64(stmt.get(), 8);
        device.lastSeenAt = sqlite3_column_int64(stmt.get(), 9);
        devices.push_back(std::move(device));
    }
    return devices;
}

void CaseStore::insertArtifact(const Artifact &artifact)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO artifacts (artifact_id, case_id, device_id, artifact_type, "
                   "source_ref, snapshot_path, sha256, size_bytes, collected_at, "
                   "collector_name, collector_version, parser_version, acquisition_method, "
                   "payload_json, record_hash, created_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, artifact.id);
    bindText(stmt.get(), 2, artifact.caseId);
    bindText(stmt.get(), 3, artifact.deviceId);
    bindText(stmt.get(), 4, toArtifactTypeString(artifact.type));
    bindOptionalText(stmt.get(), 5, artifact.sourceRef);
    bindText(stmt.get(), 6, artifact.snapshotPath);
    bindText(stmt.get(), 7, artifact.sha256);
    sqlite3_bind_int64(stmt.get(), 8, artifact.sizeBytes);
    sqlite3_bind_int64(stmt.get(), 9, artifact.collectedAt);
    bindText(stmt.get(), 10, artifact.collectorName);
    bindText(stmt.get(), 11, artifact.collectorVersion);
    bindOptionalText(stmt.get(), 12, artifact.parserVersion);
    bindOptionalText(stmt.get(), 13, artifact.acquisitionMethod);
    bindText(stmt.get(), 14, artifact.payloadBytes);
    bindText(stmt.get(), 15, artifact.recordHash);
    sqlite3_bind_int64(stmt.get(), 16, unixNowSeconds());
    stmt.execute("failed to insert artifact " + artifact.id);
}

std::optional<Artifact> CaseStore::getArtifact(const std::string &artifactId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string(kArtifactColumns) + "WHERE artifact_id = ? LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, artifactId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readArtifact(stmt.get());
}

std::vector<Artifact> CaseStore::listArtifactsByCase(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string(kArtifactColumns)
        + "WHERE case_id = ? ORDER BY collected_at DESC, artifact_id DESC;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, caseId);

    std::vector<Artifact> artifacts;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        artifacts.push_back(readArtifact(stmt.get()));
    }
    return artifacts;
}

void CaseStore::saveRuleHits(const std::vector<RuleHit> &hits)
{
    if (hits.empty()) {
        return;
    }

    const std::int64_t now = unixNowSeconds();

    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db, false);

    for (const auto &hit : hits) {
        Statement hitStmt(impl->db,
                          "INSERT INTO rule_hits (hit_id, case_id, device_id, hit_type, rule_id, "
                          "rule_name, rule_version, matched_value, first_seen_at, last_seen_at, "
                          "confidence, verdict, detail_json, created_at) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        const std::string hitId = hit.id.empty() ? newId("hit") : hit.id;
        bindText(hitStmt.get(), 1, hitId);
        bindText(hitStmt.get(), 2, hit.caseId);
        bindText(hitStmt.get(), 3, hit.deviceId);
        bindText(hitStmt.get(), 4, hit.hitType);
        bindText(hitStmt.get(), 5, hit.ruleId);
        bindOptionalText(hitStmt.get(), 6, hit.ruleName);
        bindOptionalText(hitStmt.get(), 7, hit.ruleVersion);
        bindText(hitStmt.get(), 8, hit.matchedValue);
        sqlite3_bind_int64(hitStmt.get(), 9, hit.firstSeenAt);
        sqlite3_bind_int64(hitStmt.get(), 10, hit.lastSeenAt);
        sqlite3_bind_double(hitStmt.get(), 11, hit.confidence);
        bindText(hitStmt.get(), 12, hit.verdict.empty() ? "suspected" : hit.verdict);
        bindText(hitStmt.get(), 13, hit.detailJson.empty() ? "{}" : hit.detailJson);
        sqlite3_bind_int64(hitStmt.get(), 14, now);
        hitStmt.execute("failed to insert hit " + hitId);

        for (const auto &link : hit.links) {
            Statement linkStmt(impl->db,
                               "INSERT OR IGNORE INTO hit_artifact_links "
                               "(hit_id, artifact_id, relation, created_at) VALUES (?, ?, ?, ?);");
            bindText(linkStmt.get(), 1, hitId);
            bindText(linkStmt.get(), 2, link.artifactId);
            bindText(linkStmt.get(), 3, toHitRelationString(link.relation));
            sqlite3_bind_int64(linkStmt.get(), 4, now);
            linkStmt.execute("failed to link hit " + hitId + " to " + link.artifactId);
        }
    }

    tx.commit();
}

std::vector<RuleHit> CaseStore::listCaseHits(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);

    std::map<std::string, std::vector<HitArtifactLink>> linksByHit;
    {
        Statement links(impl->db,
                        "SELECT l.hit_id, l.artifact_id, l.relation FROM hit_artifact_links l "
                        "JOIN rule_hits h ON h.hit_id = l.hit_id "
                        "WHERE h.case_id = ? ORDER BY l.hit_id, l.artifact_id;");
        bindText(links.get(), 1, caseId);
        while (sqlite3_step(links.get()) == SQLITE_ROW) {
            HitArtifactLink link;
            link.hitId = columnText(links.get(), 0);
            link.artifactId = columnText(links.get(), 1);
            const std::string relation = columnText(links.get(), 2);
            link.relation = requireStored(parseHitRelationString(relation), toHitRelationString,
                                          relation, "hit relation");
            linksByHit[link.hitId].push_back(std::move(link));
        }
    }

    Statement stmt(impl->db,
                   "SELECT hit_id, case_id, device_id, hit_type, rule_id, "
                   "COALESCE(rule_name, ''), COALESCE(rule_version, ''), matched_value, "
                   "COALESCE(first_seen_at, 0), COALESCE(last_seen_at, 0), confidence, "
                   "verdict, COALESCE(detail_json, '{}') FROM rule_hits WHERE case_id = ? "
                   "ORDER BY hit_type, confidence DESC, last_seen_at DESC, hit_id;");
    bindText(stmt.get(), 1, caseId);

    std::vector<RuleHit> hits;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        RuleHit hit;
        hit.id = columnText(stmt.get(), 0);
        hit.caseId = columnText(stmt.get(), 1);
        hit.deviceId = columnText(stmt.get(), 2);
        hit.hitType = columnText(stmt.get(), 3);
        hit.ruleId = columnText(stmt.get(), 4);
        hit.ruleName = columnText(stmt.get(), 5);
        hit.ruleVersion = columnText(stmt.get(), 6);
        hit.matchedValue = columnText(stmt.get(), 7);
        hit.firstSeenAt = sqlite3_column_int64(stmt.get(), 8);
        hit.lastSeenAt = sqlite3_column_int64(stmt.get(), 9);
        hit.confidence = sqlite3_column_double(stmt.get(), 10);
        hit.verdict = columnText(stmt.get(), 11);
        hit.detailJson = columnText(stmt.get(), 12);
        const auto found = linksByHit.find(hit.id);
        if (found != linksByHit.end()) {
            hit.links = found->second;
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

void CaseStore::savePrecheckResults(const std::vector<PrecheckResult> &checks)
{
    if (checks.empty()) {
        return;
    }

    const std::int64_t now = unixNowSeconds();

    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db, false);

    for (const auto &check : checks) {
        const std::string checkId = check.id.empty() ? newId("chk") : check.id;
        const std::int64_t checkedAt = check.checkedAt > 0 ? check.checkedAt : now;
        const std::string detail = check.detailJson.empty() ? "{}" : check.detailJson;
        const std::string status = toPrecheckStatusString(check.status);
        const std::string recordHash = !check.recordHash.empty()
            ? check.recordHash
            : sha256Text({checkId,
                          check.caseId,
                          check.deviceId,
                          check.scanScope,
                          check.checkCode,
                          status,
                          check.message,
                          detail,
                          std::to_string(checkedAt)});

        Statement stmt(impl->db,
                       "INSERT INTO precheck_results (check_id, case_id, device_id, scan_scope, "
                       "check_code, check_name, required, status, message, detail_json, "
                       "checked_at, record_hash, created_at) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        bindText(stmt.get(), 1, checkId);
        bindText(stmt.get(), 2, check.caseId);
        bindOptionalText(stmt.get(), 3, check.deviceId);
        bindText(stmt.get(), 4, check.scanScope);
        bindText(stmt.get(), 5, check.checkCode);
        bindText(stmt.get(), 6, check.checkName);
        sqlite3_bind_int(stmt.get(), 7, check.required ? 1 : 0);
        bindText(stmt.get(), 8, status);
        bindOptionalText(stmt.get(), 9, check.message);
        bindText(stmt.get(), 10, detail);
        sqlite3_bind_int64(stmt.get(), 11, checkedAt);
        bindText(stmt.get(), 12, recordHash);
        sqlite3_bind_int64(stmt.get(), 13, now);
        stmt.execute("failed to insert precheck " + checkId);
    }

    tx.commit();
}

std::vector<PrecheckResult> CaseStore::listPrecheckResults(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT check_id, case_id, COALESCE(device_id, ''), scan_scope, check_code, "
                   "check_name, required, status, COALESCE(message, ''), "
                   "COALESCE(detail_json, '{}'), checked_at, record_hash "
                   "FROM precheck_results WHERE case_id = ? ORDER BY checked_at ASC, check_id ASC;");
    bindText(stmt.get(), 1, caseId);

    std::vector<PrecheckResult> checks;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        PrecheckResult check;
        check.id = columnText(stmt.get(), 0);
        check.caseId = columnText(stmt.get(), 1);
        check.deviceId = columnText(stmt.get(), 2);
        check.scanScope = columnText(stmt.get(), 3);
        check.checkCode = columnText(stmt.get(), 4);
        check.checkName = columnText(stmt.get(), 5);
        check.required = sqlite3_column_int(stmt.get(), 6) != 0;
        const std::string status = columnText(stmt.get(), 7);
        check.status = requireStored(parsePrecheckStatusString(status), toPrecheckStatusString,
                                     status, "precheck status");
        check.message = columnText(stmt.get(), 8);
        check.detailJson = columnText(stmt.get(), 9);
        check.checkedAt = sqlite3_column_int64(stmt.get(), 10);
        check.recordHash = columnText(stmt.get(), 11);
        checks.push_back(std::move(check));
    }
    return checks;
}

AuditEvent CaseStore::appendAuditEvent(AuditEvent event, const AuditSealer &seal)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction tx(impl->db, true);

    std::optional<AuditTail> tail;
    {
        Statement tailStmt(impl->db,
                           "SELECT event_id, occurred_at, chain_hash FROM audit_logs "
                           "WHERE case_id = ? ORDER BY occurred_at DESC, event_id DESC LIMIT 1;");
        bindText(tailStmt.get(), 1, event.caseId);
        if (sqlite3_step(tailStmt.get()) == SQLITE_ROW) {
            AuditTail row;
            row.eventId = columnText(tailStmt.get(), 0);
            row.occurredAt = sqlite3_column_int64(tailStmt.get(), 1);
            row.chainHash = columnText(tailStmt.get(), 2);
            tail = std::move(row);
        }
    }

    seal(event, tail);

    Statement stmt(impl->db,
                   "INSERT INTO audit_logs (event_id, case_id, device_id, event_type, action, "
                   "status, actor, source, detail_json, occurred_at, chain_prev_hash, chain_hash) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, event.eventId);
    bindText(stmt.get(), 2, event.caseId);
    bindOptionalText(stmt.get(), 3, event.deviceId);
    bindText(stmt.get(), 4, event.eventType);
    bindText(stmt.get(), 5, event.action);
    bindText(stmt.get(), 6, toAuditStatusString(event.status));
    bindOptionalText(stmt.get(), 7, event.actor);
    bindOptionalText(stmt.get(), 8, event.source);
    bindText(stmt.get(), 9, event.detailJson);
    sqlite3_bind_int64(stmt.get(), 10, event.occurredAt);
    bindOptionalText(stmt.get(), 11, event.chainPrevHash);
    bindText(stmt.get(), 12, event.chainHash);
    stmt.execute("failed to insert audit log");

    tx.commit();
    return event;
}

std::optional<AuditTail> CaseStore::latestAuditTail(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT event_id, occurred_at, chain_hash FROM audit_logs "
                   "WHERE case_id = ? ORDER BY occurred_at DESC, event_id DESC LIMIT 1;");
    bindText(stmt.get(), 1, caseId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    AuditTail tail;
    tail.eventId = columnText(stmt.get(), 0);
    tail.occurredAt = sqlite3_column_int64(stmt.get(), 1);
    tail.chainHash = columnText(stmt.get(), 2);
    return tail;
}

std::vector<AuditEvent> CaseStore::listAuditEvents(const std::string &caseId, int limit) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT event_id, case_id, COALESCE(device_id, ''), event_type, action, "
                   "status, COALESCE(actor, ''), COALESCE(source, ''), "
                   "COALESCE(detail_json, ''), occurred_at, COALESCE(chain_prev_hash, ''), "
                   "chain_hash FROM audit_logs WHERE case_id = ? "
                   "ORDER BY occurred_at ASC, event_id ASC LIMIT ?;");
    bindText(stmt.get(), 1, caseId);
    sqlite3_bind_int64(stmt.get(), 2, limit > 0 ? limit : -1);

    std::vector<AuditEvent> events;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        AuditEvent event;
        event.eventId = columnText(stmt.get(), 0);
        event.caseId = columnText(stmt.get(), 1);
        event.deviceId = columnText(stmt.get(), 2);
        event.eventType = columnText(stmt.get(), 3);
        event.action = columnText(stmt.get(), 4);
        // An unknown status is kept readable; the event's chain hash no longer
        // matches its recomputation, so the chain walk reports it.
        event.status = parseAuditStatusString(columnText(stmt.get(), 5)).value_or(AuditStatus::Started);
        event.actor = columnText(stmt.get(), 6);
        event.source = columnText(stmt.get(), 7);
        event.detailJson = columnText(stmt.get(), 8);
        event.occurredAt = sqlite3_column_int64(stmt.get(), 9);
        event.chainPrevHash = columnText(stmt.get(), 10);
        event.chainHash = columnText(stmt.get(), 11);
        events.push_back(std::move(event));
    }
    return events;
}

std::string CaseStore::saveReport(const ReportInfo &report)
{
    const std::string reportId = report.reportId.empty() ? newId("report") : report.reportId;

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO reports (report_id, case_id, report_type, file_path, sha256, "
                   "generated_at, generator_version, status) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, reportId);
    bindText(stmt.get(), 2, report.caseId);
    bindText(stmt.get(), 3, toReportTypeString(report.reportType));
    bindText(stmt.get(), 4, report.filePath);
    bindText(stmt.get(), 5, report.sha256);
    sqlite3_bind_int64(stmt.get(), 6, report.generatedAt > 0 ? report.generatedAt : unixNowSeconds());
    bindText(stmt.get(), 7, report.generatorVersion);
    bindText(stmt.get(), 8, toReportStatusString(report.status));
    stmt.execute("failed to insert report");
    return reportId;
}

std::optional<ReportInfo> CaseStore::getReport(const std::string &reportId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string(kReportColumns) + "WHERE report_id = ? LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, reportId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readReport(stmt.get());
}

std::vector<ReportInfo> CaseStore::listReportsByCase(const std::string &caseId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string(kReportColumns)
        + "WHERE case_id = ? ORDER BY generated_at DESC, report_id DESC;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, caseId);

    std::vector<ReportInfo> reports;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        reports.push_back(readReport(stmt.get()));
    }
    return reports;
}

std::optional<std::string> CaseStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT value FROM schema_meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void CaseStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO schema_meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.execute("failed to set meta value");
}

std::string CaseStore::schemaSql() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT sql FROM sqlite_master WHERE sql IS NOT NULL "
                   "AND type IN ('table','index','trigger') ORDER BY name;");
    std::string schema;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const std::string sql = columnText(stmt.get(), 0);
        if (!sql.empty()) {
            schema += sql;
            schema += "\n";
        }
    }
    return schema;
}

} // namespace inspector
