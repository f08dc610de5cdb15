#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace inspector {

// Most recent audit row of a case under (occurred_at DESC, event_id DESC).
struct AuditTail {
    std::string eventId;
    std::int64_t occurredAt = 0;
    std::string chainHash;
};

// CaseStore is the SQLite access layer for cases, devices, artifacts, rule
// hits, prechecks, the audit trail and the report index.
//
// Artifacts and audit events are insert-only: no update or delete method is
// exposed, and schema triggers abort any UPDATE/DELETE issued behind this
// class's back.
class CaseStore {
public:
    // Fills in eventId, occurredAt, chainPrevHash and chainHash of a new
    // audit row given the case's current tail (empty optional for the first
    // event).
    using AuditSealer = std::function<void(AuditEvent &event,
                                           const std::optional<AuditTail> &tail)>;

    explicit CaseStore(const std::string &dbPath);
    ~CaseStore();

    CaseStore(const CaseStore &) = delete;
    CaseStore &operator=(const CaseStore &) = delete;

    const std::string &databasePath() const;

    // Creates the case on first use; later calls only fill empty fields.
    std::string ensureCase(const std::string &caseId,
                           const std::string &caseNo = {},
                           const std::string &title = {},
                           const std::string &createdBy = {},
                           const std::string &note = {});
    std::optional<CaseOverview> getCaseOverview(const std::string &caseId) const;

    void upsertDevice(const CaseDevice &device);
    std::vector<CaseDevice> listCaseDevices(const std::string &caseId) const;

    void insertArtifact(const Artifact &artifact);
    std::optional<Artifact> getArtifact(const std::string &artifactId) const;
    std::vector<Artifact> listArtifactsByCase(const std::string &caseId) const;

    // Hits and their artifact links are written in one transaction.
    void saveRuleHits(const std::vector<RuleHit> &hits);
    std::vector<RuleHit> listCaseHits(const std::string &caseId) const;

    void savePrecheckResults(const std::vector<PrecheckResult> &checks);
    std::vector<PrecheckResult> listPrecheckResults(const std::string &caseId) const;

    // Reads the tail and inserts the sealed event inside one IMMEDIATE
    // transaction, so no other writer can chain off the same tail.
    AuditEvent appendAuditEvent(AuditEvent event, const AuditSealer &seal);
    std::optional<AuditTail> latestAuditTail(const std::string &caseId) const;
    // Ordered by (occurred_at ASC, event_id ASC). limit <= 0 returns all rows.
    std::vector<AuditEvent> listAuditEvents(const std::string &caseId, int limit) const;

    std::string saveReport(const ReportInfo &report);
    std::optional<ReportInfo> getReport(const std::string &reportId) const;
    std::vector<ReportInfo> listReportsByCase(const std::string &caseId) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    std::string schemaSql() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace inspector
