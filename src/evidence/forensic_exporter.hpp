#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "evidence/audit_chain.hpp"
#include "store/case_store.hpp"

namespace inspector {

constexpr const char *kForensicManifestSchema = "crypto_inspector.forensic_export_manifest.v1";
constexpr const char *kForensicExportGenerator = "forensic-exportzip-0.1.0";
constexpr const char *kManifestEntryName = "manifest.json";
constexpr const char *kHashListEntryName = "hashes.sha256";

struct ForensicExportOptions {
    std::string caseId;
    std::string evidenceRoot;
    std::string reportsRoot;
    std::vector<std::string> ruleFiles;
    // Defaults to <database dir>/exports.
    std::string exportDir;
    std::string operatorName;
    std::string note;
    // Polled before every file is copied.
    const std::atomic<bool> *cancelFlag = nullptr;
};

struct ForensicExportResult {
    std::string caseId;
    std::string reportId;
    std::string zipPath;
    std::string zipSha256;
    std::int64_t generatedAt = 0;
    int fileCount = 0;
    bool cancelled = false;
    std::vector<std::string> warnings;
};

void to_json(nlohmann::json &j, const ForensicExportResult &result);

// ForensicExporter packages a case into a self-verifying ZIP:
//   manifest.json   case snapshot, full audit log and file table
//   hashes.sha256   "<sha256>  <path>" for every member, manifest included
//   evidence/...    artifact snapshots relative to the evidence root
//   reports/...     previously generated reports (never earlier exports)
//   rules/...       rule files in effect
// Missing or unreadable source files become warnings; the export continues.
// A failed write to the archive itself aborts the export.
class ForensicExporter {
public:
    ForensicExporter(CaseStore &store, AuditChain &audit);

    // Throws NotFoundError for an unknown case and ArchiveWriteError when the
    // destination archive cannot be created, written or finished.
    ForensicExportResult generateForensicZip(const ForensicExportOptions &options);

private:
    CaseStore &m_store;
    AuditChain &m_audit;
};

} // namespace inspector
