#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace inspector {

inline std::string toArtifactTypeString(ArtifactType type)
{
    switch (type) {
    case ArtifactType::InstalledApps:
        return "installed_apps";
    case ArtifactType::BrowserHistory:
        return "browser_history";
    case ArtifactType::BrowserExtension:
        return "browser_extension";
    case ArtifactType::BrowserHistoryDb:
        return "browser_history_db";
    case ArtifactType::MobilePackages:
        return "mobile_packages";
    case ArtifactType::MobileBackup:
        return "mobile_backup";
    case ArtifactType::ChainBalance:
        return "chain_balance";
    }
    return "installed_apps";
}

inline std::optional<ArtifactType> parseArtifactTypeString(const std::string &value)
{
    if (value == "installed_apps") {
        return ArtifactType::InstalledApps;
    }
    if (value == "browser_history") {
        return ArtifactType::BrowserHistory;
    }
    if (value == "browser_extension") {
        return ArtifactType::BrowserExtension;
    }
    if (value == "browser_history_db") {
        return ArtifactType::BrowserHistoryDb;
    }
    if (value == "mobile_packages") {
        return ArtifactType::MobilePackages;
    }
    if (value == "mobile_backup") {
        return ArtifactType::MobileBackup;
    }
    if (value == "chain_balance") {
        return ArtifactType::ChainBalance;
    }
    return std::nullopt;
}

inline std::string toAuditStatusString(AuditStatus status)
{
    switch (status) {
    case AuditStatus::Started:
        return "started";
    case AuditStatus::Success:
        return "success";
    case AuditStatus::Failed:
        return "failed";
    case AuditStatus::Skipped:
        return "skipped";
    }
    return "started";
}

inline std::optional<AuditStatus> parseAuditStatusString(const std::string &value)
{
    if (value == "started") {
        return AuditStatus::Started;
    }
    if (value == "success") {
        return AuditStatus::Success;
    }
    if (value == "failed") {
        return AuditStatus::Failed;
    }
    if (value == "skipped") {
        return AuditStatus::Skipped;
    }
    return std::nullopt;
}

inline std::string toHitRelationString(HitRelation relation)
{
    return relation == HitRelation::Derived ? "derived" : "direct";
}

inline HitRelation parseHitRelationString(const std::string &value)
{
    return value == "derived" ? HitRelation::Derived : HitRelation::Direct;
}

inline std::string toReportTypeString(ReportType type)
{
    switch (type) {
    case ReportType::InternalHtml:
        return "internal_html";
    case ReportType::InternalJson:
        return "internal_json";
    case ReportType::ForensicPdf:
        return "forensic_pdf";
    case ReportType::ForensicZip:
        return "forensic_zip";
    }
    return "internal_json";
}

inline std::optional<ReportType> parseReportTypeString(const std::string &value)
{
    if (value == "internal_html") {
        return ReportType::InternalHtml;
    }
    if (value == "internal_json") {
        return ReportType::InternalJson;
    }
    if (value == "forensic_pdf") {
        return ReportType::ForensicPdf;
    }
    if (value == "forensic_zip") {
        return ReportType::ForensicZip;
    }
    return std::nullopt;
}

inline std::string toReportStatusString(ReportStatus status)
{
    return status == ReportStatus::Failed ? "failed" : "ready";
}

inline ReportStatus parseReportStatusString(const std::string &value)
{
    return value == "failed" ? ReportStatus::Failed : ReportStatus::Ready;
}

inline std::string toPrecheckStatusString(PrecheckStatus status)
{
    switch (status) {
    case PrecheckStatus::Passed:
        return "passed";
    case PrecheckStatus::Failed:
        return "failed";
    case PrecheckStatus::Skipped:
        return "skipped";
    }
    return "passed";
}

inline PrecheckStatus parsePrecheckStatusString(const std::string &value)
{
    if (value == "failed") {
        return PrecheckStatus::Failed;
    }
    if (value == "skipped") {
        return PrecheckStatus::Skipped;
    }
    return PrecheckStatus::Passed;
}

inline std::string toFileKindString(FileKind kind)
{
    switch (kind) {
    case FileKind::Artifact:
        return "artifact";
    case FileKind::Report:
        return "report";
    case FileKind::Rule:
        return "rule";
    case FileKind::Manifest:
        return "manifest";
    }
    return "artifact";
}

inline FileKind parseFileKindString(const std::string &value)
{
    if (value == "report") {
        return FileKind::Report;
    }
    if (value == "rule") {
        return FileKind::Rule;
    }
    if (value == "manifest") {
        return FileKind::Manifest;
    }
    return FileKind::Artifact;
}

inline void to_json(nlohmann::json &j, const ArtifactType &type)
{
    j = toArtifactTypeString(type);
}

inline void from_json(const nlohmann::json &j, ArtifactType &type)
{
    const auto parsed = parseArtifactTypeString(j.is_string() ? j.get<std::string>() : std::string());
    if (!parsed) {
        throw std::invalid_argument("unknown artifact_type: " + j.dump());
    }
    type = *parsed;
}

inline void to_json(nlohmann::json &j, const AuditStatus &status)
{
    j = toAuditStatusString(status);
}

// Strict: the status string is a chain_hash input, so an unknown value must
// never be silently mapped onto a valid one.
inline void from_json(const nlohmann::json &j, AuditStatus &status)
{
    const auto parsed = parseAuditStatusString(j.is_string() ? j.get<std::string>() : std::string());
    if (!parsed) {
        throw std::invalid_argument("unknown audit status: " + j.dump());
    }
    status = *parsed;
}

inline void to_json(nlohmann::json &j, const CaseOverview &overview)
{
    j = nlohmann::json{
        {"case_id", overview.caseId},
        {"case_no", overview.caseNo},
        {"title", overview.title},
        {"status", overview.status},
        {"created_by", overview.createdBy},
        {"note", overview.note},
        {"created_at", overview.createdAt},
        {"updated_at", overview.updatedAt},
        {"device_count", overview.deviceCount},
        {"artifact_count", overview.artifactCount},
        {"hit_count", overview.hitCount},
        {"report_count", overview.reportCount}
    };
}

inline void from_json(const nlohmann::json &j, CaseOverview &overview)
{
    overview.caseId = j.value("case_id", "");
    overview.caseNo = j.value("case_no", "");
    overview.title = j.value("title", "");
    overview.status = j.value("status", "open");
    overview.createdBy = j.value("created_by", "");
    overview.note = j.value("note", "");
    overview.createdAt = j.value("created_at", std::int64_t{0});
    overview.updatedAt = j.value("updated_at", std::int64_t{0});
    overview.deviceCount = j.value("device_count", 0);
    overview.artifactCount = j.value("artifact_count", 0);
    overview.hitCount = j.value("hit_count", 0);
    overview.reportCount = j.value("report_count", 0);
}

inline void to_json(nlohmann::json &j, const CaseDevice &device)
{
    j = nlohmann::json{
        {"device_id", device.deviceId},
        {"case_id", device.caseId},
        {"os_type", device.osType},
        {"device_name", device.deviceName},
        {"identifier", device.identifier},
        {"connection_type", device.connectionType},
        {"authorized", device.authorized},
        {"auth_note", device.authNote},
        {"first_seen_at", device.firstSeenAt},
        {"last_seen_at", device.lastSeenAt}
    };
}

inline void from_json(const nlohmann::json &j, CaseDevice &device)
{
    device.deviceId = j.value("device_id", "");
    device.caseId = j.value("case_id", "");
    device.osType = j.value("os_type", "");
    device.deviceName = j.value("device_name", "");
    device.identifier = j.value("identifier", "");
    device.connectionType = j.value("connection_type", "local");
    device.authorized = j.value("authorized", false);
    device.authNote = j.value("auth_note", "");
    device.firstSeenAt = j.value("first_seen_at", std::int64_t{0});
    device.lastSeenAt = j.value("last_seen_at", std::int64_t{0});
}

inline void to_json(nlohmann::json &j, const Artifact &artifact)
{
    j = nlohmann::json{
        {"artifact_id", artifact.id},
        {"case_id", artifact.caseId},
        {"device_id", artifact.deviceId},
        {"artifact_type", artifact.type},
        {"source_ref", artifact.sourceRef},
        {"snapshot_path", artifact.snapshotPath},
        {"sha256", artifact.sha256},
        {"size_bytes", artifact.sizeBytes},
        {"collected_at", artifact.collectedAt},
        {"collector_name", artifact.collectorName},
        {"collector_version", artifact.collectorVersion},
        {"parser_version", artifact.parserVersion},
        {"acquisition_method", artifact.acquisitionMethod},
        {"payload_json", artifact.payloadBytes},
        {"record_hash", artifact.recordHash}
    };
}

inline void from_json(const nlohmann::json &j, Artifact &artifact)
{
    artifact.id = j.value("artifact_id", "");
    artifact.caseId = j.value("case_id", "");
    artifact.deviceId = j.value("device_id", "");
    artifact.type = j.at("artifact_type").get<ArtifactType>();
    artifact.sourceRef = j.value("source_ref", "");
    artifact.snapshotPath = j.value("snapshot_path", "");
    artifact.sha256 = j.value("sha256", "");
    artifact.sizeBytes = j.value("size_bytes", std::int64_t{0});
    artifact.collectedAt = j.value("collected_at", std::int64_t{0});
    artifact.collectorName = j.value("collector_name", "");
    artifact.collectorVersion = j.value("collector_version", "");
    artifact.parserVersion = j.value("parser_version", "");
    artifact.acquisitionMethod = j.value("acquisition_method", "");
    artifact.payloadBytes = j.value("payload_json", "");
    artifact.recordHash = j.value("record_hash", "");
}

inline void to_json(nlohmann::json &j, const RuleHit &hit)
{
    nlohmann::json artifactIds = nlohmann::json::array();
    nlohmann::json links = nlohmann::json::array();
    for (const auto &link : hit.links) {
        artifactIds.push_back(link.artifactId);
        links.push_back({{"artifact_id", link.artifactId},
                         {"relation", toHitRelationString(link.relation)}});
    }
    j = nlohmann::json{
        {"hit_id", hit.id},
        {"case_id", hit.caseId},
        {"device_id", hit.deviceId},
        {"hit_type", hit.hitType},
        {"rule_id", hit.ruleId},
        {"rule_name", hit.ruleName},
        {"rule_version", hit.ruleVersion},
        {"matched_value", hit.matchedValue},
        {"first_seen_at", hit.firstSeenAt},
        {"last_seen_at", hit.lastSeenAt},
        {"confidence", hit.confidence},
        {"verdict", hit.verdict},
        {"detail_json", hit.detailJson},
        {"artifact_ids", artifactIds},
        {"links", links}
    };
}

inline void to_json(nlohmann::json &j, const PrecheckResult &check)
{
    j = nlohmann::json{
        {"check_id", check.id},
        {"case_id", check.caseId},
        {"device_id", check.deviceId},
        {"scan_scope", check.scanScope},
        {"check_code", check.checkCode},
        {"check_name", check.checkName},
        {"required", check.required},
        {"status", toPrecheckStatusString(check.status)},
        {"message", check.message},
        {"detail_json", check.detailJson},
        {"checked_at", check.checkedAt},
        {"record_hash", check.recordHash}
    };
}

// detail_json is emitted as a string so the exact hashed bytes survive
// pretty-printing of the surrounding document.
inline void to_json(nlohmann::json &j, const AuditEvent &event)
{
    j = nlohmann::json{
        {"event_id", event.eventId},
        {"case_id", event.caseId},
        {"device_id", event.deviceId},
        {"event_type", event.eventType},
        {"action", event.action},
        {"status", event.status},
        {"actor", event.actor},
        {"source", event.source},
        {"detail_json", event.detailJson},
        {"occurred_at", event.occurredAt},
        {"chain_prev_hash", event.chainPrevHash},
        {"chain_hash", event.chainHash}
    };
}

inline void from_json(const nlohmann::json &j, AuditEvent &event)
{
    event.eventId = j.value("event_id", "");
    event.caseId = j.value("case_id", "");
    event.deviceId = j.value("device_id", "");
    event.eventType = j.value("event_type", "");
    event.action = j.value("action", "");
    event.status = j.at("status").get<AuditStatus>();
    event.actor = j.value("actor", "");
    event.source = j.value("source", "");
    if (j.contains("detail_json") && !j.at("detail_json").is_string()) {
        // A detail embedded as a JSON value is reduced to its compact dump,
        // the form it was hashed in.
        event.detailJson = j.at("detail_json").dump();
    } else {
        event.detailJson = j.value("detail_json", "");
    }
    event.occurredAt = j.at("occurred_at").get<std::int64_t>();
    event.chainPrevHash = j.value("chain_prev_hash", "");
    event.chainHash = j.value("chain_hash", "");
}

inline void to_json(nlohmann::json &j, const ReportInfo &report)
{
    j = nlohmann::json{
        {"report_id", report.reportId},
        {"case_id", report.caseId},
        {"report_type", toReportTypeString(report.reportType)},
        {"file_path", report.filePath},
        {"sha256", report.sha256},
        {"generated_at", report.generatedAt},
        {"generator_version", report.generatorVersion},
        {"status", toReportStatusString(report.status)}
    };
}

inline void to_json(nlohmann::json &j, const ManifestFileEntry &entry)
{
    j = nlohmann::json{
        {"path", entry.path},
        {"sha256", entry.sha256},
        {"size_bytes", entry.sizeBytes},
        {"kind", toFileKindString(entry.kind)}
    };
}

inline void from_json(const nlohmann::json &j, ManifestFileEntry &entry)
{
    entry.path = j.value("path", "");
    entry.sha256 = j.value("sha256", "");
    entry.sizeBytes = j.value("size_bytes", std::int64_t{0});
    entry.kind = parseFileKindString(j.value("kind", "artifact"));
}

} // namespace inspector
