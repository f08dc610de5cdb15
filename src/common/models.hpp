#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace inspector {

// Timestamps are Unix seconds; they take part in record and chain hashes
// as decimal strings, so they are kept as plain integers.

struct CaseOverview {
    std::string caseId;
    std::string caseNo;
    std::string title;
    std::string status;
    std::string createdBy;
    std::string note;
    std::int64_t createdAt = 0;
    std::int64_t updatedAt = 0;
    int deviceCount = 0;
    int artifactCount = 0;
    int hitCount = 0;
    int reportCount = 0;
};

struct CaseDevice {
    std::string deviceId;
    std::string caseId;
    std::string osType;
    std::string deviceName;
    std::string identifier;
    std::string connectionType = "local";
    bool authorized = false;
    std::string authNote;
    std::int64_t firstSeenAt = 0;
    std::int64_t lastSeenAt = 0;
};

// Immutable evidence record. Created once by ArtifactStore::put and never
// updated; rule hits reference it by id.
struct Artifact {
    std::string id;
    std::string caseId;
    std::string deviceId;
    ArtifactType type = ArtifactType::InstalledApps;
    std::string sourceRef;
    std::string snapshotPath;
    std::string sha256;
    std::int64_t sizeBytes = 0;
    std::int64_t collectedAt = 0;
    std::string collectorName;
    std::string collectorVersion;
    std::string parserVersion;
    std::string acquisitionMethod;
    std::string payloadBytes;
    std::string recordHash;
};

struct HitArtifactLink {
    std::string hitId;
    std::string artifactId;
    HitRelation relation = HitRelation::Direct;
};

struct RuleHit {
    std::string id;
    std::string caseId;
    std::string deviceId;
    std::string hitType;
    std::string ruleId;
    std::string ruleName;
    std::string ruleVersion;
    std::string matchedValue;
    std::int64_t firstSeenAt = 0;
    std::int64_t lastSeenAt = 0;
    double confidence = 0.0;
    std::string verdict = "suspected";
    std::string detailJson;
    std::vector<HitArtifactLink> links;
};

struct PrecheckResult {
    std::string id;
    std::string caseId;
    std::string deviceId;
    std::string scanScope;
    std::string checkCode;
    std::string checkName;
    bool required = true;
    PrecheckStatus status = PrecheckStatus::Passed;
    std::string message;
    std::string detailJson;
    std::int64_t checkedAt = 0;
    std::string recordHash;
};

// One row of the per-case hash-linked audit trail. detailJson holds the
// exact canonical bytes that went into chainHash.
struct AuditEvent {
    std::string eventId;
    std::string caseId;
    std::string deviceId;
    std::string eventType;
    std::string action;
    AuditStatus status = AuditStatus::Started;
    std::string actor;
    std::string source;
    std::string detailJson;
    std::int64_t occurredAt = 0;
    std::string chainPrevHash;
    std::string chainHash;
};

struct ReportInfo {
    std::string reportId;
    std::string caseId;
    ReportType reportType = ReportType::InternalJson;
    std::string filePath;
    std::string sha256;
    std::int64_t generatedAt = 0;
    std::string generatorVersion;
    ReportStatus status = ReportStatus::Ready;
};

struct ManifestFileEntry {
    std::string path;
    std::string sha256;
    std::int64_t sizeBytes = 0;
    FileKind kind = FileKind::Artifact;
};

} // namespace inspector
