#include "evidence/verification_service.hpp"

#include <QFileInfo>
#include <QString>

#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "common/logging.hpp"

namespace inspector {

namespace {

constexpr const char *kSource = "verification.VerificationService";

ArtifactCheckItem checkArtifact(const Artifact &artifact)
{
    ArtifactCheckItem item;
    item.artifactId = artifact.id;
    item.snapshotPath = artifact.snapshotPath;
    item.expectedSha256 = artifact.sha256;
    item.expectedSize = artifact.sizeBytes;

    const QFileInfo info(QString::fromStdString(artifact.snapshotPath));
    if (artifact.snapshotPath.empty() || !info.exists()) {
        item.status = ArtifactCheckStatus::Missing;
        item.error = "snapshot file not found";
        return item;
    }

    try {
        const FileDigest digest = sha256File(artifact.snapshotPath);
        item.actualSha256 = digest.sha256;
        item.actualSize = digest.sizeBytes;
    } catch (const IOError &ex) {
        item.status = ArtifactCheckStatus::Error;
        item.error = ex.what();
        return item;
    }

    if (item.actualSha256 != item.expectedSha256 || item.actualSize != item.expectedSize) {
        item.status = ArtifactCheckStatus::Mismatch;
        item.error = item.actualSha256 != item.expectedSha256 ? "sha256 mismatch" : "size mismatch";
    }
    return item;
}

} // namespace

std::string toArtifactCheckStatusString(ArtifactCheckStatus status)
{
    switch (status) {
    case ArtifactCheckStatus::Ok:
        return "ok";
    case ArtifactCheckStatus::Missing:
        return "missing";
    case ArtifactCheckStatus::Mismatch:
        return "mismatch";
    case ArtifactCheckStatus::Error:
        return "error";
    }
    return "error";
}

void raiseIfFailed(const ArtifactVerifyReport &report)
{
    for (const auto &item : report.items) {
        if (item.status != ArtifactCheckStatus::Ok) {
            throw IntegrityError("artifact " + item.artifactId + " "
                                 + toArtifactCheckStatusString(item.status) + ": " + item.error);
        }
    }
}

void to_json(nlohmann::json &j, const ArtifactCheckItem &item)
{
    j = nlohmann::json{
        {"artifact_id", item.artifactId},
        {"snapshot_path", item.snapshotPath},
        {"status", toArtifactCheckStatusString(item.status)},
        {"expected_sha256", item.expectedSha256},
        {"actual_sha256", item.actualSha256},
        {"expected_size", item.expectedSize},
        {"actual_size", item.actualSize},
        {"error", item.error},
    };
}

void to_json(nlohmann::json &j, const ArtifactVerifyReport &report)
{
    j = nlohmann::json{
        {"case_id", report.caseId},
        {"artifact_id", report.artifactId},
        {"ok", report.ok()},
        {"total", report.total()},
        {"ok_count", report.okCount},
        {"mismatch_count", report.mismatchCount},
        {"missing_count", report.missingCount},
        {"error_count", report.errorCount},
        {"items", report.items},
    };
}

VerificationService::VerificationService(CaseStore &store, AuditChain &audit, std::string actor)
    : m_store(store)
    , m_audit(audit)
    , m_actor(std::move(actor))
{
}

ArtifactVerifyReport VerificationService::verifyArtifacts(const std::string &caseId,
                                                          const std::string &artifactId)
{
    ArtifactVerifyReport report;
    report.caseId = caseId;
    report.artifactId = artifactId;

    std::vector<Artifact> artifacts;
    if (!artifactId.empty()) {
        const auto artifact = m_store.getArtifact(artifactId);
        if (!artifact || artifact->caseId != caseId) {
            throw NotFoundError("artifact " + artifactId + " not found in case " + caseId);
        }
        artifacts.push_back(*artifact);
    } else {
        artifacts = m_store.listArtifactsByCase(caseId);
    }

    for (const auto &artifact : artifacts) {
        ArtifactCheckItem item = checkArtifact(artifact);
        switch (item.status) {
        case ArtifactCheckStatus::Ok:
            ++report.okCount;
            break;
        case ArtifactCheckStatus::Missing:
            ++report.missingCount;
            break;
        case ArtifactCheckStatus::Mismatch:
            ++report.mismatchCount;
            break;
        case ArtifactCheckStatus::Error:
            ++report.errorCount;
            break;
        }
        if (item.status != ArtifactCheckStatus::Ok) {
            ILOG_ERROR(QStringLiteral("VerificationService"),
                       QStringLiteral("verifyArtifacts"),
                       QStringLiteral("artifact_integrity_failure"),
                       QStringLiteral("verify_artifacts"),
                       QStringLiteral("sha256_recompute"),
                       (nlohmann::json{{"caseId", caseId},
                                       {"artifactId", item.artifactId},
                                       {"status", toArtifactCheckStatusString(item.status)},
                                       {"error", item.error}}));
        }
        report.items.push_back(std::move(item));
    }

    m_audit.append(caseId, {}, "verify", "artifact_hash",
                   report.ok() ? AuditStatus::Success : AuditStatus::Failed,
                   m_actor, kSource,
                   nlohmann::json{{"artifact_id", artifactId},
                                  {"total", report.total()},
                                  {"ok", report.okCount},
                                  {"mismatch", report.mismatchCount},
                                  {"missing", report.missingCount},
                                  {"error", report.errorCount}});

    ILOG_INFO(QStringLiteral("VerificationService"),
              QStringLiteral("verifyArtifacts"),
              QStringLiteral("artifacts_verified"),
              QStringLiteral("verify_artifacts"),
              QStringLiteral("sha256_recompute"),
              (nlohmann::json{{"caseId", caseId},
                              {"total", report.total()},
                              {"ok", report.ok()}}));
    return report;
}

ChainReport VerificationService::verifyAuditChain(const std::string &caseId, int limit)
{
    const int effectiveLimit = limit > 0 ? limit : kDefaultAuditVerifyLimit;
    const std::vector<AuditEvent> events = m_store.listAuditEvents(caseId, effectiveLimit);
    ChainReport report = walkAuditChain(caseId, events);

    for (const auto &failure : report.failures) {
        ILOG_ERROR(QStringLiteral("VerificationService"),
                   QStringLiteral("verifyAuditChain"),
                   QStringLiteral("audit_chain_failure"),
                   QStringLiteral("verify_audits"),
                   QStringLiteral("chain_walk"),
                   (nlohmann::json{{"caseId", caseId},
                                   {"index", failure.index},
                                   {"eventId", failure.eventId},
                                   {"message", failure.message}}));
    }

    m_audit.append(caseId, {}, "verify", "audit_chain",
                   report.ok() ? AuditStatus::Success : AuditStatus::Failed,
                   m_actor, kSource,
                   nlohmann::json{{"limit", effectiveLimit},
                                  {"total", report.total},
                                  {"failed", report.failed},
                                  {"prev_hash_failed", report.prevHashFailed},
                                  {"chain_hash_failed", report.chainHashFailed},
                                  {"last_chain_hash", report.lastChainHash}});

    ILOG_INFO(QStringLiteral("VerificationService"),
              QStringLiteral("verifyAuditChain"),
              QStringLiteral("audit_chain_verified"),
              QStringLiteral("verify_audits"),
              QStringLiteral("chain_walk"),
              (nlohmann::json{{"caseId", caseId},
                              {"total", report.total},
                              {"failed", report.failed}}));
    return report;
}

} // namespace inspector
