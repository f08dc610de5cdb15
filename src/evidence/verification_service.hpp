#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "evidence/audit_chain.hpp"
#include "evidence/chain_verifier.hpp"
#include "store/case_store.hpp"

namespace inspector {

enum class ArtifactCheckStatus {
    Ok,
    Missing,
    Mismatch,
    Error
};

struct ArtifactCheckItem {
    std::string artifactId;
    std::string snapshotPath;
    ArtifactCheckStatus status = ArtifactCheckStatus::Ok;
    std::string expectedSha256;
    std::string actualSha256;
    std::int64_t expectedSize = 0;
    std::int64_t actualSize = 0;
    std::string error;
};

struct ArtifactVerifyReport {
    std::string caseId;
    std::string artifactId;
    int okCount = 0;
    int mismatchCount = 0;
    int missingCount = 0;
    int errorCount = 0;
    std::vector<ArtifactCheckItem> items;

    int total() const { return static_cast<int>(items.size()); }
    bool ok() const { return mismatchCount == 0 && missingCount == 0 && errorCount == 0; }
};

// Throws IntegrityError naming the first failing artifact when !report.ok().
void raiseIfFailed(const ArtifactVerifyReport &report);

std::string toArtifactCheckStatusString(ArtifactCheckStatus status);

void to_json(nlohmann::json &j, const ArtifactCheckItem &item);
void to_json(nlohmann::json &j, const ArtifactVerifyReport &report);

constexpr int kDefaultAuditVerifyLimit = 5000;

// VerificationService re-derives artifact hashes from disk and re-walks the
// audit chain. Neither check mutates evidence; each call appends exactly one
// "verify" audit event summarizing its outcome.
class VerificationService {
public:
    VerificationService(CaseStore &store, AuditChain &audit, std::string actor);

    // With a non-empty artifactId only that artifact is checked; an unknown
    // id throws NotFoundError.
    ArtifactVerifyReport verifyArtifacts(const std::string &caseId,
                                         const std::string &artifactId = {});

    ChainReport verifyAuditChain(const std::string &caseId,
                                 int limit = kDefaultAuditVerifyLimit);

private:
    CaseStore &m_store;
    AuditChain &m_audit;
    std::string m_actor;
};

} // namespace inspector
