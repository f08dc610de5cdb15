#include "evidence/chain_verifier.hpp"

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "evidence/audit_chain.hpp"

namespace inspector {

ChainReport walkAuditChain(const std::string &caseId, const std::vector<AuditEvent> &events)
{
    ChainReport report;
    report.caseId = caseId;
    report.total = static_cast<int>(events.size());

    std::string expectedPrev;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const AuditEvent &event = events[i];
        const bool prevMismatch = event.chainPrevHash != expectedPrev;
        const std::string recomputed = AuditChain::computeChainHash(event);
        const bool hashMismatch = recomputed != event.chainHash;

        if (prevMismatch || hashMismatch) {
            ChainFailure failure;
            failure.index = static_cast<int>(i);
            failure.eventId = event.eventId;
            failure.occurredAt = event.occurredAt;
            failure.eventType = event.eventType;
            failure.action = event.action;
            failure.status = toAuditStatusString(event.status);
            failure.prevHashMismatch = prevMismatch;
            failure.chainHashMismatch = hashMismatch;
            failure.expectedPrevHash = expectedPrev;
            failure.actualPrevHash = event.chainPrevHash;
            failure.expectedChainHash = recomputed;
            failure.actualChainHash = event.chainHash;
            if (prevMismatch && hashMismatch) {
                failure.message = "chain_prev_hash and chain_hash mismatch";
            } else if (prevMismatch) {
                failure.message = "chain_prev_hash mismatch";
            } else {
                failure.message = "chain_hash mismatch";
            }

            ++report.failed;
            if (prevMismatch) {
                ++report.prevHashFailed;
            }
            if (hashMismatch) {
                ++report.chainHashFailed;
            }
            report.failures.push_back(std::move(failure));
        }

        expectedPrev = event.chainHash;
    }

    if (!events.empty()) {
        report.lastChainHash = events.back().chainHash;
    }
    return report;
}

void raiseIfFailed(const ChainReport &report)
{
    if (report.ok()) {
        return;
    }
    const ChainFailure &first = report.failures.front();
    const std::string where = "case " + report.caseId + " event " + first.eventId
        + " (index " + std::to_string(first.index) + ")";
    if (report.chainHashFailed > 0) {
        throw ChainTamperError("audit chain tampered: " + std::to_string(report.chainHashFailed)
                               + " chain_hash failure(s), first at " + where);
    }
    throw ChainDiscontinuityError("audit chain broken: " + std::to_string(report.prevHashFailed)
                                  + " chain_prev_hash failure(s), first at " + where);
}

void to_json(nlohmann::json &j, const ChainFailure &failure)
{
    j = nlohmann::json{
        {"index", failure.index},
        {"event_id", failure.eventId},
        {"occurred_at", failure.occurredAt},
        {"event_type", failure.eventType},
        {"action", failure.action},
        {"status", failure.status},
        {"prev_hash_mismatch", failure.prevHashMismatch},
        {"chain_hash_mismatch", failure.chainHashMismatch},
        {"expected_prev_hash", failure.expectedPrevHash},
        {"actual_prev_hash", failure.actualPrevHash},
        {"expected_chain_hash", failure.expectedChainHash},
        {"actual_chain_hash", failure.actualChainHash},
        {"message", failure.message},
    };
}

void to_json(nlohmann::json &j, const ChainReport &report)
{
    j = nlohmann::json{
        {"case_id", report.caseId},
        {"ok", report.ok()},
        {"total", report.total},
        {"failed", report.failed},
        {"prev_hash_failed", report.prevHashFailed},
        {"chain_hash_failed", report.chainHashFailed},
        {"last_chain_hash", report.lastChainHash},
        {"failures", report.failures},
    };
}

} // namespace inspector
