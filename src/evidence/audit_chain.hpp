#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "store/case_store.hpp"

namespace inspector {

// AuditChain appends hash-linked events to a case's audit trail. Each event's
// chain_hash covers the previous event's chain_hash, so any edit, removal or
// reordering of history is detectable by re-walking the chain.
//
// Appends on the same case are serialized; different cases only contend on
// the shared database connection.
class AuditChain {
public:
    explicit AuditChain(CaseStore &store);

    AuditEvent append(const std::string &caseId,
                      const std::string &deviceId,
                      const std::string &eventType,
                      const std::string &action,
                      AuditStatus status,
                      const std::string &actor,
                      const std::string &source,
                      const nlohmann::json &detail = nlohmann::json::object());

    // Recomputes chain_hash from the event's own chainPrevHash and fields.
    static std::string computeChainHash(const AuditEvent &event);

    // Cases with an append in progress.
    std::size_t lockedCaseCount() const;

private:
    struct CaseLock {
        std::mutex mutex;
        int users = 0;
    };
    class ScopedCaseLock;

    CaseStore &m_store;
    mutable std::mutex m_locksMutex;
    // Entries live only while an append holds or waits for them.
    std::map<std::string, std::unique_ptr<CaseLock>> m_caseLocks;
};

} // namespace inspector
