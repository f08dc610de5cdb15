#include "evidence/audit_chain.hpp"

#include <algorithm>

#include "common/hash_utils.hpp"
#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace inspector {

AuditChain::AuditChain(CaseStore &store)
    : m_store(store)
{
}

std::string AuditChain::computeChainHash(const AuditEvent &event)
{
    return sha256Text({event.chainPrevHash,
                       event.caseId,
                       event.eventType,
                       event.action,
                       toAuditStatusString(event.status),
                       std::to_string(event.occurredAt),
                       event.detailJson});
}

class AuditChain::ScopedCaseLock {
public:
    ScopedCaseLock(AuditChain &chain, const std::string &caseId)
        : m_chain(chain)
        , m_caseId(caseId)
    {
        {
            std::lock_guard<std::mutex> lock(m_chain.m_locksMutex);
            auto &slot = m_chain.m_caseLocks[caseId];
            if (!slot) {
                slot = std::make_unique<CaseLock>();
            }
            ++slot->users;
            m_lock = slot.get();
        }
        m_lock->mutex.lock();
    }

    ~ScopedCaseLock()
    {
        m_lock->mutex.unlock();
        std::lock_guard<std::mutex> lock(m_chain.m_locksMutex);
        if (--m_lock->users == 0) {
            m_chain.m_caseLocks.erase(m_caseId);
        }
    }

    ScopedCaseLock(const ScopedCaseLock &) = delete;
    ScopedCaseLock &operator=(const ScopedCaseLock &) = delete;

private:
    AuditChain &m_chain;
    std::string m_caseId;
    CaseLock *m_lock = nullptr;
};

std::size_t AuditChain::lockedCaseCount() const
{
    std::lock_guard<std::mutex> lock(m_locksMutex);
    return m_caseLocks.size();
}

AuditEvent AuditChain::append(const std::string &caseId,
                              const std::string &deviceId,
                              const std::string &eventType,
                              const std::string &action,
                              AuditStatus status,
                              const std::string &actor,
                              const std::string &source,
                              const nlohmann::json &detail)
{
    AuditEvent draft;
    draft.caseId = caseId;
    draft.deviceId = deviceId;
    draft.eventType = eventType;
    draft.action = action;
    draft.status = status;
    draft.actor = actor;
    draft.source = source;
    // Hashed and stored as these exact bytes; never re-serialized.
    draft.detailJson = detail.is_null()
        ? std::string("{}")
        : detail.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    ScopedCaseLock caseLock(*this, caseId);
    m_store.ensureCase(caseId);

    const AuditEvent event = m_store.appendAuditEvent(
        draft,
        [](AuditEvent &row, const std::optional<AuditTail> &tail) {
            // A clock step backwards must not sort the new row before the tail.
            row.occurredAt = unixNowSeconds();
            if (tail) {
                row.occurredAt = std::max(row.occurredAt, tail->occurredAt);
                row.chainPrevHash = tail->chainHash;
                row.eventId = newIdAfter("evt", tail->eventId);
            } else {
                row.chainPrevHash.clear();
                row.eventId = newId("evt");
            }
            row.chainHash = computeChainHash(row);
        });

    ILOG_DEBUG(QStringLiteral("AuditChain"),
               QStringLiteral("append"),
               QStringLiteral("audit_appended"),
               QString::fromStdString(eventType),
               QString::fromStdString(action),
               (nlohmann::json{{"caseId", caseId},
                               {"eventId", event.eventId},
                               {"status", toAuditStatusString(status)},
                               {"chainHash", event.chainHash}}));
    return event;
}

} // namespace inspector
