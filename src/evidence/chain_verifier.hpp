#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace inspector {

struct ChainFailure {
    int index = 0;
    std::string eventId;
    std::int64_t occurredAt = 0;
    std::string eventType;
    std::string action;
    std::string status;
    bool prevHashMismatch = false;
    bool chainHashMismatch = false;
    std::string expectedPrevHash;
    std::string actualPrevHash;
    std::string expectedChainHash;
    std::string actualChainHash;
    std::string message;
};

struct ChainReport {
    std::string caseId;
    int total = 0;
    int failed = 0;
    int prevHashFailed = 0;
    int chainHashFailed = 0;
    std::string lastChainHash;
    std::vector<ChainFailure> failures;

    bool ok() const { return failed == 0; }
};

// Walks events already ordered by (occurred_at, event_id).
//
// Two independent checks per event:
//  - prev: chain_prev_hash equals the previous event's stored chain_hash
//    (empty for the first event);
//  - hash: chain_hash equals the recomputation from the event's own stored
//    chain_prev_hash and fields.
// The expected prev hash is re-synced to each event's stored chain_hash, so a
// single damaged record is reported where it is instead of at every later
// index.
ChainReport walkAuditChain(const std::string &caseId, const std::vector<AuditEvent> &events);

// Throws ChainTamperError when any chain_hash failed, otherwise
// ChainDiscontinuityError when any prev hash failed.
void raiseIfFailed(const ChainReport &report);

void to_json(nlohmann::json &j, const ChainFailure &failure);
void to_json(nlohmann::json &j, const ChainReport &report);

} // namespace inspector
