#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "store/case_store.hpp"

namespace inspector {

// Identity stamped on every artifact a collector produces.
struct CollectorIdentity {
    std::string name;
    std::string version;
    std::string parserVersion;
};

// ArtifactStore writes immutable evidence snapshots under
// <evidence_root>/<case_id>/<device_id>/ and records their metadata.
// Artifacts are never updated or removed.
class ArtifactStore {
public:
    ArtifactStore(CaseStore &store, std::string evidenceRoot, CollectorIdentity collector);

    // Serializes payload as 2-space indented JSON, writes it to a new file,
    // hashes the written bytes and inserts the metadata row.
    // Throws IOError when the directory or file cannot be written.
    Artifact put(const std::string &caseId,
                 const std::string &deviceId,
                 ArtifactType type,
                 const std::string &sourceRef,
                 const std::string &acquisitionMethod,
                 const nlohmann::json &payload);

    const std::string &evidenceRoot() const;

    static std::string computeRecordHash(const Artifact &artifact);

private:
    CaseStore &m_store;
    std::string m_evidenceRoot;
    CollectorIdentity m_collector;
};

} // namespace inspector
