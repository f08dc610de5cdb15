#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "evidence/chain_verifier.hpp"

namespace inspector {

enum class OfflineItemStatus {
    Ok,
    Missing,
    Mismatch,
    Unlisted,
    Error
};

std::string toOfflineItemStatusString(OfflineItemStatus status);

struct OfflineFileItem {
    std::string path;
    std::string expected;
    std::string actual;
    OfflineItemStatus status = OfflineItemStatus::Ok;
    std::string error;
};

struct OfflineVerifyReport {
    std::string zipPath;
    std::string caseId;
    std::string manifestSchema;
    int total = 0;
    int failed = 0;
    std::vector<OfflineFileItem> items;
    // Set when manifest.json was present and its audits were re-walked.
    std::optional<ChainReport> auditChain;

    bool ok() const { return failed == 0 && (!auditChain || auditChain->ok()); }
    std::vector<OfflineFileItem> diffs() const;
};

void to_json(nlohmann::json &j, const OfflineFileItem &item);
void to_json(nlohmann::json &j, const OfflineVerifyReport &report);

// Parses a hashes.sha256 document into path -> sha256. '#' comments and
// blank lines are skipped. Throws ArchiveFormatError on a malformed line or
// a path listed twice.
std::map<std::string, std::string> parseHashList(const std::string &text);

// OfflineVerifier checks an export package using nothing but the archive:
// every member is re-hashed against hashes.sha256 and the audit trail
// embedded in manifest.json is re-walked.
class OfflineVerifier {
public:
    // Throws ArchiveFormatError when the archive cannot be read, has no
    // hashes.sha256, or carries a manifest.json that is not valid JSON.
    OfflineVerifyReport verifyForensicZip(const std::string &zipPath) const;
};

} // namespace inspector
