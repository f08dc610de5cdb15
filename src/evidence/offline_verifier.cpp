#include "evidence/offline_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>

#include <QString>

#include "archive/zip_archive.hpp"
#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "evidence/forensic_exporter.hpp"

namespace inspector {

namespace {

std::vector<AuditEvent> parseManifestAudits(const nlohmann::json &manifest)
{
    std::vector<AuditEvent> events;
    if (!manifest.contains("audits") || manifest.at("audits").is_null()) {
        return events;
    }
    if (!manifest.at("audits").is_array()) {
        throw ArchiveFormatError("manifest.json audits is not an array");
    }
    try {
        for (const auto &row : manifest.at("audits")) {
            events.push_back(row.get<AuditEvent>());
        }
    } catch (const nlohmann::json::exception &ex) {
        throw ArchiveFormatError(std::string("manifest.json audits: ") + ex.what());
    } catch (const std::invalid_argument &ex) {
        throw ArchiveFormatError(std::string("manifest.json audits: ") + ex.what());
    }

    std::stable_sort(events.begin(), events.end(), [](const AuditEvent &a, const AuditEvent &b) {
        if (a.occurredAt != b.occurredAt) {
            return a.occurredAt < b.occurredAt;
        }
        return a.eventId < b.eventId;
    });
    return events;
}

} // namespace

std::string toOfflineItemStatusString(OfflineItemStatus status)
{
    switch (status) {
    case OfflineItemStatus::Ok:
        return "ok";
    case OfflineItemStatus::Missing:
        return "missing";
    case OfflineItemStatus::Mismatch:
        return "mismatch";
    case OfflineItemStatus::Unlisted:
        return "unlisted";
    case OfflineItemStatus::Error:
        return "error";
    }
    return "error";
}

std::vector<OfflineFileItem> OfflineVerifyReport::diffs() const
{
    std::vector<OfflineFileItem> out;
    std::copy_if(items.begin(), items.end(), std::back_inserter(out),
                 [](const OfflineFileItem &item) { return item.status != OfflineItemStatus::Ok; });
    return out;
}

void to_json(nlohmann::json &j, const OfflineFileItem &item)
{
    j = nlohmann::json{
        {"path", item.path},
        {"expected", item.expected},
        {"actual", item.actual},
        {"status", toOfflineItemStatusString(item.status)},
        {"error", item.error},
    };
}

void to_json(nlohmann::json &j, const OfflineVerifyReport &report)
{
    j = nlohmann::json{
        {"zip_path", report.zipPath},
        {"case_id", report.caseId},
        {"manifest_schema", report.manifestSchema},
        {"ok", report.ok()},
        {"total", report.total},
        {"failed", report.failed},
        {"diffs", report.diffs()},
        {"items", report.items},
    };
    if (report.auditChain) {
        j["audit_chain"] = *report.auditChain;
    } else {
        j["audit_chain"] = nullptr;
    }
}

std::map<std::string, std::string> parseHashList(const std::string &text)
{
    std::map<std::string, std::string> listed;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }
        // "<64 hex><space><space or '*'><path>", as written by sha256sum.
        if (line.size() < 67 || line[64] != ' ' || (line[65] != ' ' && line[65] != '*')) {
            throw ArchiveFormatError("hashes.sha256 line " + std::to_string(lineNo) + " is malformed");
        }
        std::string digest = line.substr(0, 64);
        std::transform(digest.begin(), digest.end(), digest.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!isSha256Hex(digest)) {
            throw ArchiveFormatError("hashes.sha256 line " + std::to_string(lineNo)
                                     + " has an invalid digest");
        }
        const std::string path = line.substr(66);
        if (!listed.emplace(path, digest).second) {
            throw ArchiveFormatError("hashes.sha256 lists " + path + " more than once");
        }
    }
    return listed;
}

OfflineVerifyReport OfflineVerifier::verifyForensicZip(const std::string &zipPath) const
{
    OfflineVerifyReport report;
    report.zipPath = zipPath;

    ZipReader reader(QString::fromStdString(zipPath));

    const ZipEntryInfo *hashList = reader.find(kHashListEntryName);
    if (!hashList) {
        throw ArchiveFormatError(zipPath + " has no " + kHashListEntryName);
    }
    const std::map<std::string, std::string> listed = parseHashList(reader.readAll(*hashList));

    std::set<std::string> seen;
    for (const auto &entry : reader.entries()) {
        if (entry.name == kHashListEntryName || (!entry.name.empty() && entry.name.back() == '/')) {
            continue;
        }
        seen.insert(entry.name);

        OfflineFileItem item;
        item.path = entry.name;
        const auto expected = listed.find(entry.name);
        if (expected != listed.end()) {
            item.expected = expected->second;
        }

        try {
            Sha256Accumulator digest;
            reader.readEntry(entry, [&digest](const char *data, std::int64_t length) {
                digest.addData(data, length);
            });
            item.actual = digest.hexDigest();
        } catch (const ArchiveFormatError &ex) {
            item.status = OfflineItemStatus::Error;
            item.error = ex.what();
        }

        if (item.status != OfflineItemStatus::Error) {
            if (expected == listed.end()) {
                item.status = OfflineItemStatus::Unlisted;
                item.error = "not listed in hashes.sha256";
            } else if (item.actual != item.expected) {
                item.status = OfflineItemStatus::Mismatch;
                item.error = "sha256 mismatch";
            }
        }
        report.items.push_back(std::move(item));
    }

    for (const auto &[path, digest] : listed) {
        if (seen.count(path) == 0) {
            OfflineFileItem item;
            item.path = path;
            item.expected = digest;
            item.status = OfflineItemStatus::Missing;
            item.error = "listed in hashes.sha256 but absent from archive";
            report.items.push_back(std::move(item));
        }
    }

    std::sort(report.items.begin(), report.items.end(),
              [](const OfflineFileItem &a, const OfflineFileItem &b) { return a.path < b.path; });
    report.total = static_cast<int>(report.items.size());
    for (const auto &item : report.items) {
        if (item.status != OfflineItemStatus::Ok) {
            ++report.failed;
            ILOG_ERROR(QStringLiteral("OfflineVerifier"),
                       QStringLiteral("verifyForensicZip"),
                       QStringLiteral("package_integrity_failure"),
                       QStringLiteral("verify_forensic_zip"),
                       QStringLiteral("sha256_recompute"),
                       (nlohmann::json{{"zipPath", zipPath},
                                       {"path", item.path},
                                       {"status", toOfflineItemStatusString(item.status)}}));
        }
    }

    if (const ZipEntryInfo *manifestEntry = reader.find(kManifestEntryName)) {
        std::string manifestBytes;
        bool readable = true;
        try {
            manifestBytes = reader.readAll(*manifestEntry);
        } catch (const ArchiveFormatError &) {
            // Reported as an item error above; the chain cannot be re-walked.
            readable = false;
        }
        if (readable) {
            nlohmann::json manifest;
            try {
                manifest = nlohmann::json::parse(manifestBytes);
            } catch (const nlohmann::json::parse_error &ex) {
                throw ArchiveFormatError(std::string("manifest.json is not valid JSON: ") + ex.what());
            }
            if (!manifest.is_object()) {
                throw ArchiveFormatError("manifest.json is not a JSON object");
            }
            try {
                report.manifestSchema = manifest.value("schema", "");
                if (manifest.contains("case") && manifest.at("case").is_object()) {
                    report.caseId = manifest.at("case").value("case_id", "");
                }
            } catch (const nlohmann::json::exception &ex) {
                throw ArchiveFormatError(std::string("manifest.json has a malformed field: ") + ex.what());
            }
            report.auditChain = walkAuditChain(report.caseId, parseManifestAudits(manifest));
        }
    }

    ILOG_INFO(QStringLiteral("OfflineVerifier"),
              QStringLiteral("verifyForensicZip"),
              QStringLiteral("package_verified"),
              QStringLiteral("verify_forensic_zip"),
              QStringLiteral("sha256_recompute"),
              (nlohmann::json{{"zipPath", zipPath},
                              {"total", report.total},
                              {"failed", report.failed},
                              {"auditChainOk", !report.auditChain || report.auditChain->ok()},
                              {"ok", report.ok()}}));
    return report;
}

} // namespace inspector
