#include "evidence/forensic_exporter.hpp"

#include <algorithm>
#include <map>
#include <sstream>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include "archive/zip_archive.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/path_utils.hpp"

namespace inspector {

namespace {

constexpr const char *kSource = "forensicexport.ForensicExporter";

struct ArchivedFile {
    std::string sourcePath;
    ZipEntryDigest digest;
};

bool isCancelled(const ForensicExportOptions &options)
{
    return options.cancelFlag && options.cancelFlag->load();
}

std::string trimmed(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

void logWarning(const std::string &caseId, const std::string &warning)
{
    ILOG_WARN(QStringLiteral("ForensicExporter"),
              QStringLiteral("generateForensicZip"),
              QStringLiteral("export_warning"),
              QStringLiteral("forensic_export"),
              QStringLiteral("skip_file"),
              (nlohmann::json{{"caseId", caseId}, {"warning", warning}}));
}

// Archive path for a file: <prefix>/<path relative to root>, or
// <prefix>/<fallbackDir>/<basename> when the file is outside the root.
std::string archivePathFor(const std::string &prefix,
                           const std::string &root,
                           const std::string &filePath,
                           const std::string &fallbackDir,
                           const std::string &fallbackName)
{
    const std::string rel = relativeInside(root, filePath);
    if (!rel.empty()) {
        return prefix + "/" + rel;
    }
    std::string name = sanitizePathComponent(baseName(filePath));
    if (name == "_") {
        name = sanitizePathComponent(fallbackName);
    }
    if (fallbackDir.empty()) {
        return prefix + "/" + name;
    }
    return prefix + "/" + sanitizePathComponent(fallbackDir) + "/" + name;
}

std::string buildHashList(const std::vector<ManifestFileEntry> &files, std::int64_t generatedAt)
{
    std::ostringstream out;
    out << "# crypto-inspector forensic export hash list\n";
    out << "# generated_at=" << generatedAt << "\n";
    out << "# format: <sha256><two spaces><path>\n";
    for (const auto &file : files) {
        out << file.sha256 << "  " << file.path << "\n";
    }
    return out.str();
}

void sortByPath(std::vector<ManifestFileEntry> &files)
{
    std::sort(files.begin(), files.end(),
              [](const ManifestFileEntry &a, const ManifestFileEntry &b) { return a.path < b.path; });
}

} // namespace

void to_json(nlohmann::json &j, const ForensicExportResult &result)
{
    j = nlohmann::json{
        {"case_id", result.caseId},
        {"report_id", result.reportId},
        {"zip_path", result.zipPath},
        {"zip_sha256", result.zipSha256},
        {"generated_at", result.generatedAt},
        {"file_count", result.fileCount},
        {"cancelled", result.cancelled},
        {"warnings", result.warnings},
    };
}

ForensicExporter::ForensicExporter(CaseStore &store, AuditChain &audit)
    : m_store(store)
    , m_audit(audit)
{
}

ForensicExportResult ForensicExporter::generateForensicZip(const ForensicExportOptions &options)
{
    const std::string caseId = trimmed(options.caseId);
    if (caseId.empty()) {
        throw NotFoundError("case id is required");
    }
    const std::string operatorName = trimmed(options.operatorName).empty()
        ? std::string("system")
        : trimmed(options.operatorName);

    const auto overview = m_store.getCaseOverview(caseId);
    if (!overview) {
        throw NotFoundError("case " + caseId + " not found");
    }

    // Tables are read one after another; rows written meanwhile may or may
    // not be included.
    const std::vector<CaseDevice> devices = m_store.listCaseDevices(caseId);
    const std::vector<Artifact> artifacts = m_store.listArtifactsByCase(caseId);
    const std::vector<RuleHit> hits = m_store.listCaseHits(caseId);
    const std::vector<PrecheckResult> prechecks = m_store.listPrecheckResults(caseId);
    const std::vector<AuditEvent> audits = m_store.listAuditEvents(caseId, 0);
    const std::vector<ReportInfo> reports = m_store.listReportsByCase(caseId);

    std::string exportDir = trimmed(options.exportDir);
    if (exportDir.empty()) {
        AppConfig config = defaultConfig();
        rebaseOnDatabase(config, m_store.databasePath());
        exportDir = config.exportDir;
    }
    if (!QDir().mkpath(QString::fromStdString(exportDir))) {
        throw IOError("create export directory " + exportDir);
    }

    ForensicExportResult result;
    result.caseId = caseId;
    result.generatedAt = unixNowSeconds();

    const QDir dir(QString::fromStdString(exportDir));
    const std::string stem = sanitizePathComponent(caseId) + "_forensic_export_"
        + std::to_string(result.generatedAt);
    QString finalPath = QFileInfo(dir, QString::fromStdString(stem + ".zip")).absoluteFilePath();
    // Two exports of one case within a second must not replace each other.
    for (int n = 1; QFileInfo::exists(finalPath); ++n) {
        finalPath = QFileInfo(dir, QString::fromStdString(stem + "_" + std::to_string(n) + ".zip"))
                        .absoluteFilePath();
    }
    const QString partPath = finalPath + QStringLiteral(".part");

    ILOG_INFO(QStringLiteral("ForensicExporter"),
              QStringLiteral("generateForensicZip"),
              QStringLiteral("export_started"),
              QStringLiteral("forensic_export"),
              QStringLiteral("zip_stream"),
              (nlohmann::json{{"caseId", caseId},
                              {"artifacts", artifacts.size()},
                              {"reports", reports.size()},
                              {"audits", audits.size()},
                              {"zipPath", finalPath.toStdString()}}));

    ZipWriter writer(partPath);

    std::vector<ManifestFileEntry> files;
    std::map<std::string, ArchivedFile> archived;
    auto warn = [&result, &caseId](const std::string &warning) {
        logWarning(caseId, warning);
        result.warnings.push_back(warning);
    };

    // Adds sourcePath once and returns the archive path it is stored under.
    // Throws IOError when the file cannot be read and ArchiveWriteError when
    // the archive itself can no longer be written.
    auto archiveFile = [&](std::string zipPath, const std::string &sourcePath,
                           const std::string &uniqueTag, FileKind kind) -> std::string {
        const auto slash = zipPath.rfind('/');
        const std::string dirPart = zipPath.substr(0, slash + 1);
        const std::string filePart = zipPath.substr(slash + 1);
        const std::string tag = sanitizePathComponent(uniqueTag);
        for (int n = 1;; ++n) {
            const auto existing = archived.find(zipPath);
            if (existing == archived.end()) {
                break;
            }
            if (existing->second.sourcePath == sourcePath) {
                return zipPath;
            }
            zipPath = dirPart + tag + "_" + (n == 1 ? std::string() : std::to_string(n) + "_") + filePart;
        }

        const ZipEntryDigest digest = writer.addFile(zipPath, QString::fromStdString(sourcePath));
        archived[zipPath] = ArchivedFile{sourcePath, digest};

        ManifestFileEntry entry;
        entry.path = zipPath;
        entry.sha256 = digest.sha256;
        entry.sizeBytes = digest.sizeBytes;
        entry.kind = kind;
        files.push_back(entry);
        return zipPath;
    };

    try {
        nlohmann::json artifactEntries = nlohmann::json::array();
        nlohmann::json reportEntries = nlohmann::json::array();

        for (const auto &artifact : artifacts) {
            if (isCancelled(options)) {
                result.cancelled = true;
                break;
            }
            std::string zipPath;
            if (artifact.snapshotPath.empty()
                || !QFileInfo(QString::fromStdString(artifact.snapshotPath)).isFile()) {
                warn("artifact " + artifact.id + " snapshot missing: " + artifact.snapshotPath);
            } else {
                const std::string wanted = archivePathFor("evidence", options.evidenceRoot,
                                                          artifact.snapshotPath, artifact.deviceId,
                                                          artifact.id + ".json");
                try {
                    zipPath = archiveFile(wanted, artifact.snapshotPath, artifact.id, FileKind::Artifact);
                } catch (const ArchiveWriteError &) {
                    throw;
                } catch (const IOError &ex) {
                    warn("artifact " + artifact.id + " not archived: " + ex.what());
                }
            }
            artifactEntries.push_back(nlohmann::json{{"artifact", artifact}, {"zip_path", zipPath}});
        }

        for (const auto &report : reports) {
            if (result.cancelled || isCancelled(options)) {
                result.cancelled = true;
                break;
            }
            // Earlier exports are listed but never nested.
            if (report.reportType == ReportType::ForensicZip) {
                reportEntries.push_back(nlohmann::json{{"report", report}, {"zip_path", ""}});
                continue;
            }
            std::string zipPath;
            if (report.filePath.empty() || !QFileInfo(QString::fromStdString(report.filePath)).isFile()) {
                warn("report " + report.reportId + " file missing: " + report.filePath);
            } else {
                const std::string wanted = archivePathFor("reports", options.reportsRoot,
                                                          report.filePath, {}, report.reportId);
                try {
                    zipPath = archiveFile(wanted, report.filePath, report.reportId, FileKind::Report);
                } catch (const ArchiveWriteError &) {
                    throw;
                } catch (const IOError &ex) {
                    warn("report " + report.reportId + " not archived: " + ex.what());
                }
            }
            reportEntries.push_back(nlohmann::json{{"report", report}, {"zip_path", zipPath}});
        }

        for (const auto &rulePath : options.ruleFiles) {
            if (result.cancelled || isCancelled(options)) {
                result.cancelled = true;
                break;
            }
            if (trimmed(rulePath).empty()) {
                continue;
            }
            if (!QFileInfo(QString::fromStdString(rulePath)).isFile()) {
                warn("rule file missing: " + rulePath);
                continue;
            }
            try {
                archiveFile("rules/" + sanitizePathComponent(baseName(rulePath)), rulePath,
                            "rule", FileKind::Rule);
            } catch (const ArchiveWriteError &) {
                throw;
            } catch (const IOError &ex) {
                warn("rule file " + rulePath + " not archived: " + ex.what());
            }
        }

        if (result.cancelled) {
            writer.discard();
            warn("export cancelled before completion; no package was produced");
            m_audit.append(caseId, {}, "export", "forensic_zip", AuditStatus::Skipped,
                           operatorName, kSource,
                           nlohmann::json{{"reason", "cancelled"},
                                          {"files_archived", files.size()},
                                          {"warnings", result.warnings.size()}});
            ILOG_INFO(QStringLiteral("ForensicExporter"),
                      QStringLiteral("generateForensicZip"),
                      QStringLiteral("export_cancelled"),
                      QStringLiteral("forensic_export"),
                      QStringLiteral("cancel_flag"),
                      (nlohmann::json{{"caseId", caseId}}));
            return result;
        }

        sortByPath(files);

        const BuildInfo build = buildInfo();
        nlohmann::json manifest{
            {"schema", kForensicManifestSchema},
            {"generated_at", result.generatedAt},
            {"app", {{"version", build.version},
                     {"commit", build.commit},
                     {"build_time", build.buildTime}}},
            {"case", *overview},
            {"devices", devices},
            {"artifacts", artifactEntries},
            {"hits", hits},
            {"prechecks", prechecks},
            {"audits", audits},
            {"reports", reportEntries},
            {"files", files},
            {"warnings", result.warnings},
            {"note", trimmed(options.note)},
            {"stats", {{"device_count", devices.size()},
                       {"artifact_count", artifacts.size()},
                       {"hit_count", hits.size()},
                       {"precheck_count", prechecks.size()},
                       {"audit_count", audits.size()},
                       {"report_count", reports.size()},
                       {"file_count", files.size()}}},
            {"extra", {{"evidence_root", options.evidenceRoot},
                       {"operator", operatorName}}},
        };

        const std::string manifestBytes =
            manifest.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        const ZipEntryDigest manifestDigest = writer.addBytes(kManifestEntryName, manifestBytes);

        ManifestFileEntry manifestEntry;
        manifestEntry.path = kManifestEntryName;
        manifestEntry.sha256 = manifestDigest.sha256;
        manifestEntry.sizeBytes = manifestDigest.sizeBytes;
        manifestEntry.kind = FileKind::Manifest;
        files.push_back(manifestEntry);
        sortByPath(files);

        writer.addBytes(kHashListEntryName, buildHashList(files, result.generatedAt));
        writer.close();

        if (!QFile::rename(partPath, finalPath)) {
            throw ArchiveWriteError("rename " + partPath.toStdString() + " to " + finalPath.toStdString());
        }
    } catch (const InspectorError &ex) {
        writer.discard();
        ILOG_ERROR(QStringLiteral("ForensicExporter"),
                   QStringLiteral("generateForensicZip"),
                   QStringLiteral("export_failed"),
                   QStringLiteral("forensic_export"),
                   QStringLiteral("zip_stream"),
                   (nlohmann::json{{"caseId", caseId}, {"error", ex.what()}}));
        try {
            m_audit.append(caseId, {}, "export", "forensic_zip", AuditStatus::Failed,
                           operatorName, kSource, nlohmann::json{{"error", ex.what()}});
        } catch (const StorageError &auditError) {
            ILOG_ERROR(QStringLiteral("ForensicExporter"),
                       QStringLiteral("generateForensicZip"),
                       QStringLiteral("export_failure_not_audited"),
                       QStringLiteral("forensic_export"),
                       QStringLiteral("sqlite"),
                       (nlohmann::json{{"caseId", caseId}, {"error", auditError.what()}}));
        }
        throw;
    }

    result.zipPath = finalPath.toStdString();
    result.zipSha256 = sha256File(result.zipPath).sha256;
    result.fileCount = static_cast<int>(files.size()) + 1;

    ReportInfo report;
    report.caseId = caseId;
    report.reportType = ReportType::ForensicZip;
    report.filePath = result.zipPath;
    report.sha256 = result.zipSha256;
    report.generatedAt = result.generatedAt;
    report.generatorVersion = kForensicExportGenerator;
    report.status = ReportStatus::Ready;
    result.reportId = m_store.saveReport(report);

    m_audit.append(caseId, {}, "export", "forensic_zip", AuditStatus::Success,
                   operatorName, kSource,
                   nlohmann::json{{"report_id", result.reportId},
                                  {"zip_path", result.zipPath},
                                  {"zip_sha256", result.zipSha256},
                                  {"file_count", result.fileCount},
                                  {"warnings", result.warnings.size()}});

    ILOG_INFO(QStringLiteral("ForensicExporter"),
              QStringLiteral("generateForensicZip"),
              QStringLiteral("export_finished"),
              QStringLiteral("forensic_export"),
              QStringLiteral("zip_stream"),
              (nlohmann::json{{"caseId", caseId},
                              {"reportId", result.reportId},
                              {"zipSha256", result.zipSha256},
                              {"warnings", result.warnings.size()}}));
    return result;
}

} // namespace inspector
