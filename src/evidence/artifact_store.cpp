#include "evidence/artifact_store.hpp"

#include <QDir>
#include <QFile>
#include <QString>

#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "common/id_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/path_utils.hpp"

namespace inspector {

namespace {

constexpr int kMaxNameAttempts = 1000;

// Opens a snapshot file that did not exist before. A collision inside the
// same second gets a numeric suffix instead of replacing earlier evidence.
QString createSnapshotFile(QFile &file, const QString &dir, const std::string &stem)
{
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        std::string name = stem;
        if (attempt > 0) {
            name += "_" + std::to_string(attempt);
        }
        const QString path = QDir(dir).filePath(QString::fromStdString(name + ".json"));
        file.setFileName(path);
        if (file.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
            return path;
        }
        if (!QFile::exists(path)) {
            throw IOError("write snapshot " + path.toStdString() + ": "
                          + file.errorString().toStdString());
        }
    }
    throw IOError("write snapshot: no free file name for " + stem);
}

} // namespace

ArtifactStore::ArtifactStore(CaseStore &store, std::string evidenceRoot, CollectorIdentity collector)
    : m_store(store)
    , m_evidenceRoot(std::move(evidenceRoot))
    , m_collector(std::move(collector))
{
}

const std::string &ArtifactStore::evidenceRoot() const
{
    return m_evidenceRoot;
}

std::string ArtifactStore::computeRecordHash(const Artifact &artifact)
{
    return sha256Text({artifact.id,
                       artifact.caseId,
                       artifact.deviceId,
                       toArtifactTypeString(artifact.type),
                       artifact.sourceRef,
                       artifact.snapshotPath,
                       artifact.sha256,
                       std::to_string(artifact.sizeBytes),
                       std::to_string(artifact.collectedAt),
                       artifact.collectorName,
                       artifact.collectorVersion,
                       artifact.payloadBytes});
}

Artifact ArtifactStore::put(const std::string &caseId,
                            const std::string &deviceId,
                            ArtifactType type,
                            const std::string &sourceRef,
                            const std::string &acquisitionMethod,
                            const nlohmann::json &payload)
{
    Artifact artifact;
    artifact.id = newId("art");
    artifact.caseId = caseId;
    artifact.deviceId = deviceId;
    artifact.type = type;
    artifact.sourceRef = sourceRef;
    artifact.collectedAt = unixNowSeconds();
    artifact.collectorName = m_collector.name;
    artifact.collectorVersion = m_collector.version;
    artifact.parserVersion = m_collector.parserVersion;
    artifact.acquisitionMethod = acquisitionMethod;
    artifact.payloadBytes = payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    const QString dir = QDir(QString::fromStdString(m_evidenceRoot))
                            .filePath(QString::fromStdString(sanitizePathComponent(caseId) + "/"
                                                             + sanitizePathComponent(deviceId)));
    if (!QDir().mkpath(dir)) {
        throw IOError("create evidence directory " + dir.toStdString());
    }

    const std::string stem = sanitizePathComponent(toArtifactTypeString(type) + "_" + sourceRef
                                                   + "_" + std::to_string(artifact.collectedAt));
    QFile file;
    const QString path = createSnapshotFile(file, dir, stem);
    const QByteArray bytes = QByteArray::fromStdString(artifact.payloadBytes);
    const qint64 written = file.write(bytes);
    const bool flushed = file.flush();
    file.close();
    if (written != bytes.size() || !flushed) {
        QFile::remove(path);
        throw IOError("write snapshot " + path.toStdString() + ": " + file.errorString().toStdString());
    }

    artifact.snapshotPath = path.toStdString();
    artifact.sha256 = sha256Bytes(artifact.payloadBytes);
    artifact.sizeBytes = static_cast<std::int64_t>(bytes.size());
    artifact.recordHash = computeRecordHash(artifact);

    try {
        m_store.ensureCase(caseId);
        m_store.insertArtifact(artifact);
    } catch (const StorageError &ex) {
        // No row references the file, so it is not evidence yet.
        QFile::remove(path);
        ILOG_ERROR(QStringLiteral("ArtifactStore"),
                   QStringLiteral("put"),
                   QStringLiteral("artifact_insert_failed"),
                   QStringLiteral("collector_put"),
                   QStringLiteral("sqlite"),
                   (nlohmann::json{{"artifactId", artifact.id},
                                   {"caseId", caseId},
                                   {"error", ex.what()}}));
        throw;
    }

    ILOG_INFO(QStringLiteral("ArtifactStore"),
              QStringLiteral("put"),
              QStringLiteral("artifact_stored"),
              QStringLiteral("collector_put"),
              QStringLiteral("snapshot_write"),
              (nlohmann::json{{"artifactId", artifact.id},
                              {"caseId", caseId},
                              {"deviceId", deviceId},
                              {"type", toArtifactTypeString(type)},
                              {"sizeBytes", artifact.sizeBytes}}));
    return artifact;
}

} // namespace inspector
