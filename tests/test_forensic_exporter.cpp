#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <atomic>
#include <csignal>
#include <map>
#include <set>
#include <sstream>

#include <sys/resource.h>

#include "archive/zip_archive.hpp"
#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "evidence/artifact_store.hpp"
#include "evidence/audit_chain.hpp"
#include "evidence/forensic_exporter.hpp"
#include "store/case_store.hpp"

class ForensicExporterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testPackageIsComplete();
    void testHashListCoversEveryEntry();
    void testExportIsRecordedAsReportAndAudit();
    void testMissingSnapshotBecomesWarning();
    void testSameNamedRuleFilesAreAllArchived();
    void testArchiveWriteFailureAbortsExport();
    void testEarlierExportsAreNotNested();
    void testOutsideRootUsesDeviceFallback();
    void testCancelledExportLeavesNothing();
    void testUnknownCaseThrows();
    void testDefaultExportDirFollowsDatabase();

private:
    struct Fixture {
        explicit Fixture(const QString &root)
            : dir(root)
            , store(QDir(root).filePath(QStringLiteral("inspector.db")).toStdString())
            , audit(store)
            , artifacts(store, QDir(root).filePath(QStringLiteral("evidence")).toStdString(),
                        {"host-collector", "1.0.0", ""})
            , exporter(store, audit)
        {
        }

        inspector::ForensicExportOptions options() const
        {
            inspector::ForensicExportOptions options;
            options.caseId = "C1";
            options.evidenceRoot = dir.filePath(QStringLiteral("evidence")).toStdString();
            options.reportsRoot = dir.filePath(QStringLiteral("reports")).toStdString();
            options.exportDir = dir.filePath(QStringLiteral("exports")).toStdString();
            options.operatorName = "examiner";
            return options;
        }

        QDir dir;
        inspector::CaseStore store;
        inspector::AuditChain audit;
        inspector::ArtifactStore artifacts;
        inspector::ForensicExporter exporter;
    };

    static QString writeFile(const QString &path, const QByteArray &content);
    static std::map<std::string, std::string> parseHashLines(const std::string &text);
    static void seedCase(Fixture &fx);

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_runDir;
    int m_counter = 0;
};

void ForensicExporterTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ForensicExporterTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ForensicExporterTests::init()
{
    m_runDir = m_tempDir.filePath(QStringLiteral("run%1").arg(++m_counter));
    QVERIFY(QDir().mkpath(m_runDir));
}

QString ForensicExporterTests::writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

std::map<std::string, std::string> ForensicExporterTests::parseHashLines(const std::string &text)
{
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        out[line.substr(66)] = line.substr(0, 64);
    }
    return out;
}

void ForensicExporterTests::seedCase(Fixture &fx)
{
    fx.store.ensureCase("C1", "2024-017", "Wallet trace");
    inspector::CaseDevice device;
    device.deviceId = "dev-1";
    device.caseId = "C1";
    device.osType = "windows";
    device.deviceName = "WS-01";
    device.authorized = true;
    fx.store.upsertDevice(device);

    fx.audit.append("C1", "dev-1", "scan", "host_scan", inspector::AuditStatus::Started, "examiner",
                    "scan.Service");
    const auto apps = fx.artifacts.put("C1", "dev-1", inspector::ArtifactType::InstalledApps, "registry",
                                       "live_read", nlohmann::json{{"apps", {"MetaMask", "Exodus"}}});
    fx.artifacts.put("C1", "dev-1", inspector::ArtifactType::BrowserExtension, "chrome", "copy",
                     nlohmann::json{{"ids", {"nkbihfbeogaeaoehlefnkodbefgpgknn"}}});

    inspector::RuleHit hit;
    hit.caseId = "C1";
    hit.deviceId = "dev-1";
    hit.hitType = "wallet_installed";
    hit.ruleId = "wallet.metamask";
    hit.matchedValue = "MetaMask";
    hit.confidence = 0.95;
    hit.links.push_back({"", apps.id, inspector::HitRelation::Direct});
    fx.store.saveRuleHits({hit});
    fx.audit.append("C1", "dev-1", "scan", "host_scan", inspector::AuditStatus::Success, "examiner",
                    "scan.Service", nlohmann::json{{"artifacts", 2}});

    const QString reportPath = writeFile(fx.dir.filePath(QStringLiteral("reports/C1/internal.json")),
                                         QByteArray("{\"summary\":\"two wallets\"}"));
    inspector::ReportInfo report;
    report.caseId = "C1";
    report.reportType = inspector::ReportType::InternalJson;
    report.filePath = reportPath.toStdString();
    report.sha256 = inspector::sha256File(report.filePath).sha256;
    report.generatorVersion = "report-0.1.0";
    fx.store.saveReport(report);
}

void ForensicExporterTests::testPackageIsComplete()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    auto options = fx.options();
    options.ruleFiles = {writeFile(fx.dir.filePath(QStringLiteral("rules/wallet_signatures.yaml")),
                                   QByteArray("wallets: []\n")).toStdString()};
    options.note = "  handed to lab  ";

    const auto result = fx.exporter.generateForensicZip(options);
    QVERIFY(!result.cancelled);
    QVERIFY(result.warnings.empty());
    QVERIFY(QFile::exists(QString::fromStdString(result.zipPath)));
    QVERIFY(!QFile::exists(QString::fromStdString(result.zipPath) + QStringLiteral(".part")));
    QVERIFY(QString::fromStdString(result.zipPath).contains(QStringLiteral("C1_forensic_export_")));

    inspector::ZipReader reader(QString::fromStdString(result.zipPath));
    QVERIFY(reader.find(inspector::kManifestEntryName) != nullptr);
    QVERIFY(reader.find(inspector::kHashListEntryName) != nullptr);
    QVERIFY(reader.find("reports/C1/internal.json") != nullptr);
    QVERIFY(reader.find("rules/wallet_signatures.yaml") != nullptr);
    QCOMPARE(result.fileCount, static_cast<int>(reader.entries().size()));

    int evidenceEntries = 0;
    for (const auto &entry : reader.entries()) {
        if (entry.name.rfind("evidence/C1/dev-1/", 0) == 0) {
            ++evidenceEntries;
        }
    }
    QCOMPARE(evidenceEntries, 2);

    const auto manifest = nlohmann::json::parse(reader.readAll(*reader.find(inspector::kManifestEntryName)));
    QCOMPARE(QString::fromStdString(manifest.at("schema").get<std::string>()),
             QString::fromLatin1(inspector::kForensicManifestSchema));
    QCOMPARE(QString::fromStdString(manifest.at("note").get<std::string>()), QStringLiteral("handed to lab"));
    QCOMPARE(manifest.at("artifacts").size(), static_cast<std::size_t>(2));
    QCOMPARE(manifest.at("hits").size(), static_cast<std::size_t>(1));
    QCOMPARE(manifest.at("devices").size(), static_cast<std::size_t>(1));
    QCOMPARE(manifest.at("audits").size(), static_cast<std::size_t>(2));
    QCOMPARE(manifest.at("stats").at("artifact_count").get<int>(), 2);
    QCOMPARE(QString::fromStdString(manifest.at("extra").at("operator").get<std::string>()),
             QStringLiteral("examiner"));
    for (const auto &entry : manifest.at("artifacts")) {
        QVERIFY(reader.find(entry.at("zip_path").get<std::string>()) != nullptr);
    }
}

void ForensicExporterTests::testHashListCoversEveryEntry()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    const auto result = fx.exporter.generateForensicZip(fx.options());

    inspector::ZipReader reader(QString::fromStdString(result.zipPath));
    const auto hashes = parseHashLines(reader.readAll(*reader.find(inspector::kHashListEntryName)));
    QCOMPARE(hashes.size() + 1, reader.entries().size());
    QVERIFY(hashes.count(inspector::kManifestEntryName) == 1);

    std::string previous;
    for (const auto &[path, sha] : hashes) {
        QVERIFY(path > previous);
        previous = path;
        const auto *entry = reader.find(path);
        QVERIFY2(entry != nullptr, path.c_str());
        QCOMPARE(QString::fromStdString(inspector::sha256Bytes(reader.readAll(*entry))),
                 QString::fromStdString(sha));
    }

    // Evidence bytes are copied unchanged.
    for (const auto &artifact : fx.store.listArtifactsByCase("C1")) {
        bool found = false;
        for (const auto &[path, sha] : hashes) {
            if (sha == artifact.sha256) {
                found = true;
            }
        }
        QVERIFY(found);
    }
}

void ForensicExporterTests::testExportIsRecordedAsReportAndAudit()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    const auto result = fx.exporter.generateForensicZip(fx.options());

    QVERIFY(inspector::isSha256Hex(result.zipSha256));
    QCOMPARE(QString::fromStdString(result.zipSha256),
             QString::fromStdString(inspector::sha256File(result.zipPath).sha256));

    const auto report = fx.store.getReport(result.reportId);
    QVERIFY(report.has_value());
    QCOMPARE(report->reportType, inspector::ReportType::ForensicZip);
    QCOMPARE(QString::fromStdString(report->sha256), QString::fromStdString(result.zipSha256));
    QCOMPARE(QString::fromStdString(report->generatorVersion),
             QString::fromLatin1(inspector::kForensicExportGenerator));

    const auto events = fx.store.listAuditEvents("C1", 0);
    const auto &last = events.back();
    QCOMPARE(QString::fromStdString(last.eventType), QStringLiteral("export"));
    QCOMPARE(QString::fromStdString(last.action), QStringLiteral("forensic_zip"));
    QCOMPARE(last.status, inspector::AuditStatus::Success);
    QCOMPARE(QString::fromStdString(last.actor), QStringLiteral("examiner"));
    const auto detail = nlohmann::json::parse(last.detailJson);
    QCOMPARE(QString::fromStdString(detail.at("zip_sha256").get<std::string>()),
             QString::fromStdString(result.zipSha256));
}

void ForensicExporterTests::testMissingSnapshotBecomesWarning()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    const auto victims = fx.store.listArtifactsByCase("C1");
    QVERIFY(QFile::remove(QString::fromStdString(victims.front().snapshotPath)));

    const auto result = fx.exporter.generateForensicZip(fx.options());
    QCOMPARE(result.warnings.size(), static_cast<std::size_t>(1));
    QVERIFY(QString::fromStdString(result.warnings.front()).contains(QString::fromStdString(victims.front().id)));

    inspector::ZipReader reader(QString::fromStdString(result.zipPath));
    const auto manifest = nlohmann::json::parse(reader.readAll(*reader.find(inspector::kManifestEntryName)));
    QCOMPARE(manifest.at("warnings").size(), static_cast<std::size_t>(1));
    for (const auto &entry : manifest.at("artifacts")) {
        if (entry.at("artifact").at("artifact_id").get<std::string>() == victims.front().id) {
            QVERIFY(entry.at("zip_path").get<std::string>().empty());
        } else {
            QVERIFY(!entry.at("zip_path").get<std::string>().empty());
        }
    }
}

void ForensicExporterTests::testSameNamedRuleFilesAreAllArchived()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    auto options = fx.options();
    for (const char *team : {"alpha", "beta", "gamma"}) {
        options.ruleFiles.push_back(
            writeFile(fx.dir.filePath(QStringLiteral("rules/%1/wallets.yaml").arg(QLatin1String(team))),
                      QByteArray("team: ") + team + "\n").toStdString());
    }

    const auto result = fx.exporter.generateForensicZip(options);
    QVERIFY(result.warnings.empty());

    inspector::ZipReader reader(QString::fromStdString(result.zipPath));
    std::set<std::string> contents;
    for (const auto &entry : reader.entries()) {
        if (entry.name.rfind("rules/", 0) == 0) {
            contents.insert(reader.readAll(entry));
        }
    }
    QCOMPARE(contents.size(), static_cast<std::size_t>(3));
    QVERIFY(contents.count("team: gamma\n") == 1);
}

void ForensicExporterTests::testArchiveWriteFailureAbortsExport()
{
    Fixture fx(m_runDir);
    seedCase(fx);

    QByteArray bulk;
    std::uint32_t state = 7;
    for (int i = 0; i < 4 * 1024 * 1024; ++i) {
        state = state * 1103515245u + 12345u;
        bulk.append(static_cast<char>('a' + (state >> 16) % 26));
    }
    inspector::ReportInfo report;
    report.caseId = "C1";
    report.reportType = inspector::ReportType::ForensicPdf;
    report.filePath = writeFile(fx.dir.filePath(QStringLiteral("reports/C1/bulk.pdf")), bulk).toStdString();
    report.sha256 = inspector::sha256File(report.filePath).sha256;
    report.generatorVersion = "report-0.1.0";
    fx.store.saveReport(report);
    const std::size_t reportsBefore = fx.store.listReportsByCase("C1").size();
    const auto options = fx.options();

    // The archive may not grow past 512 KiB; writes beyond it fail with EFBIG.
    rlimit saved{};
    QVERIFY(getrlimit(RLIMIT_FSIZE, &saved) == 0);
    const auto prevHandler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit limited = saved;
    limited.rlim_cur = 512 * 1024;
    QVERIFY(setrlimit(RLIMIT_FSIZE, &limited) == 0);
    bool threw = false;
    try {
        fx.exporter.generateForensicZip(options);
    } catch (const inspector::ArchiveWriteError &) {
        threw = true;
    }
    setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, prevHandler);

    QVERIFY(threw);
    QVERIFY(QDir(QString::fromStdString(options.exportDir)).entryList(QDir::Files).isEmpty());
    QCOMPARE(fx.store.listReportsByCase("C1").size(), reportsBefore);
}

void ForensicExporterTests::testEarlierExportsAreNotNested()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    const auto first = fx.exporter.generateForensicZip(fx.options());
    const auto second = fx.exporter.generateForensicZip(fx.options());
    QVERIFY(first.zipPath != second.zipPath);
    QVERIFY(QFile::exists(QString::fromStdString(first.zipPath)));

    inspector::ZipReader reader(QString::fromStdString(second.zipPath));
    for (const auto &entry : reader.entries()) {
        QVERIFY2(!QString::fromStdString(entry.name).endsWith(QStringLiteral(".zip")), entry.name.c_str());
    }

    const auto manifest = nlohmann::json::parse(reader.readAll(*reader.find(inspector::kManifestEntryName)));
    bool listed = false;
    for (const auto &entry : manifest.at("reports")) {
        if (entry.at("report").at("report_id").get<std::string>() == first.reportId) {
            listed = true;
            QVERIFY(entry.at("zip_path").get<std::string>().empty());
        }
    }
    QVERIFY(listed);
}

void ForensicExporterTests::testOutsideRootUsesDeviceFallback()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    auto options = fx.options();
    options.evidenceRoot = fx.dir.filePath(QStringLiteral("elsewhere")).toStdString();

    const auto result = fx.exporter.generateForensicZip(options);
    inspector::ZipReader reader(QString::fromStdString(result.zipPath));
    for (const auto &artifact : fx.store.listArtifactsByCase("C1")) {
        const std::string name = QFileInfo(QString::fromStdString(artifact.snapshotPath)).fileName().toStdString();
        QVERIFY2(reader.find("evidence/dev-1/" + name) != nullptr, name.c_str());
    }
}

void ForensicExporterTests::testCancelledExportLeavesNothing()
{
    Fixture fx(m_runDir);
    seedCase(fx);
    const std::size_t reportsBefore = fx.store.listReportsByCase("C1").size();

    std::atomic<bool> cancel{true};
    auto options = fx.options();
    options.cancelFlag = &cancel;

    const auto result = fx.exporter.generateForensicZip(options);
    QVERIFY(result.cancelled);
    QVERIFY(result.zipPath.empty());
    QVERIFY(result.reportId.empty());
    QVERIFY(!result.warnings.empty());
    QVERIFY(QDir(QString::fromStdString(options.exportDir)).entryList(QDir::Files).isEmpty());
    QCOMPARE(fx.store.listReportsByCase("C1").size(), reportsBefore);

    const auto last = fx.store.listAuditEvents("C1", 0).back();
    QCOMPARE(last.status, inspector::AuditStatus::Skipped);
    QCOMPARE(QString::fromStdString(last.action), QStringLiteral("forensic_zip"));
}

void ForensicExporterTests::testUnknownCaseThrows()
{
    Fixture fx(m_runDir);
    auto options = fx.options();
    options.caseId = "nope";
    QVERIFY_THROWS_EXCEPTION(inspector::NotFoundError, fx.exporter.generateForensicZip(options));
    options.caseId = "   ";
    QVERIFY_THROWS_EXCEPTION(inspector::NotFoundError, fx.exporter.generateForensicZip(options));
    QVERIFY(!QDir(QString::fromStdString(options.exportDir)).exists());
}

void ForensicExporterTests::testDefaultExportDirFollowsDatabase()
{
    qunsetenv("INSPECTOR_EXPORT_DIR");
    Fixture fx(m_runDir);
    seedCase(fx);
    auto options = fx.options();
    options.exportDir.clear();

    const auto result = fx.exporter.generateForensicZip(options);
    QCOMPARE(QFileInfo(QString::fromStdString(result.zipPath)).absolutePath(),
             QFileInfo(fx.dir.filePath(QStringLiteral("exports"))).absoluteFilePath());
}

QTEST_MAIN(ForensicExporterTests)
#include "test_forensic_exporter.moc"
