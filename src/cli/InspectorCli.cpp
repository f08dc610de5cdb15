#include "cli/InspectorCli.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/id_utils.hpp"
#include "common/logging.hpp"
#include "evidence/audit_chain.hpp"
#include "evidence/chain_verifier.hpp"
#include "evidence/forensic_exporter.hpp"
#include "evidence/offline_verifier.hpp"
#include "evidence/verification_service.hpp"
#include "store/case_store.hpp"

namespace inspector {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  inspector-cli migrate [--db PATH]\n"
        "  inspector-cli export forensic-zip --case-id ID [--db PATH] [--evidence-dir DIR]\n"
        "                [--reports-dir DIR] [--out-dir DIR] [--operator NAME] [--note TEXT]\n"
        "                [--format text|json]\n"
        "  inspector-cli verify forensic-zip --zip PATH [--format text|json]\n"
        "  inspector-cli verify artifacts --case-id ID [--db PATH] [--artifact-id ID]\n"
        "                [--format text|json]\n"
        "  inspector-cli verify audits --case-id ID [--db PATH] [--limit N] [--format text|json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    if (format == QStringLiteral("text") || format == QStringLiteral("json")) {
        return true;
    }
    std::cerr << "Invalid format. Use text or json." << std::endl;
    return false;
}

const char *boolText(bool value)
{
    return value ? "true" : "false";
}

void printChainFailures(const ChainReport &report)
{
    for (const auto &failure : report.failures) {
        std::cout << "FAIL index=" << failure.index
                  << " event_id=" << failure.eventId
                  << " prev_hash=" << (failure.prevHashMismatch ? "mismatch" : "ok")
                  << " chain_hash=" << (failure.chainHashMismatch ? "mismatch" : "ok")
                  << " " << failure.message << "\n";
    }
}

} // namespace

int InspectorCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    ILOG_INFO(QStringLiteral("InspectorCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("migrate")) {
            return runMigrate(args);
        }
        if (command == QStringLiteral("export")) {
            return runExport(args);
        }
        if (command == QStringLiteral("verify")) {
            return runVerify(args);
        }
    } catch (const InspectorError &ex) {
        ILOG_ERROR(QStringLiteral("InspectorCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_failed"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("cli"),
                   (nlohmann::json{{"command", command.toStdString()}, {"error", ex.what()}}));
        std::cerr << "error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

AppConfig InspectorCli::configFromArgs(const QStringList &args) const
{
    AppConfig config = loadConfig();
    const QString db = getArgValue(args, QStringLiteral("--db"));
    if (!db.isEmpty()) {
        rebaseOnDatabase(config, db.toStdString());
    }
    const QString evidence = getArgValue(args, QStringLiteral("--evidence-dir"));
    if (!evidence.isEmpty()) {
        config.evidenceRoot = evidence.toStdString();
    }
    const QString reports = getArgValue(args, QStringLiteral("--reports-dir"));
    if (!reports.isEmpty()) {
        config.reportsRoot = reports.toStdString();
    }
    const QString outDir = getArgValue(args, QStringLiteral("--out-dir"));
    if (!outDir.isEmpty()) {
        config.exportDir = outDir.toStdString();
    }
    const QString operatorName = getArgValue(args, QStringLiteral("--operator"));
    if (!operatorName.isEmpty()) {
        config.operatorName = operatorName.toStdString();
    }
    return config;
}

int InspectorCli::runMigrate(const QStringList &args)
{
    const AppConfig config = configFromArgs(args);
    CaseStore store(config.dbPath);
    std::cout << "db=" << config.dbPath << "\n";
    std::cout << "schema_version=" << store.getMeta("schema_version").value_or("") << "\n";
    return 0;
}

int InspectorCli::runExport(const QStringList &args)
{
    if (args.size() < 3 || args.at(2) != QStringLiteral("forensic-zip")) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString caseId = getArgValue(args, QStringLiteral("--case-id"));
    if (caseId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const AppConfig config = configFromArgs(args);
    logging::CorrelationScope corr(QString::fromStdString(newId("export")));

    CaseStore store(config.dbPath);
    AuditChain audit(store);
    ForensicExporter exporter(store, audit);

    ForensicExportOptions options;
    options.caseId = caseId.toStdString();
    options.evidenceRoot = config.evidenceRoot;
    options.reportsRoot = config.reportsRoot;
    options.ruleFiles = {config.walletRulePath, config.exchangeRulePath};
    options.exportDir = config.exportDir;
    options.operatorName = config.operatorName;
    options.note = getArgValue(args, QStringLiteral("--note")).toStdString();

    const ForensicExportResult result = exporter.generateForensicZip(options);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(result).dump(2) << std::endl;
    } else {
        std::cout << "case_id=" << result.caseId << "\n";
        std::cout << "report_id=" << result.reportId << "\n";
        std::cout << "zip=" << result.zipPath << "\n";
        std::cout << "zip_sha256=" << result.zipSha256 << "\n";
        std::cout << "files=" << result.fileCount << "\n";
        std::cout << "warnings=" << result.warnings.size() << "\n";
        for (const auto &warning : result.warnings) {
            std::cout << "WARN " << warning << "\n";
        }
    }
    return result.cancelled ? 1 : 0;
}

int InspectorCli::runVerify(const QStringList &args)
{
    const QString target = args.size() >= 3 ? args.at(2) : QString();
    if (target == QStringLiteral("forensic-zip")) {
        return runVerifyForensicZip(args);
    }
    if (target == QStringLiteral("artifacts")) {
        return runVerifyArtifacts(args);
    }
    if (target == QStringLiteral("audits")) {
        return runVerifyAudits(args);
    }
    std::cerr << usageText().toStdString();
    return 1;
}

int InspectorCli::runVerifyForensicZip(const QStringList &args)
{
    const QString zipPath = getArgValue(args, QStringLiteral("--zip"));
    if (zipPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    // Package only; no database is opened.
    OfflineVerifier verifier;
    const OfflineVerifyReport report = verifier.verifyForensicZip(zipPath.toStdString());

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
        return report.ok() ? 0 : 1;
    }

    std::cout << "zip=" << report.zipPath << "\n";
    std::cout << "case_id=" << report.caseId << "\n";
    std::cout << "ok=" << boolText(report.ok()) << "\n";
    std::cout << "total=" << report.total << "\n";
    std::cout << "failed=" << report.failed << "\n";
    if (report.auditChain) {
        std::cout << "audit_total=" << report.auditChain->total << "\n";
        std::cout << "audit_failed=" << report.auditChain->failed << "\n";
        std::cout << "audit_last_chain_hash=" << report.auditChain->lastChainHash << "\n";
    }
    for (const auto &item : report.diffs()) {
        std::cout << "FAIL " << toOfflineItemStatusString(item.status) << " " << item.path
                  << " expected=" << item.expected << " actual=" << item.actual;
        if (!item.error.empty()) {
            std::cout << " error=" << item.error;
        }
        std::cout << "\n";
    }
    if (report.auditChain) {
        printChainFailures(*report.auditChain);
    }
    if (report.ok()) {
        std::cout << "no diffs\n";
    }
    return report.ok() ? 0 : 1;
}

int InspectorCli::runVerifyArtifacts(const QStringList &args)
{
    const QString caseId = getArgValue(args, QStringLiteral("--case-id"));
    if (caseId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    const AppConfig config = configFromArgs(args);
    CaseStore store(config.dbPath);
    AuditChain audit(store);
    VerificationService service(store, audit, config.operatorName);

    const ArtifactVerifyReport report = service.verifyArtifacts(
        caseId.toStdString(), getArgValue(args, QStringLiteral("--artifact-id")).toStdString());

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
        return report.ok() ? 0 : 1;
    }

    std::cout << "case_id=" << report.caseId << "\n";
    std::cout << "ok=" << boolText(report.ok()) << "\n";
    std::cout << "total=" << report.total() << "\n";
    std::cout << "ok_count=" << report.okCount << "\n";
    std::cout << "mismatch_count=" << report.mismatchCount << "\n";
    std::cout << "missing_count=" << report.missingCount << "\n";
    std::cout << "error_count=" << report.errorCount << "\n";
    for (const auto &item : report.items) {
        if (item.status == ArtifactCheckStatus::Ok) {
            continue;
        }
        std::cout << "FAIL " << toArtifactCheckStatusString(item.status) << " " << item.artifactId
                  << " path=" << item.snapshotPath
                  << " expected=" << item.expectedSha256 << " actual=" << item.actualSha256
                  << " error=" << item.error << "\n";
    }
    return report.ok() ? 0 : 1;
}

int InspectorCli::runVerifyAudits(const QStringList &args)
{
    const QString caseId = getArgValue(args, QStringLiteral("--case-id"));
    if (caseId.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        return 1;
    }

    int limit = kDefaultAuditVerifyLimit;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool parsed = false;
        limit = limitValue.toInt(&parsed);
        if (!parsed || limit <= 0) {
            std::cerr << "Invalid --limit. Use a positive integer." << std::endl;
            return 1;
        }
    }

    const AppConfig config = configFromArgs(args);
    CaseStore store(config.dbPath);
    AuditChain audit(store);
    VerificationService service(store, audit, config.operatorName);

    const ChainReport report = service.verifyAuditChain(caseId.toStdString(), limit);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
        return report.ok() ? 0 : 1;
    }

    std::cout << "case_id=" << report.caseId << "\n";
    std::cout << "ok=" << boolText(report.ok()) << "\n";
    std::cout << "total=" << report.total << "\n";
    std::cout << "failed=" << report.failed << "\n";
    std::cout << "prev_hash_failed=" << report.prevHashFailed << "\n";
    std::cout << "chain_hash_failed=" << report.chainHashFailed << "\n";
    std::cout << "last_chain_hash=" << report.lastChainHash << "\n";
    printChainFailures(report);
    return report.ok() ? 0 : 1;
}

} // namespace inspector
