#include "common/config.hpp"

#include <filesystem>

#include <QtGlobal>

#ifndef INSPECTOR_VERSION
#define INSPECTOR_VERSION "dev"
#endif
#ifndef INSPECTOR_COMMIT
#define INSPECTOR_COMMIT "unknown"
#endif
#ifndef INSPECTOR_BUILD_TIME
#define INSPECTOR_BUILD_TIME "unknown"
#endif

namespace inspector {

namespace {

std::string siblingOf(const std::string &dbPath, const char *name)
{
    std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    return (parent / name).string();
}

std::string envOr(const char *name, const std::string &fallback)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? fallback : value.toStdString();
}

} // namespace

AppConfig defaultConfig()
{
    AppConfig config;
    config.dbPath = "data/inspector.db";
    config.evidenceRoot = "data/evidence";
    config.exportDir = siblingOf(config.dbPath, "exports");
    config.reportsRoot = siblingOf(config.dbPath, "reports");
    config.walletRulePath = "rules/wallet_signatures.template.yaml";
    config.exchangeRulePath = "rules/exchange_domains.template.yaml";
    config.operatorName = "system";
    return config;
}

AppConfig loadConfig()
{
    AppConfig config = defaultConfig();
    config.dbPath = envOr("INSPECTOR_DB", config.dbPath);
    rebaseOnDatabase(config, config.dbPath);
    config.evidenceRoot = envOr("INSPECTOR_EVIDENCE_DIR", config.evidenceRoot);
    config.exportDir = envOr("INSPECTOR_EXPORT_DIR", config.exportDir);
    config.reportsRoot = envOr("INSPECTOR_REPORTS_DIR", config.reportsRoot);
    config.walletRulePath = envOr("INSPECTOR_WALLET_RULES", config.walletRulePath);
    config.exchangeRulePath = envOr("INSPECTOR_EXCHANGE_RULES", config.exchangeRulePath);
    config.operatorName = envOr("INSPECTOR_OPERATOR", config.operatorName);
    return config;
}

void rebaseOnDatabase(AppConfig &config, const std::string &dbPath)
{
    config.dbPath = dbPath;
    config.exportDir = envOr("INSPECTOR_EXPORT_DIR", siblingOf(dbPath, "exports"));
    config.reportsRoot = envOr("INSPECTOR_REPORTS_DIR", siblingOf(dbPath, "reports"));
}

BuildInfo buildInfo()
{
    return BuildInfo{INSPECTOR_VERSION, INSPECTOR_COMMIT, INSPECTOR_BUILD_TIME};
}

} // namespace inspector
