#pragma once

#include <string>

namespace inspector {

struct BuildInfo {
    std::string version;
    std::string commit;
    std::string buildTime;
};

// Paths and identity shared by the CLI and the core services.
struct AppConfig {
    std::string dbPath;
    std::string evidenceRoot;
    std::string exportDir;
    std::string reportsRoot;
    std::string walletRulePath;
    std::string exchangeRulePath;
    std::string operatorName;
};

// Built-in defaults for a local data/ working directory.
AppConfig defaultConfig();

// Defaults overridden by INSPECTOR_* environment variables. exportDir and
// reportsRoot follow dbPath unless set explicitly.
AppConfig loadConfig();

// Re-derives the directories that default to siblings of the database.
void rebaseOnDatabase(AppConfig &config, const std::string &dbPath);

BuildInfo buildInfo();

} // namespace inspector
