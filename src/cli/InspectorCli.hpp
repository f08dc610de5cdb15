#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace inspector {

class InspectorCli
{
public:
    // CLI dispatcher for schema setup, forensic export and verification.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runMigrate(const QStringList &args);
    int runExport(const QStringList &args);
    int runVerify(const QStringList &args);

    int runVerifyForensicZip(const QStringList &args);
    int runVerifyArtifacts(const QStringList &args);
    int runVerifyAudits(const QStringList &args);

    // Environment-derived config with --db/--evidence-dir/... applied.
    AppConfig configFromArgs(const QStringList &args) const;
};

} // namespace inspector
