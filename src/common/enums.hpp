#pragma once

namespace inspector {

enum class ArtifactType {
    InstalledApps,
    BrowserHistory,
    BrowserExtension,
    BrowserHistoryDb,
    MobilePackages,
    MobileBackup,
    ChainBalance
};

enum class AuditStatus {
    Started,
    Success,
    Failed,
    Skipped
};

enum class HitRelation {
    Direct,
    Derived
};

enum class ReportType {
    InternalHtml,
    InternalJson,
    ForensicPdf,
    ForensicZip
};

enum class ReportStatus {
    Ready,
    Failed
};

enum class PrecheckStatus {
    Passed,
    Failed,
    Skipped
};

// Kind of a file placed inside a forensic export package.
enum class FileKind {
    Artifact,
    Report,
    Rule,
    Manifest
};

} // namespace inspector
