#include "common/path_utils.hpp"

#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QStringList>

namespace inspector {

std::string sanitizePathComponent(const std::string &value)
{
    std::string out = value;
    for (char &c : out) {
        if (c == '/' || c == '\\' || c == ':' || c == ' ') {
            c = '_';
        }
    }
    if (out.empty() || out == "." || out == "..") {
        return "_";
    }
    return out;
}

std::string relativeInside(const std::string &root, const std::string &path)
{
    if (root.empty() || path.empty()) {
        return {};
    }

    const QString absRoot = QDir::cleanPath(QFileInfo(QString::fromStdString(root)).absoluteFilePath());
    const QString absPath = QDir::cleanPath(QFileInfo(QString::fromStdString(path)).absoluteFilePath());
    const QString rel = QDir(absRoot).relativeFilePath(absPath);

    if (rel.isEmpty() || rel == QStringLiteral(".") || QDir::isAbsolutePath(rel)) {
        return {};
    }
    const std::string result = rel.toStdString();
    if (!isSafeArchiveName(result)) {
        return {};
    }
    return result;
}

bool isSafeArchiveName(const std::string &name)
{
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos) {
        return false;
    }
    const QStringList segments = QString::fromStdString(name).split(QLatin1Char('/'));
    for (const QString &segment : segments) {
        if (segment.isEmpty() || segment == QStringLiteral(".") || segment == QStringLiteral("..")) {
            return false;
        }
    }
    return true;
}

std::string baseName(const std::string &path)
{
    return QFileInfo(QString::fromStdString(path)).fileName().toStdString();
}

} // namespace inspector
