#include "common/hash_utils.hpp"

#include <QByteArrayView>
#include <QFile>

#include "common/errors.hpp"

namespace inspector {

namespace {

constexpr qint64 kReadChunkBytes = 64 * 1024;

std::string trimCopy(const std::string &value)
{
    const char *whitespace = " \t\n\r\v\f";
    const auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

std::string toHex(const QByteArray &digest)
{
    return digest.toHex().toStdString();
}

} // namespace

std::string sha256Text(const std::vector<std::string> &parts)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            hash.addData(QByteArrayView("\n", 1));
        }
        const std::string trimmed = trimCopy(parts[i]);
        hash.addData(QByteArrayView(trimmed.data(), static_cast<qsizetype>(trimmed.size())));
    }
    return toHex(hash.result());
}

std::string sha256Text(std::initializer_list<std::string> parts)
{
    return sha256Text(std::vector<std::string>(parts));
}

std::string sha256Bytes(const std::string &bytes)
{
    return toHex(QCryptographicHash::hash(
        QByteArrayView(bytes.data(), static_cast<qsizetype>(bytes.size())),
        QCryptographicHash::Sha256));
}

FileDigest sha256File(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        throw IOError("open " + path + ": " + file.errorString().toStdString());
    }

    Sha256Accumulator hash;
    QByteArray chunk;
    while (!file.atEnd()) {
        chunk = file.read(kReadChunkBytes);
        if (chunk.isEmpty() && file.error() != QFileDevice::NoError) {
            throw IOError("read " + path + ": " + file.errorString().toStdString());
        }
        hash.addData(chunk.constData(), chunk.size());
    }

    return FileDigest{hash.hexDigest(), hash.sizeBytes()};
}

bool isSha256Hex(const std::string &value)
{
    if (value.size() != 64) {
        return false;
    }
    for (const char c : value) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        const bool upper = c >= 'A' && c <= 'F';
        if (!digit && !lower && !upper) {
            return false;
        }
    }
    return true;
}

Sha256Accumulator::Sha256Accumulator()
    : m_hash(QCryptographicHash::Sha256)
{
}

void Sha256Accumulator::addData(const char *data, std::int64_t length)
{
    if (length <= 0) {
        return;
    }
    m_hash.addData(QByteArrayView(data, static_cast<qsizetype>(length)));
    m_size += length;
}

std::string Sha256Accumulator::hexDigest() const
{
    return toHex(m_hash.result());
}

std::int64_t Sha256Accumulator::sizeBytes() const
{
    return m_size;
}

} // namespace inspector
