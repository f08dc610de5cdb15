#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include <QCryptographicHash>

namespace inspector {

struct FileDigest {
    std::string sha256;
    std::int64_t sizeBytes = 0;
};

// Field-level digest used for record_hash and chain_hash: each part is
// trimmed of surrounding whitespace and the parts are joined by '\n'.
std::string sha256Text(const std::vector<std::string> &parts);
std::string sha256Text(std::initializer_list<std::string> parts);

std::string sha256Bytes(const std::string &bytes);

// Streams the file once. Throws IOError when it cannot be opened or read.
FileDigest sha256File(const std::string &path);

bool isSha256Hex(const std::string &value);

// Incremental SHA-256 that also counts the bytes fed to it.
class Sha256Accumulator {
public:
    Sha256Accumulator();

    void addData(const char *data, std::int64_t length);
    std::string hexDigest() const;
    std::int64_t sizeBytes() const;

private:
    QCryptographicHash m_hash;
    std::int64_t m_size = 0;
};

} // namespace inspector
