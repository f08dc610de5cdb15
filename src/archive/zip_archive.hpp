#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <QString>

namespace Poco {
namespace Zip {
class Compress;
class ZipArchive;
} // namespace Zip
} // namespace Poco

namespace inspector {

// Digest of one entry's uncompressed bytes, computed while it was written.
struct ZipEntryDigest {
    std::string name;
    std::string sha256;
    std::int64_t sizeBytes = 0;
};

// Deflating ZIP writer over Poco::Zip::Compress. Each entry is hashed with
// SHA-256 as the compressor reads it.
class ZipWriter {
public:
    // Throws ArchiveWriteError when the archive cannot be created.
    explicit ZipWriter(const QString &path);
    // Discards the archive unless close() completed.
    ~ZipWriter();

    ZipWriter(const ZipWriter &) = delete;
    ZipWriter &operator=(const ZipWriter &) = delete;

    // Throws IOError when the source cannot be opened; nothing is written
    // in that case. Once the entry has started, any failure throws
    // ArchiveWriteError and the archive must be discarded.
    ZipEntryDigest addFile(const std::string &name, const QString &sourcePath);
    ZipEntryDigest addBytes(const std::string &name, const std::string &bytes);

    // Writes the central directory and closes the file.
    void close();
    // Closes and deletes the archive without finishing it.
    void discard();

    const QString &path() const { return m_path; }
    bool contains(const std::string &name) const;

private:
    void checkName(const std::string &name) const;
    ZipEntryDigest writeEntry(const std::string &name, std::istream &source);

    QString m_path;
    std::ofstream m_out;
    std::unique_ptr<Poco::Zip::Compress> m_compress;
    std::set<std::string> m_names;
    bool m_finished = false;
};

struct ZipEntryInfo {
    std::string name;
    int method = 0;
    std::uint32_t crc = 0;
    std::uint64_t compressedSize = 0;
    std::uint64_t uncompressedSize = 0;
    // Offset of the entry's compressed bytes in the archive file.
    std::uint64_t dataOffset = 0;
};

// File entries of an existing archive, read through Poco::Zip::ZipArchive.
// Directory entries are skipped.
class ZipReader {
public:
    using ChunkSink = std::function<void(const char *data, std::int64_t length)>;

    // Throws ArchiveFormatError when the file cannot be opened or parsed.
    explicit ZipReader(const QString &path);
    ~ZipReader();

    ZipReader(const ZipReader &) = delete;
    ZipReader &operator=(const ZipReader &) = delete;

    const std::vector<ZipEntryInfo> &entries() const { return m_entries; }
    const ZipEntryInfo *find(const std::string &name) const;

    // Streams the uncompressed bytes to sink. Throws ArchiveFormatError on a
    // corrupt entry, unsupported method, size or CRC mismatch.
    void readEntry(const ZipEntryInfo &entry, const ChunkSink &sink);
    std::string readAll(const ZipEntryInfo &entry);

private:
    QString m_path;
    std::ifstream m_in;
    std::unique_ptr<Poco::Zip::ZipArchive> m_archive;
    std::vector<ZipEntryInfo> m_entries;
};

} // namespace inspector
