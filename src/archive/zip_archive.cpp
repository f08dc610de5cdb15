#include "archive/zip_archive.hpp"

#include <sstream>

#include <QFile>
#include <QFileInfo>

#include <Poco/Checksum.h>
#include <Poco/CountingStream.h>
#include <Poco/DateTime.h>
#include <Poco/DigestEngine.h>
#include <Poco/DigestStream.h>
#include <Poco/Exception.h>
#include <Poco/Path.h>
#include <Poco/SHA2Engine.h>
#include <Poco/Zip/Compress.h>
#include <Poco/Zip/ZipArchive.h>
#include <Poco/Zip/ZipCommon.h>
#include <Poco/Zip/ZipLocalFileHeader.h>
#include <Poco/Zip/ZipStream.h>

#include "common/errors.hpp"
#include "common/path_utils.hpp"

namespace inspector {

namespace {

constexpr std::streamsize kChunkBytes = 64 * 1024;

std::string nativePath(const QString &path)
{
    return QFile::encodeName(path).toStdString();
}

} // namespace

ZipWriter::ZipWriter(const QString &path)
    : m_path(path)
    , m_out(nativePath(path), std::ios::out | std::ios::binary | std::ios::trunc)
{
    if (!m_out.is_open()) {
        throw ArchiveWriteError("create archive " + path.toStdString());
    }
    m_compress = std::make_unique<Poco::Zip::Compress>(m_out, true);
}

ZipWriter::~ZipWriter()
{
    if (!m_finished) {
        discard();
    }
}

bool ZipWriter::contains(const std::string &name) const
{
    return m_names.count(name) > 0;
}

void ZipWriter::checkName(const std::string &name) const
{
    if (m_finished) {
        throw IOError("archive " + m_path.toStdString() + " is already closed");
    }
    if (!isSafeArchiveName(name)) {
        throw IOError("unsafe archive entry name: " + name);
    }
    if (contains(name)) {
        throw IOError("duplicate archive entry: " + name);
    }
}

ZipEntryDigest ZipWriter::addFile(const std::string &name, const QString &sourcePath)
{
    checkName(name);
    std::ifstream source(nativePath(sourcePath), std::ios::in | std::ios::binary);
    if (!source.is_open()) {
        throw IOError("open " + sourcePath.toStdString() + " for archiving");
    }

    ZipEntryDigest digest = writeEntry(name, source);
    if (source.bad() || digest.sizeBytes != QFileInfo(sourcePath).size()) {
        throw ArchiveWriteError("read " + sourcePath.toStdString()
                                + " failed after entry " + name + " was started");
    }
    return digest;
}

ZipEntryDigest ZipWriter::addBytes(const std::string &name, const std::string &bytes)
{
    checkName(name);
    std::istringstream source(bytes);
    return writeEntry(name, source);
}

ZipEntryDigest ZipWriter::writeEntry(const std::string &name, std::istream &source)
{
    Poco::SHA2Engine sha256(Poco::SHA2Engine::SHA_256);
    Poco::CountingInputStream counted(source);
    Poco::DigestInputStream hashed(sha256, counted);

    try {
        m_compress->addFile(hashed, Poco::DateTime(),
                            Poco::Path(name, Poco::Path::PATH_UNIX),
                            Poco::Zip::ZipCommon::CM_DEFLATE,
                            Poco::Zip::ZipCommon::CL_MAXIMUM);
    } catch (const Poco::Exception &ex) {
        throw ArchiveWriteError("write entry " + name + " to " + m_path.toStdString()
                                + ": " + ex.displayText());
    }
    m_out.flush();
    if (!m_out.good()) {
        throw ArchiveWriteError("write entry " + name + " to " + m_path.toStdString());
    }
    m_names.insert(name);

    ZipEntryDigest digest;
    digest.name = name;
    digest.sha256 = Poco::DigestEngine::digestToHex(sha256.digest());
    digest.sizeBytes = static_cast<std::int64_t>(counted.chars());
    return digest;
}

void ZipWriter::close()
{
    if (m_finished) {
        return;
    }
    try {
        m_compress->close();
    } catch (const Poco::Exception &ex) {
        throw ArchiveWriteError("finish archive " + m_path.toStdString() + ": "
                                + ex.displayText());
    }
    m_out.close();
    if (m_out.fail()) {
        throw ArchiveWriteError("finish archive " + m_path.toStdString());
    }
    m_finished = true;
}

void ZipWriter::discard()
{
    if (m_out.is_open()) {
        m_out.close();
    }
    QFile::remove(m_path);
    m_finished = true;
}

ZipReader::ZipReader(const QString &path)
    : m_path(path)
    , m_in(nativePath(path), std::ios::in | std::ios::binary)
{
    if (!m_in.is_open()) {
        throw ArchiveFormatError("open archive " + path.toStdString());
    }
    try {
        m_archive = std::make_unique<Poco::Zip::ZipArchive>(m_in);
    } catch (const Poco::Exception &ex) {
        throw ArchiveFormatError("parse archive " + path.toStdString() + ": "
                                 + ex.displayText());
    }

    for (auto it = m_archive->headerBegin(); it != m_archive->headerEnd(); ++it) {
        const Poco::Zip::ZipLocalFileHeader &header = it->second;
        if (header.isDirectory()) {
            continue;
        }
        ZipEntryInfo info;
        info.name = it->first;
        info.method = static_cast<int>(header.getCompressionMethod());
        info.crc = header.getCRC();
        info.compressedSize = header.getCompressedSize();
        info.uncompressedSize = header.getUncompressedSize();
        info.dataOffset = static_cast<std::uint64_t>(header.getDataStartPos());
        m_entries.push_back(info);
    }
}

ZipReader::~ZipReader() = default;

const ZipEntryInfo *ZipReader::find(const std::string &name) const
{
    for (const auto &entry : m_entries) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

void ZipReader::readEntry(const ZipEntryInfo &entry, const ChunkSink &sink)
{
    const auto header = m_archive->findHeader(entry.name);
    if (header == m_archive->headerEnd()) {
        throw ArchiveFormatError("no entry " + entry.name + " in " + m_path.toStdString());
    }
    if (entry.method != Poco::Zip::ZipCommon::CM_DEFLATE
        && entry.method != Poco::Zip::ZipCommon::CM_STORE) {
        throw ArchiveFormatError("unsupported compression method for " + entry.name);
    }

    m_in.clear();
    Poco::Checksum crc(Poco::Checksum::TYPE_CRC32);
    std::uint64_t total = 0;
    try {
        Poco::Zip::ZipInputStream zipin(m_in, header->second);
        char buffer[kChunkBytes];
        while (zipin) {
            zipin.read(buffer, kChunkBytes);
            const std::streamsize got = zipin.gcount();
            if (got > 0) {
                crc.update(buffer, static_cast<unsigned int>(got));
                total += static_cast<std::uint64_t>(got);
                sink(buffer, got);
            }
        }
        if (zipin.bad()) {
            throw ArchiveFormatError("corrupt entry " + entry.name);
        }
    } catch (const Poco::Exception &ex) {
        throw ArchiveFormatError("read entry " + entry.name + ": " + ex.displayText());
    }

    if (total != entry.uncompressedSize) {
        throw ArchiveFormatError("size mismatch for entry " + entry.name);
    }
    if (crc.checksum() != entry.crc) {
        throw ArchiveFormatError("CRC mismatch for entry " + entry.name);
    }
}

std::string ZipReader::readAll(const ZipEntryInfo &entry)
{
    std::string out;
    readEntry(entry, [&out](const char *data, std::int64_t length) {
        out.append(data, static_cast<std::size_t>(length));
    });
    return out;
}

} // namespace inspector
