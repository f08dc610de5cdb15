#pragma once

#include <stdexcept>
#include <string>

namespace inspector {

class InspectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Write/read/stat failure on evidence, reports or the export archive.
class IOError : public InspectorError {
public:
    using InspectorError::InspectorError;
};

// Failure writing the destination archive. The partial archive cannot be
// repaired and must be discarded.
class ArchiveWriteError : public IOError {
public:
    using IOError::IOError;
};

// Case, artifact or report absent.
class NotFoundError : public InspectorError {
public:
    using InspectorError::InspectorError;
};

// SQLite prepare/step/constraint failure, including append-only triggers.
class StorageError : public InspectorError {
public:
    using InspectorError::InspectorError;
};

// Hash mismatch on an artifact or archive entry.
class IntegrityError : public InspectorError {
public:
    using InspectorError::InspectorError;
};

// chain_prev_hash does not continue the previous event's chain_hash.
class ChainDiscontinuityError : public IntegrityError {
public:
    using IntegrityError::IntegrityError;
};

// chain_hash does not match its own recomputation.
class ChainTamperError : public IntegrityError {
public:
    using IntegrityError::IntegrityError;
};

// Missing manifest/digest entries, malformed JSON, unreadable ZIP structure.
class ArchiveFormatError : public InspectorError {
public:
    using InspectorError::InspectorError;
};

} // namespace inspector
