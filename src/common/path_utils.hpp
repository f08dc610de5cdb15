#pragma once

#include <string>

namespace inspector {

// Replaces '/', '\\', ':' and spaces with '_' so the value is usable as a
// single path component. Empty input yields "_".
std::string sanitizePathComponent(const std::string &value);

// Path of `path` relative to `root`, using '/' separators, when `path` lies
// inside `root`. Returns an empty string when either is empty, when the
// path escapes the root, or when the result is absolute.
std::string relativeInside(const std::string &root, const std::string &path);

// True for a relative '/'-separated name with no empty, "." or ".." segments.
bool isSafeArchiveName(const std::string &name);

std::string baseName(const std::string &path);

} // namespace inspector
