#pragma once

#include <cstdint>
#include <string>

namespace inspector {

std::int64_t unixNowSeconds();
std::int64_t unixNowMillis();

// Readable unique id: <prefix>_<unix_ms>_<12 hex>.
std::string newId(const std::string &prefix);

// Like newId, but the result is guaranteed to sort after floorId when both
// share the prefix. Used to keep (occurred_at, event_id) ordering aligned
// with append order inside one second.
std::string newIdAfter(const std::string &prefix, const std::string &floorId);

} // namespace inspector
