#include "common/id_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace inspector {

namespace {

std::string formatId(const std::string &prefix, std::int64_t millis)
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dist;

    const std::uint64_t suffix = dist(gen) & 0xFFFFFFFFFFFFULL;

    std::ostringstream out;
    out << prefix << "_" << std::setw(13) << std::setfill('0') << millis
        << "_" << std::hex << std::setw(12) << std::setfill('0') << suffix;
    return out.str();
}

std::int64_t millisOf(const std::string &prefix, const std::string &id)
{
    const std::string head = prefix + "_";
    if (id.rfind(head, 0) != 0) {
        return -1;
    }
    const auto end = id.find('_', head.size());
    const std::string digits = id.substr(head.size(), end == std::string::npos
                                                          ? std::string::npos
                                                          : end - head.size());
    if (digits.empty()) {
        return -1;
    }
    for (const char c : digits) {
        if (c < '0' || c > '9') {
            return -1;
        }
    }
    try {
        return std::stoll(digits);
    } catch (const std::exception &) {
        return -1;
    }
}

} // namespace

std::int64_t unixNowSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::int64_t unixNowMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string newId(const std::string &prefix)
{
    return formatId(prefix, unixNowMillis());
}

std::string newIdAfter(const std::string &prefix, const std::string &floorId)
{
    if (floorId.empty()) {
        return newId(prefix);
    }

    const std::int64_t floorMillis = millisOf(prefix, floorId);
    std::string candidate = formatId(prefix, std::max(unixNowMillis(), floorMillis));
    if (candidate > floorId) {
        return candidate;
    }
    if (floorMillis < 0) {
        // Foreign id format; extend it so it still sorts after.
        return floorId + "_" + newId(prefix);
    }
    return formatId(prefix, floorMillis + 1);
}

} // namespace inspector
