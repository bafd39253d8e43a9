#include "core/util.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hookstack::core {

uint64_t fnv1a64(std::string_view data, uint64_t seed) {
    uint64_t hash = seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string to_hex(uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
}

namespace {

std::tm utc_tm(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string utc_date(TimePoint tp) {
    std::tm tm = utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

std::string iso8601(TimePoint tp) {
    std::tm tm = utc_tm(tp);
    auto ms = to_epoch_ms(tp) % 1000;
    if (ms < 0) ms += 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace hookstack::core
