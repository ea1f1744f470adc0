#include "log.h"

#include <ctime>
#include <iomanip>

const char *log_kind_name(MatchLogKind kind) {
    switch (kind) {
        case MatchedEntry:
            return "Matched";
        case FailedEntry:
            return "Failed";
        case DefaultEntry:
            return "Default";
        default:
            throw std::runtime_error("unknown log entry kind");
    }
}

std::string format_timestamp(const Timestamp &time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;

    std::tm utc;
    gmtime_r(&seconds, &utc);

    std::ostringstream s;
    s << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    s << "." << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << "Z";
    return s.str();
}
