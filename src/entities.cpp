#include "entities.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace shopdb {

std::string to_string(UserStatus status) {
    switch (status) {
        case UserStatus::ACTIVE:
            return "active";
        case UserStatus::ERASED:
            return "erased";
    }
    return "unknown";
}

std::optional<UserStatus> user_status_from_string(const std::string& value) {
    if (value == "active") return UserStatus::ACTIVE;
    if (value == "erased") return UserStatus::ERASED;
    return std::nullopt;
}

std::string format_timestamp(Timestamp ts) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(ts);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis)
        << 'Z';
    return out.str();
}

std::string format_cents(Cents amount) {
    const bool negative = amount < 0;
    const Cents magnitude = negative ? -amount : amount;

    std::ostringstream out;
    out << (negative ? "-" : "") << magnitude / 100 << '.'
        << std::setw(2) << std::setfill('0') << magnitude % 100;
    return out.str();
}

}
