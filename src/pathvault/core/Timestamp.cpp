#include "core/Timestamp.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace PV {

auto now() -> Timestamp {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(Clock::now());
}

auto formatTimestamp(Timestamp ts) -> std::string {
    auto const secs  = std::chrono::floor<std::chrono::seconds>(ts);
    auto const nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(ts - secs).count();
    auto const timeT = Clock::to_time_t(std::chrono::time_point_cast<Clock::duration>(secs));

    std::tm utc{};
    gmtime_r(&timeT, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(9) << nanos << 'Z';
    return oss.str();
}

auto parseTimestamp(std::string_view text) -> Expected<Timestamp> {
    // Date and time part is fixed width: YYYY-MM-DDTHH:MM:SS
    if (text.size() < 20)
        return std::unexpected(Error{Error::Code::MalformedInput, "timestamp too short: " + std::string(text)});

    std::tm            utc{};
    std::istringstream iss{std::string(text.substr(0, 19))};
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail())
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid timestamp: " + std::string(text)});

    auto          rest  = text.substr(19);
    std::int64_t  nanos = 0;
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        int digits = 0;
        while (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front()))) {
            if (digits < 9) {
                nanos = nanos * 10 + (rest.front() - '0');
                ++digits;
            }
            rest.remove_prefix(1);
        }
        if (digits == 0)
            return std::unexpected(Error{Error::Code::MalformedInput, "empty timestamp fraction: " + std::string(text)});
        for (; digits < 9; ++digits)
            nanos *= 10;
    }

    std::int64_t offsetSeconds = 0;
    if (rest == "Z" || rest == "z") {
        offsetSeconds = 0;
    } else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') && rest[3] == ':') {
        int hours = 0, minutes = 0;
        if (std::sscanf(std::string(rest.substr(1)).c_str(), "%2d:%2d", &hours, &minutes) != 2)
            return std::unexpected(Error{Error::Code::MalformedInput, "invalid timestamp offset: " + std::string(text)});
        offsetSeconds = (hours * 3600 + minutes * 60) * (rest[0] == '-' ? -1 : 1);
    } else {
        return std::unexpected(Error{Error::Code::MalformedInput, "missing timestamp zone: " + std::string(text)});
    }

    auto const epoch = timegm(&utc);
    return Timestamp{std::chrono::seconds{epoch - offsetSeconds} + std::chrono::nanoseconds{nanos}};
}

} // namespace PV
