/**
 * @file Time.cpp
 * @brief Implementation of the timestamp helpers.
 */

#include "domain/Time.hpp"

#include <cstdio>
#include <ctime>

namespace chatvault::domain {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

} // namespace

std::optional<Timestamp> ParseIsoTime(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        return std::nullopt;
    }
    std::string rest = text.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && (rest[0] == 'T' || rest[0] == ' ')) {
        int timeConsumed = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d%n", &hour, &minute, &timeConsumed) != 2) {
            return std::nullopt;
        }
        rest = rest.substr(1 + static_cast<std::size_t>(timeConsumed));
        if (!rest.empty() && rest[0] == ':') {
            int secConsumed = 0;
            if (std::sscanf(rest.c_str() + 1, "%2d%n", &second, &secConsumed) != 1) {
                return std::nullopt;
            }
            rest = rest.substr(1 + static_cast<std::size_t>(secConsumed));
        }
    }

    long long fractionMs = 0;
    if (!rest.empty() && rest[0] == '.') {
        std::size_t i = 1;
        long long scale = 100;
        while (i < rest.size() && rest[i] >= '0' && rest[i] <= '9') {
            fractionMs += (rest[i] - '0') * scale;
            scale /= 10;
            ++i;
        }
        rest = rest.substr(i);
    }

    long long offsetSeconds = 0;
    if (rest == "Z" || rest.empty()) {
        // UTC
    } else if (rest[0] == '+' || rest[0] == '-') {
        int offH = 0, offM = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d", &offH, &offM) < 1) {
            return std::nullopt;
        }
        offsetSeconds = (offH * 3600LL + offM * 60LL) * (rest[0] == '+' ? 1 : -1);
    } else {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    std::int64_t seconds = days * 86400 + hour * 3600LL + minute * 60LL + second - offsetSeconds;
    return seconds * 1000 + fractionMs;
}

std::string FormatIsoTime(Timestamp time) {
    std::time_t tt = static_cast<std::time_t>(time / 1000);
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

} // namespace chatvault::domain
