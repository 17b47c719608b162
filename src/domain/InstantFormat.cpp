/**
 * @file InstantFormat.cpp
 * @brief Implementation of the instant parsing and formatting helpers.
 */

#include "domain/InstantFormat.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace writher::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
    localtime_r(&tt, &tm);
    return tm;
}

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    return tm;
}

// Reads exactly `count` digits at `pos`.
bool ReadDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool Expect(const std::string& s, size_t& pos, char ch) {
    if (pos >= s.size() || s[pos] != ch) return false;
    ++pos;
    return true;
}

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

std::optional<Instant> ParseIsoInstant(const std::string& text) {
    const std::string s = Trim(text);
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!ReadDigits(s, pos, 4, year) || !Expect(s, pos, '-') ||
        !ReadDigits(s, pos, 2, month) || !Expect(s, pos, '-') ||
        !ReadDigits(s, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!ReadDigits(s, pos, 2, hour) || !Expect(s, pos, ':') || !ReadDigits(s, pos, 2, minute)) {
        return std::nullopt;
    }
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!ReadDigits(s, pos, 2, second)) return std::nullopt;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
            ++pos;
            size_t start = pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
            if (pos == start) return std::nullopt;
        }
    }

    bool hasOffset = false;
    int offsetSeconds = 0;
    if (pos < s.size()) {
        char c = s[pos];
        if (c == 'Z' || c == 'z') {
            hasOffset = true;
            ++pos;
        } else if (c == '+' || c == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!ReadDigits(s, pos, 2, oh)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (pos < s.size() && !ReadDigits(s, pos, 2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offsetSeconds = (oh * 3600 + om * 60) * (c == '-' ? -1 : 1);
            hasOffset = true;
        }
    }
    if (pos != s.size()) return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t tt = 0;
    if (hasOffset) {
        tt = timegm(&tm);
        // timegm normalizes out-of-range days (Feb 30 -> Mar 2); reject those.
        std::tm check = ToUtcTime(tt);
        if (check.tm_mday != day || check.tm_mon != month - 1) return std::nullopt;
        tt -= offsetSeconds;
    } else {
        tm.tm_isdst = -1;
        tt = std::mktime(&tm);
        if (tt == static_cast<std::time_t>(-1)) return std::nullopt;
        if (tm.tm_mday != day || tm.tm_mon != month - 1) return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

std::string FormatIsoUtc(Instant instant) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(instant));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string FormatLocal(Instant instant) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(instant));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return ss.str();
}

std::string FormatLocalWithWeekday(Instant instant) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(instant));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M (%A)");
    return ss.str();
}

std::int64_t ToEpochSeconds(Instant instant) {
    return std::chrono::duration_cast<std::chrono::seconds>(instant.time_since_epoch()).count();
}

Instant FromEpochSeconds(std::int64_t seconds) {
    return Instant(std::chrono::seconds(seconds));
}

} // namespace writher::domain
