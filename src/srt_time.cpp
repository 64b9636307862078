//
//  srt_time.cpp
//  SubPair
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_time.hpp"

#include <cstdio>

namespace {

constexpr uint64_t kMsPerSecond = 1000;
constexpr uint64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr uint64_t kMsPerHour = 60 * kMsPerMinute;

// `HH:MM:SS,mmm`
constexpr size_t kTimestampWidth = 12;
constexpr std::string_view kArrow = "-->";

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_blank(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_blank(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// Fixed-width decimal field; nullopt on any non-digit.
std::optional<uint64_t> parse_digits(std::string_view s, size_t pos, size_t width) {
    uint64_t value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

}  // namespace

std::optional<uint64_t> parse_srt_timestamp(std::string_view text) {
    if (text.size() != kTimestampWidth || text[2] != ':' || text[5] != ':' || text[8] != ',') {
        return std::nullopt;
    }
    auto h = parse_digits(text, 0, 2);
    auto m = parse_digits(text, 3, 2);
    auto s = parse_digits(text, 6, 2);
    auto ms = parse_digits(text, 9, 3);
    if (!h || !m || !s || !ms || *m >= 60 || *s >= 60) {
        return std::nullopt;
    }
    return *h * kMsPerHour + *m * kMsPerMinute + *s * kMsPerSecond + *ms;
}

std::optional<TimeSpan> parse_srt_time_line(std::string_view line) {
    line = trim(line);
    const size_t arrow = line.find(kArrow);
    if (arrow == std::string_view::npos) {
        return std::nullopt;
    }
    auto start = parse_srt_timestamp(trim(line.substr(0, arrow)));
    auto end = parse_srt_timestamp(trim(line.substr(arrow + kArrow.size())));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }
    return TimeSpan{*start, *end};
}

std::string format_srt_time(uint64_t ms) {
    const uint64_t h = ms / kMsPerHour;
    ms %= kMsPerHour;
    const uint64_t m = ms / kMsPerMinute;
    ms %= kMsPerMinute;
    const uint64_t s = ms / kMsPerSecond;
    ms %= kMsPerSecond;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu,%03llu",
                  static_cast<unsigned long long>(h), static_cast<unsigned long long>(m),
                  static_cast<unsigned long long>(s), static_cast<unsigned long long>(ms));
    return std::string(buf);
}

std::string format_time_range(const TimeSpan &span) {
    return format_srt_time(span.start_ms) + " --> " + format_srt_time(span.end_ms);
}
