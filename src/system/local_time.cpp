/*
 * local_time.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "local_time.hpp"

#include <charconv>
#include <ctime>
#include <format>

namespace bmtl::system {

using namespace std::chrono;

namespace {

bool isDigits(std::string_view text);

bool parseFixed(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size() || !isDigits(text.substr(pos, len))) {
        return false;
    }
    auto first = text.data() + pos;
    auto last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

bool isDigits(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

bool isZoneDesignator(std::string_view text) {
    if (text == "Z" || text == "z") {
        return true;
    }
    if (text.size() != 6 || (text[0] != '+' && text[0] != '-') ||
        text[3] != ':') {
        return false;
    }
    return isDigits(text.substr(1, 2)) && isDigits(text.substr(4, 2));
}

}  // namespace

LocalTime toLocalTime(system_clock::time_point tp) {
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);

    local_days day{year{tm.tm_year + 1900} / month(tm.tm_mon + 1) /
                   std::chrono::day(tm.tm_mday)};
    return day + hours{tm.tm_hour} + minutes{tm.tm_min} + seconds{tm.tm_sec};
}

LocalTime localNow() { return toLocalTime(system_clock::now()); }

std::string formatTimestamp(LocalTime t) {
    auto dp = floor<days>(t);
    year_month_day ymd{dp};
    hh_mm_ss hms{t - dp};
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), hms.hours().count(),
                       hms.minutes().count(), hms.seconds().count());
}

std::string nowTimestamp() { return formatTimestamp(localNow()); }

std::string formatCompact(LocalTime t) {
    auto dp = floor<days>(t);
    year_month_day ymd{dp};
    hh_mm_ss hms{t - dp};
    return std::format("{:04}{:02}{:02}_{:02}{:02}{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), hms.hours().count(),
                       hms.minutes().count(), hms.seconds().count());
}

std::optional<LocalTime> parseTimestamp(std::string_view text) {
    // YYYY-MM-DDTHH:MM is the shortest accepted form.
    if (text.size() < 16 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':') {
        return std::nullopt;
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!parseFixed(text, 0, 4, y) || !parseFixed(text, 5, 2, mo) ||
        !parseFixed(text, 8, 2, d) || !parseFixed(text, 11, 2, h) ||
        !parseFixed(text, 14, 2, mi)) {
        return std::nullopt;
    }

    size_t pos = 16;
    if (pos < text.size() && text[pos] == ':') {
        if (!parseFixed(text, pos + 1, 2, s)) {
            return std::nullopt;
        }
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            size_t end = pos + 1;
            while (end < text.size() && text[end] >= '0' && text[end] <= '9') {
                ++end;
            }
            if (end == pos + 1) {
                return std::nullopt;
            }
            pos = end;
        }
    }

    if (pos < text.size() && !isZoneDesignator(text.substr(pos))) {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month(static_cast<unsigned>(mo)),
                       day(static_cast<unsigned>(d))};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }

    return local_days{ymd} + hours{h} + minutes{mi} + seconds{s};
}

}  // namespace bmtl::system
