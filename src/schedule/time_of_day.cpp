/*
 * time_of_day.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "time_of_day.hpp"

#include <charconv>
#include <format>

namespace bmtl::schedule {

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view BLANKS = " \t\r\n";
    auto first = text.find_first_not_of(BLANKS);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(BLANKS);
    return text.substr(first, last - first + 1);
}

std::optional<int> parseField(std::string_view digits, size_t minLen,
                              size_t maxLen) {
    if (digits.size() < minLen || digits.size() > maxLen) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    int value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

}  // namespace

std::optional<TimeOfDay> TimeOfDay::parse(std::string_view text) {
    text = trim(text);
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }

    auto hour = parseField(text.substr(0, colon), 1, 2);
    auto minute = parseField(text.substr(colon + 1), 1, 2);
    if (!hour || !minute || *hour > 23 || *minute > 59) {
        return std::nullopt;
    }
    return TimeOfDay{*hour, *minute};
}

std::string TimeOfDay::toString() const {
    return std::format("{:02}:{:02}", hour, minute);
}

}  // namespace bmtl::schedule
