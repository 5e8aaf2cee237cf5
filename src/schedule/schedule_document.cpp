/*
 * schedule_document.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "schedule_document.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

namespace bmtl::schedule {

namespace {

const json* findFirst(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto it = j.find(key); it != j.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<std::string> textOf(const json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    // Keep the raw form so plan() can report it as invalid.
    return value->dump();
}

std::optional<bool> boolOf(const json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0.0;
    }
    if (value->is_string()) {
        auto text = value->get<std::string>();
        if (text == "true" || text == "True" || text == "1") {
            return true;
        }
        if (text == "false" || text == "False" || text == "0") {
            return false;
        }
    }
    return std::nullopt;
}

void putTime(json& j, const char* key, const std::optional<LocalTime>& t) {
    j[key] = t ? json(system::formatTimestamp(*t)) : json(nullptr);
}

std::optional<LocalTime> getTime(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        if (auto parsed = system::parseTimestamp(it->get<std::string>())) {
            return parsed;
        }
    }
    spdlog::warn("Ignoring invalid schedule timestamp {}={}", key, it->dump());
    return std::nullopt;
}

}  // namespace

std::optional<int> parseIntervalMinutes(const json& value) {
    long long minutes = 0;

    if (value.is_number_integer()) {
        minutes = value.get<long long>();
    } else if (value.is_number_unsigned()) {
        auto raw = value.get<unsigned long long>();
        minutes = raw > static_cast<unsigned long long>(
                            std::numeric_limits<int>::max())
                      ? std::numeric_limits<int>::max()
                      : static_cast<long long>(raw);
    } else if (value.is_number_float()) {
        double raw = value.get<double>();
        if (!std::isfinite(raw)) {
            return std::nullopt;
        }
        minutes = static_cast<long long>(std::trunc(raw));
    } else if (value.is_string()) {
        auto text = value.get<std::string>();
        auto first = text.find_first_not_of(" \t\r\n");
        auto last = text.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return std::nullopt;
        }
        std::string_view digits(text.data() + first, last - first + 1);
        if (digits.front() == '+') {
            digits.remove_prefix(1);
        }
        auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), minutes);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    minutes = std::clamp<long long>(minutes, 0, std::numeric_limits<int>::max());
    return static_cast<int>(minutes);
}

ScheduleSettings ScheduleSettings::fromJson(const json& j) {
    ScheduleSettings settings;
    if (!j.is_object()) {
        return settings;
    }
    settings.enabled = boolOf(findFirst(j, {"enabled"}));
    settings.startTime = textOf(findFirst(j, {"start_time", "startTime"}));
    settings.endTime = textOf(findFirst(j, {"end_time", "endTime"}));
    if (auto* interval =
            findFirst(j, {"capture_interval", "captureInterval",
                          "capture_interval_minutes", "interval_minutes"})) {
        settings.captureInterval = *interval;
    }
    return settings;
}

json ScheduleSettings::toJson() const {
    json j = json::object();
    if (enabled) {
        j["enabled"] = *enabled;
    }
    if (startTime) {
        j["start_time"] = *startTime;
    }
    if (endTime) {
        j["end_time"] = *endTime;
    }
    if (captureInterval) {
        j["capture_interval"] = *captureInterval;
    }
    return j;
}

json ScheduleDocument::toJson() const {
    json j = {{"enabled", enabled},
              {"type", type},
              {"start_time", startTime.toString()},
              {"end_time", endTime.toString()},
              {"capture_interval_minutes", captureIntervalMinutes}};
    putTime(j, "last_capture", lastCapture);
    putTime(j, "window_start", windowStart);
    putTime(j, "window_end", windowEnd);
    putTime(j, "next_capture", nextCapture);
    return j;
}

ScheduleDocument ScheduleDocument::fromJson(const json& j) {
    ScheduleDocument doc;
    if (!j.is_object()) {
        return doc;
    }

    if (auto enabled = boolOf(findFirst(j, {"enabled"}))) {
        doc.enabled = *enabled;
    }
    if (auto it = j.find("type"); it != j.end() && it->is_string() &&
                                  it->get<std::string>() != WINDOWED_INTERVAL) {
        spdlog::warn("Unsupported schedule type '{}', using {}",
                     it->get<std::string>(), WINDOWED_INTERVAL);
    }

    if (auto text = textOf(findFirst(j, {"start_time"}))) {
        if (auto t = TimeOfDay::parse(*text)) {
            doc.startTime = *t;
        } else {
            spdlog::warn("Invalid stored start_time '{}'", *text);
        }
    }
    if (auto text = textOf(findFirst(j, {"end_time"}))) {
        if (auto t = TimeOfDay::parse(*text)) {
            doc.endTime = *t;
        } else {
            spdlog::warn("Invalid stored end_time '{}'", *text);
        }
    }
    if (auto* interval = findFirst(j, {"capture_interval_minutes",
                                       "capture_interval", "interval_minutes"})) {
        if (auto minutes = parseIntervalMinutes(*interval)) {
            doc.captureIntervalMinutes = *minutes;
        } else {
            spdlog::warn("Invalid stored capture interval {}", interval->dump());
        }
    }
    if (doc.captureIntervalMinutes <= 0) {
        doc.enabled = false;
    }

    doc.lastCapture = getTime(j, "last_capture");
    doc.windowStart = getTime(j, "window_start");
    doc.windowEnd = getTime(j, "window_end");
    doc.nextCapture = getTime(j, "next_capture");
    return doc;
}

}  // namespace bmtl::schedule
