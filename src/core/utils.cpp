/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/utils.hpp"

#include <format>

#include "include/config.hpp"

std::vector<std::string> split_list(std::string_view text, char separator) {
    std::vector<std::string> items;

    while (true) {
        auto pos = text.find(separator);
        auto item = trim_sv(text.substr(0, pos));
        if (!item.empty()) {
            items.emplace_back(item);
        }
        if (pos == std::string_view::npos) break;
        text.remove_prefix(pos + 1);
    }

    return items;
}

std::string format_elapsed(double seconds) {
    if (seconds < 0.0) seconds = 0.0;

    if (seconds >= Config::TIME_MINUTES_THRESHOLD) {
        int minutes = static_cast<int>(seconds / Config::SECONDS_PER_MINUTE);
        double rest = seconds - static_cast<double>(minutes) * Config::SECONDS_PER_MINUTE;
        return std::format("{} min {:.0f} sec", minutes, rest);
    }
    return std::format("{:.0f} sec", seconds);
}
