/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/completion.hpp"
#include "noirlings/logger.hpp"
#include <regex>
#include <algorithm>
#include <sstream>

namespace noirlings {

namespace {

const std::regex& markerRegex() {
    static const std::regex marker(
        R"(^\s*(?:/{2,}|#+|--|;+|/\*+)\s*I\s+AM\s+NOT\s+DONE\s*(?:\*+/)?\s*$)",
        std::regex::icase | std::regex::ECMAScript);
    return marker;
}

std::vector<std::string> splitLines(const std::string& source) {
    std::vector<std::string> lines;
    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace

bool isMarkerLine(const std::string& line) {
    return std::regex_match(line, markerRegex());
}

CompletionState detect(const std::string& source) {
    const std::vector<std::string> lines = splitLines(source);

    std::size_t marker = 0;
    bool found = false;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (isMarkerLine(lines[i])) {
            marker = i;
            found = true;
            break;
        }
    }

    if (!found) {
        return CompletionState::finished();
    }

    LOG_TRACE("Marker found on line " + std::to_string(marker + 1));

    const std::size_t low = marker >= kMarkerContext ? marker - kMarkerContext : 0;
    const std::size_t high = std::min(marker + kMarkerContext, lines.size() - 1);

    std::vector<ContextLine> context;
    context.reserve(high - low + 1);
    for (std::size_t i = low; i <= high; ++i) {
        context.push_back({lines[i], i + 1, i == marker});
    }
    return CompletionState::pending(std::move(context));
}

} // namespace noirlings
