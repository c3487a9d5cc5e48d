/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace noirlings {

// Lines shown on each side of the marker line.
constexpr std::size_t kMarkerContext = 2;

struct ContextLine {
    std::string text;
    std::size_t number = 0;  // 1-based
    bool isMarker = false;

    bool operator==(const ContextLine& other) const noexcept {
        return text == other.text && number == other.number && isMarker == other.isMarker;
    }
};

// Done, or Pending with the lines surrounding the first marker.
struct CompletionState {
    bool done = true;
    std::vector<ContextLine> context;

    [[nodiscard]] static CompletionState finished() { return {}; }
    [[nodiscard]] static CompletionState pending(std::vector<ContextLine> lines) {
        return {false, std::move(lines)};
    }

    bool operator==(const CompletionState& other) const noexcept {
        return done == other.done && context == other.context;
    }
};

// True for a comment line reading "I AM NOT DONE" (any case, any of the
// //, ///, #, --, ; or /* */ comment styles).
[[nodiscard]] bool isMarkerLine(const std::string& line);

// Text search only; nothing is compiled. Deleting the marker makes an
// exercise look done whether or not it is solved.
[[nodiscard]] CompletionState detect(const std::string& source);

} // namespace noirlings
