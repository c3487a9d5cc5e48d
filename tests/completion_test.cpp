/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "noirlings/completion.hpp"

using namespace noirlings;

namespace {

std::string numberedSource(std::size_t lines, std::size_t markerIndex) {
    std::string source;
    for (std::size_t i = 0; i < lines; ++i) {
        source += (i == markerIndex) ? "// I AM NOT DONE" : "let x" + std::to_string(i) + " = " + std::to_string(i) + ";";
        source += "\n";
    }
    return source;
}

} // namespace

TEST(CompletionDetector, SourceWithoutMarkerIsDone) {
    EXPECT_TRUE(detect("fn main(x: Field) {\n    assert(x == 1);\n}\n").done);
    EXPECT_TRUE(detect("").done);
    EXPECT_TRUE(detect("// I AM DONE\nfn main() {}\n").done);
}

TEST(CompletionDetector, MarkerInTheMiddleYieldsFiveLineWindow) {
    CompletionState state = detect(numberedSource(10, 5));
    ASSERT_FALSE(state.done);
    ASSERT_EQ(state.context.size(), 2 * kMarkerContext + 1);

    for (std::size_t i = 0; i < state.context.size(); ++i) {
        EXPECT_EQ(state.context[i].number, 3 + i + 1);
        EXPECT_EQ(state.context[i].isMarker, state.context[i].number == 6);
    }
    EXPECT_EQ(state.context[2].text, "// I AM NOT DONE");
}

TEST(CompletionDetector, MarkerOnFirstLineClipsAtFileStart) {
    CompletionState state = detect(numberedSource(7, 0));
    ASSERT_FALSE(state.done);
    ASSERT_EQ(state.context.size(), 3u);
    EXPECT_EQ(state.context[0].number, 1u);
    EXPECT_TRUE(state.context[0].isMarker);
    EXPECT_EQ(state.context[1].number, 2u);
    EXPECT_EQ(state.context[2].number, 3u);
    EXPECT_FALSE(state.context[1].isMarker);
    EXPECT_FALSE(state.context[2].isMarker);
}

TEST(CompletionDetector, MarkerOnLastLineClipsAtFileEnd) {
    CompletionState state = detect(numberedSource(4, 3));
    ASSERT_FALSE(state.done);
    ASSERT_EQ(state.context.size(), 3u);
    EXPECT_EQ(state.context.front().number, 2u);
    EXPECT_EQ(state.context.back().number, 4u);
    EXPECT_TRUE(state.context.back().isMarker);
}

TEST(CompletionDetector, WindowCoversClippedRangeForEveryMarkerPosition) {
    const std::size_t lines = 6;
    for (std::size_t m = 0; m < lines; ++m) {
        CompletionState state = detect(numberedSource(lines, m));
        ASSERT_FALSE(state.done);

        std::size_t low = m >= 2 ? m - 2 : 0;
        std::size_t high = std::min(lines - 1, m + 2);
        ASSERT_EQ(state.context.size(), high - low + 1) << "marker at " << m;

        std::size_t markers = 0;
        for (std::size_t i = 0; i < state.context.size(); ++i) {
            EXPECT_EQ(state.context[i].number, low + i + 1);
            if (state.context[i].isMarker) ++markers;
        }
        EXPECT_EQ(markers, 1u);
    }
}

TEST(CompletionDetector, OnlyFirstMarkerIsReported) {
    CompletionState state = detect("// I AM NOT DONE\na\nb\nc\nd\ne\n// I AM NOT DONE\n");
    ASSERT_FALSE(state.done);
    EXPECT_TRUE(state.context[0].isMarker);
    EXPECT_EQ(state.context.size(), 3u);
}

TEST(CompletionDetector, MarkerMatchingIgnoresCaseAndCommentStyle) {
    EXPECT_TRUE(isMarkerLine("// I AM NOT DONE"));
    EXPECT_TRUE(isMarkerLine("/// I AM NOT DONE"));
    EXPECT_TRUE(isMarkerLine("    //I AM NOT DONE   "));
    EXPECT_TRUE(isMarkerLine("// i am not done"));
    EXPECT_TRUE(isMarkerLine("# I AM NOT DONE"));
    EXPECT_TRUE(isMarkerLine("/* I AM NOT DONE */"));
    EXPECT_TRUE(isMarkerLine("//  I  AM   NOT DONE\r"));
}

TEST(CompletionDetector, NonMarkerLinesAreRejected) {
    EXPECT_FALSE(isMarkerLine("I AM NOT DONE"));
    EXPECT_FALSE(isMarkerLine("let s = \"// I AM NOT DONE\";"));
    EXPECT_FALSE(isMarkerLine("// I AM NOT DONE yet, but close"));
    EXPECT_FALSE(isMarkerLine("// I AM DONE"));
}

TEST(CompletionDetector, HandlesWindowsLineEndings) {
    CompletionState state = detect("a\r\n// I AM NOT DONE\r\nb\r\n");
    ASSERT_FALSE(state.done);
    ASSERT_EQ(state.context.size(), 3u);
    EXPECT_EQ(state.context[1].text, "// I AM NOT DONE");
    EXPECT_TRUE(state.context[1].isMarker);
}
