/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace noirlings {

// Pipeline progress, in the order a full prove-and-verify run reaches them.
enum class Stage : std::uint8_t { Staged, Compiled, Executed, Proved, Verified, Done };

// Result of one external step (toolkit or prover call).
struct ToolResult {
    bool ok = false;
    std::string output;
    std::string error;
    explicit operator bool() const noexcept { return ok; }

    static ToolResult success(std::string out = {}) { return {true, std::move(out), {}}; }
    static ToolResult failure(std::string err) { return {false, {}, std::move(err)}; }
};

const char* stageToString(Stage stage) noexcept;

} // namespace noirlings
