/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "noirlings/payload.hpp"

namespace noirlings {

enum class ModeKind : uint8_t {
    Build,
    Execute,
    ProveOnly,
    ProveAndVerify,
    Test
};

// Execution strategy of an exercise. Execute, ProveOnly and ProveAndVerify
// always carry inputs; saveFiles is only meaningful for ProveAndVerify.
class Mode final {
public:
    [[nodiscard]] static Mode build() { return Mode(ModeKind::Build, std::nullopt, false); }
    [[nodiscard]] static Mode test() { return Mode(ModeKind::Test, std::nullopt, false); }
    [[nodiscard]] static Mode execute(ConfigPayload inputs) { return Mode(ModeKind::Execute, std::move(inputs), false); }
    [[nodiscard]] static Mode proveOnly(ConfigPayload inputs) { return Mode(ModeKind::ProveOnly, std::move(inputs), false); }
    [[nodiscard]] static Mode proveAndVerify(ConfigPayload inputs, bool saveFiles) {
        return Mode(ModeKind::ProveAndVerify, std::move(inputs), saveFiles);
    }

    [[nodiscard]] ModeKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::optional<ConfigPayload>& inputs() const noexcept { return inputs_; }
    [[nodiscard]] bool saveFiles() const noexcept { return saveFiles_; }

    bool operator==(const Mode& other) const noexcept {
        return kind_ == other.kind_ && inputs_ == other.inputs_ && saveFiles_ == other.saveFiles_;
    }
    bool operator!=(const Mode& other) const noexcept { return !(*this == other); }

private:
    Mode(ModeKind kind, std::optional<ConfigPayload> inputs, bool saveFiles)
        : kind_(kind), inputs_(std::move(inputs)), saveFiles_(saveFiles) {}

    ModeKind kind_;
    std::optional<ConfigPayload> inputs_;
    bool saveFiles_;
};

// Decodes the manifest "mode" value: either a bare tag ("build", "test") or
// an object with a single key naming the variant. Never touches the
// filesystem. Throws ModeDecodeError.
[[nodiscard]] Mode decodeMode(const nlohmann::json& value);

// Decodes {"inlined": "..."} or {"path": "..."}.
[[nodiscard]] ConfigPayload decodePayload(const nlohmann::json& value);

[[nodiscard]] const char* modeKindToString(ModeKind kind) noexcept;

} // namespace noirlings
