/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "noirlings/payload.hpp"

namespace noirlings {

struct Exercise;

// Handle to a staged package, passed to the compiler toolkit.
struct WorkingUnit {
    std::filesystem::path root;
    std::string package;

    [[nodiscard]] std::filesystem::path targetDir() const { return root / "target"; }
    [[nodiscard]] std::filesystem::path artifactPath() const { return targetDir() / (package + ".json"); }
};

// Working package the exercise source is copied into before every run.
// Each stage() overwrites the previous exercise: runs sharing one area
// must be serialized by the caller.
class StagingArea final {
public:
    static constexpr const char* kPackageName = "runner_crate";
    static constexpr const char* kInputName = "Prover";

    explicit StagingArea(const std::filesystem::path& root);

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    StagingArea(StagingArea&&) noexcept = default;
    StagingArea& operator=(StagingArea&&) noexcept = default;

    // Copies the exercise source to src/main.nr and the inputs (if any) to
    // Prover.toml. Throws StagingError, or ConfigReadError when a referenced
    // input file cannot be copied.
    [[nodiscard]] WorkingUnit stage(const Exercise& exercise,
                                    const std::optional<ConfigPayload>& inputs = std::nullopt);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path sourcePath() const { return root_ / "src" / "main.nr"; }
    [[nodiscard]] std::filesystem::path inputPath() const { return root_ / (std::string(kInputName) + ".toml"); }
    [[nodiscard]] std::filesystem::path manifestPath() const { return root_ / "Nargo.toml"; }

private:
    std::filesystem::path root_;

    void createLayout();
    void writeManifestIfMissing();
    void copySource(const std::filesystem::path& source);
    void writeInputs(const ConfigPayload& inputs);
};

} // namespace noirlings
