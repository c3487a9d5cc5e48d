/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "noirlings/completion.hpp"
#include "noirlings/mode.hpp"

namespace noirlings {

struct Exercise {
    std::string name;
    std::filesystem::path path;
    Mode mode;
    std::string hint;

    // Reads the source and looks for the marker. Throws ConfigReadError
    // when the source file cannot be read.
    [[nodiscard]] CompletionState state() const;
    [[nodiscard]] bool looksDone() const { return state().done; }
};

std::ostream& operator<<(std::ostream& os, const Exercise& exercise);

class ExerciseList final {
public:
    // Throws ConfigReadError, ManifestError or ModeDecodeError.
    [[nodiscard]] static ExerciseList load(const std::filesystem::path& manifest);
    [[nodiscard]] static ExerciseList parse(const std::string& document);
    [[nodiscard]] static ExerciseList fromJson(const nlohmann::json& document);

    [[nodiscard]] const std::vector<Exercise>& exercises() const noexcept { return exercises_; }
    [[nodiscard]] std::optional<Exercise> find(const std::string& name) const;
    [[nodiscard]] std::size_t size() const noexcept { return exercises_.size(); }

private:
    std::vector<Exercise> exercises_;
};

} // namespace noirlings
