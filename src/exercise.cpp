/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/exercise.hpp"
#include "noirlings/errors.hpp"
#include "noirlings/logger.hpp"
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace noirlings {

namespace {

std::string readWholeFile(const std::filesystem::path& path, const char* what) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigReadError(std::string("We were unable to open the ") + what + "! " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ConfigReadError(std::string("We were unable to read the ") + what + "! " + path.string());
    }
    return content;
}

std::string requireString(const nlohmann::json& entry, const char* key, std::size_t index) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        throw ManifestError("exercise #" + std::to_string(index) + ": missing string field `" + key + "`");
    }
    return it->get<std::string>();
}

Exercise decodeExercise(const nlohmann::json& entry, std::size_t index) {
    if (!entry.is_object()) {
        throw ManifestError("exercise #" + std::to_string(index) + " is not a map");
    }

    std::string name = requireString(entry, "name", index);
    std::string path = requireString(entry, "path", index);
    if (name.empty() || name == "." || name == ".." || name.find_first_of("/\\") != std::string::npos) {
        throw ManifestError("exercise #" + std::to_string(index) + ": invalid name `" + name +
                            "` (names become file names and may not contain path separators)");
    }

    auto modeIt = entry.find("mode");
    if (modeIt == entry.end()) {
        throw ManifestError("exercise `" + name + "`: missing field `mode`");
    }

    std::string hint;
    auto hintIt = entry.find("hint");
    if (hintIt != entry.end()) {
        if (!hintIt->is_string()) {
            throw ManifestError("exercise `" + name + "`: `hint` must be a string");
        }
        hint = hintIt->get<std::string>();
    }

    try {
        return Exercise{name, path, decodeMode(*modeIt), hint};
    } catch (const ModeDecodeError& e) {
        throw ModeDecodeError(e.kind(), "exercise `" + name + "`: " + e.what());
    }
}

} // namespace

CompletionState Exercise::state() const {
    return detect(readWholeFile(path, "exercise file"));
}

std::ostream& operator<<(std::ostream& os, const Exercise& exercise) {
    return os << exercise.path.string();
}

ExerciseList ExerciseList::load(const std::filesystem::path& manifest) {
    LOG_DEBUG("Loading manifest: " + manifest.string());
    return parse(readWholeFile(manifest, "manifest"));
}

ExerciseList ExerciseList::parse(const std::string& document) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error& e) {
        throw ManifestError(std::string("malformed manifest: ") + e.what());
    }
    return fromJson(json);
}

ExerciseList ExerciseList::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ManifestError("manifest must be a map with an `exercises` list");
    }
    auto list = document.find("exercises");
    if (list == document.end() || !list->is_array()) {
        throw ManifestError("manifest is missing the `exercises` list");
    }

    ExerciseList result;
    std::unordered_set<std::string> names;
    std::size_t index = 0;
    for (const auto& entry : *list) {
        Exercise exercise = decodeExercise(entry, index++);
        if (!names.insert(exercise.name).second) {
            throw ManifestError("duplicate exercise name `" + exercise.name + "`");
        }
        result.exercises_.push_back(std::move(exercise));
    }

    LOG_DEBUG("Manifest lists " + std::to_string(result.exercises_.size()) + " exercises");
    return result;
}

std::optional<Exercise> ExerciseList::find(const std::string& name) const {
    for (const auto& exercise : exercises_) {
        if (exercise.name == name) {
            return exercise;
        }
    }
    return std::nullopt;
}

} // namespace noirlings
