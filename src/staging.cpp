/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/staging.hpp"
#include "noirlings/errors.hpp"
#include "noirlings/exercise.hpp"
#include "noirlings/logger.hpp"
#include <fstream>
#include <system_error>

namespace noirlings {

StagingArea::StagingArea(const std::filesystem::path& root)
    : root_(root) {
    LOG_DEBUG("Staging area: " + root_.string());
}

WorkingUnit StagingArea::stage(const Exercise& exercise, const std::optional<ConfigPayload>& inputs) {
    LOG_DEBUG("Staging exercise " + exercise.name + " from " + exercise.path.string());

    createLayout();
    writeManifestIfMissing();
    copySource(exercise.path);
    if (inputs) {
        writeInputs(*inputs);
    }

    return WorkingUnit{root_, kPackageName};
}

void StagingArea::createLayout() {
    std::error_code ec;
    std::filesystem::create_directories(root_ / "src", ec);
    if (ec) {
        LOG_ERROR("Failed to create working area: " + ec.message());
        throw StagingError("Unable to create the working area " + (root_ / "src").string() + ": " + ec.message());
    }
}

void StagingArea::writeManifestIfMissing() {
    const auto manifest = manifestPath();
    std::error_code ec;
    const bool present = std::filesystem::exists(manifest, ec);
    if (ec) {
        throw StagingError("Unable to inspect " + manifest.string() + ": " + ec.message());
    }
    if (present) {
        return;
    }

    std::ofstream file(manifest, std::ios::binary);
    if (!file) {
        throw StagingError("Unable to write " + manifest.string());
    }
    file << "[package]\n"
         << "name = \"" << kPackageName << "\"\n"
         << "type = \"bin\"\n"
         << "authors = [\"\"]\n"
         << "\n[dependencies]\n";
    file.flush();
    if (!file.good()) {
        throw StagingError("Unable to write " + manifest.string());
    }
    LOG_DEBUG("Wrote package manifest: " + manifest.string());
}

void StagingArea::copySource(const std::filesystem::path& source) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        throw StagingError("Error occurred while preparing the exercise, exercise file not found: " + source.string() +
                           (ec ? " (" + ec.message() + ")" : std::string()));
    }

    std::filesystem::copy_file(source, sourcePath(),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw StagingError("Error occurred while preparing the exercise\nExercise: " + source.string() +
                           "\nLib path: " + sourcePath().string() + "\n" + ec.message());
    }
}

void StagingArea::writeInputs(const ConfigPayload& inputs) {
    const auto target = inputPath();

    if (!inputs.isInlined()) {
        std::error_code ec;
        std::filesystem::copy_file(inputs.path(), target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ConfigReadError("Unable to copy input file " + inputs.path().string() + ": " + ec.message());
        }
        return;
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw StagingError("Unable to write input file " + target.string());
    }
    file << inputs.text();
    file.flush();
    if (!file.good()) {
        throw StagingError("Unable to write input file " + target.string());
    }
}

} // namespace noirlings
