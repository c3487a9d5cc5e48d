/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace noirlings {

struct CommandResult {
    bool launched = false;
    int exitCode = -1;
    std::string out;
    std::string err;

    [[nodiscard]] bool succeeded() const noexcept { return launched && exitCode == 0; }
};

// Runs argv[0] (looked up on PATH) with the remaining arguments and waits
// for it. stdout and stderr are captured separately. A program that cannot
// be started reports launched = false and exit code 127. workingDir is
// used as the child's cwd when not empty.
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       const std::filesystem::path& workingDir = {});

// "nargo execute --prover-name Prover" style rendering for log lines.
[[nodiscard]] std::string formatCommand(const std::vector<std::string>& argv);

} // namespace noirlings
