/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace noirlings {

struct Settings {
    std::filesystem::path manifest = "info.json";
    std::filesystem::path workspace = "runner_crate";
    std::string nargo = "nargo";
    std::string bb = "bb";
    std::string git = "git";

    // NOIRLINGS_MANIFEST, NOIRLINGS_WORKSPACE, NOIRLINGS_NARGO, NOIRLINGS_BB,
    // NOIRLINGS_GIT; unset or empty variables keep the defaults.
    [[nodiscard]] static Settings fromEnv();
};

} // namespace noirlings
