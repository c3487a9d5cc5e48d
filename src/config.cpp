/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/config.hpp"
#include "noirlings/logger.hpp"
#include <cstdlib>

namespace noirlings {

namespace {

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

} // namespace

Settings Settings::fromEnv() {
    Settings settings;
    settings.manifest = env_string("NOIRLINGS_MANIFEST", settings.manifest.string());
    settings.workspace = env_string("NOIRLINGS_WORKSPACE", settings.workspace.string());
    settings.nargo = env_string("NOIRLINGS_NARGO", settings.nargo);
    settings.bb = env_string("NOIRLINGS_BB", settings.bb);
    settings.git = env_string("NOIRLINGS_GIT", settings.git);

    LOG_DEBUG("Manifest: " + settings.manifest.string());
    LOG_DEBUG("Workspace: " + settings.workspace.string());
    LOG_DEBUG("Toolkit: " + settings.nargo + ", prover: " + settings.bb);
    return settings;
}

} // namespace noirlings
