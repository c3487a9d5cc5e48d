/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/scratch.hpp"
#include "noirlings/logger.hpp"
#include <cctype>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace noirlings {

ScratchFile::ScratchFile(const std::filesystem::path& directory)
    : path_(directory / uniqueName()) {
    LOG_TRACE("Scratch file reserved: " + path_.string());
}

ScratchFile::~ScratchFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

std::string ScratchFile::uniqueName() {
    std::ostringstream tid;
    tid << std::this_thread::get_id();

    std::string thread;
    for (char c : tid.str()) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            thread += c;
        }
    }
    return "temp_" + std::to_string(::getpid()) + "_" + thread;
}

} // namespace noirlings
