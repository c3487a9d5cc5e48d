/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace noirlings {

// Scratch file named temp_<pid>_<thread> inside a directory. The file is
// removed when the owning scope exits; removal failures are ignored.
class ScratchFile final {
public:
    explicit ScratchFile(const std::filesystem::path& directory);
    ~ScratchFile();

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;
    ScratchFile(ScratchFile&&) = delete;
    ScratchFile& operator=(ScratchFile&&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static std::string uniqueName();

private:
    std::filesystem::path path_;
};

} // namespace noirlings
