/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace noirlings {

// Circuit inputs (Prover.toml contents), either written into the manifest
// or referenced by path. Paths are stored as given and read on demand.
class ConfigPayload final {
public:
    enum class Kind : uint8_t { Inlined, Referenced };

    [[nodiscard]] static ConfigPayload inlined(std::string text);
    [[nodiscard]] static ConfigPayload referenced(std::filesystem::path path);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isInlined() const noexcept { return kind_ == Kind::Inlined; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Inlined: the held text. Referenced: the whole file.
    // Throws ConfigReadError when the referenced file cannot be read.
    [[nodiscard]] std::string resolve() const;

    bool operator==(const ConfigPayload& other) const noexcept;
    bool operator!=(const ConfigPayload& other) const noexcept { return !(*this == other); }

private:
    ConfigPayload(Kind kind, std::string text, std::filesystem::path path);

    Kind kind_;
    std::string text_;
    std::filesystem::path path_;
};

} // namespace noirlings
