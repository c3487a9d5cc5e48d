/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace noirlings {

// Environment defects. These abort the run; toolkit and prover failures
// are reported as values instead.

class ConfigReadError : public std::runtime_error {
public:
    explicit ConfigReadError(const std::string& what) : std::runtime_error(what) {}
};

class StagingError : public std::runtime_error {
public:
    explicit StagingError(const std::string& what) : std::runtime_error(what) {}
};

class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& what) : std::runtime_error(what) {}
};

enum class ModeDecodeErrorKind : uint8_t {
    UnknownModeTag,
    UnknownModeField,
    InvalidModeShape
};

class ModeDecodeError : public std::runtime_error {
public:
    ModeDecodeError(ModeDecodeErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ModeDecodeErrorKind kind() const noexcept { return kind_; }

private:
    ModeDecodeErrorKind kind_;
};

} // namespace noirlings
