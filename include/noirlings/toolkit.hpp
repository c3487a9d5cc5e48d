/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "noirlings/staging.hpp"
#include "noirlings/types.hpp"

namespace noirlings {

struct Witness {
    std::filesystem::path path;
};

struct ExecuteResult {
    bool ok = false;
    std::optional<std::string> returnValue;
    Witness witness;
    std::string output;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct SaveResult {
    bool ok = false;
    std::filesystem::path path;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct TestCase {
    std::string name;
    bool passed = false;
};

struct TestRunResult {
    bool ok = false;  // the runner itself completed; individual cases may still fail
    std::vector<TestCase> cases;
    std::string output;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Compiles, executes and tests a staged working unit.
class CompilerToolkit {
public:
    virtual ~CompilerToolkit() = default;

    [[nodiscard]] virtual ToolResult compile(const WorkingUnit& unit) = 0;
    [[nodiscard]] virtual ExecuteResult execute(const WorkingUnit& unit, const std::string& inputName) = 0;
    [[nodiscard]] virtual SaveResult saveWitness(const Witness& witness, const std::string& exerciseName,
                                                 const std::filesystem::path& targetDir) = 0;
    [[nodiscard]] virtual TestRunResult runTests(const WorkingUnit& unit, const std::string& packageFilter) = 0;
};

// Drives the nargo command line.
class NargoToolkit final : public CompilerToolkit {
public:
    explicit NargoToolkit(std::string program = "nargo");

    [[nodiscard]] ToolResult compile(const WorkingUnit& unit) override;
    [[nodiscard]] ExecuteResult execute(const WorkingUnit& unit, const std::string& inputName) override;
    [[nodiscard]] SaveResult saveWitness(const Witness& witness, const std::string& exerciseName,
                                         const std::filesystem::path& targetDir) override;
    [[nodiscard]] TestRunResult runTests(const WorkingUnit& unit, const std::string& packageFilter) override;

    // "Circuit output: 0x2a" -> "0x2a".
    [[nodiscard]] static std::optional<std::string> parseReturnValue(const std::string& output);
    // "[runner_crate] Testing test_main ... ok" lines.
    [[nodiscard]] static std::vector<TestCase> parseTestReport(const std::string& output);

private:
    std::string program_;
};

} // namespace noirlings
