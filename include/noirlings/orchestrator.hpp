/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "noirlings/types.hpp"

namespace noirlings {

struct Exercise;
struct WorkingUnit;
class StagingArea;
class CompilerToolkit;
class ProverService;

enum class StepStatus : uint8_t { Succeeded, Failed, Skipped };

struct StepReport {
    Stage stage;
    StepStatus status;
    std::string detail;
};

struct PipelineOutcome {
    bool ok = false;
    std::string output;
    std::string error;
    Stage reached = Stage::Staged;   // last stage completed
    std::optional<Stage> failedAt;
    std::vector<StepReport> steps;   // includes steps skipped after a failure
    explicit operator bool() const noexcept { return ok; }

    // Nullopt when the pipeline for this mode has no such step.
    [[nodiscard]] std::optional<StepStatus> statusOf(Stage stage) const noexcept;
};

// Runs one exercise's pipeline: stage, then toolkit and prover calls as
// its mode requires, stopping at the first failing step. Toolkit and
// prover failures come back as a failed outcome; StagingError and
// ConfigReadError propagate.
class Orchestrator final {
public:
    Orchestrator(StagingArea& staging, CompilerToolkit& toolkit, ProverService& prover,
                 std::ostream& out = std::cout, std::ostream& err = std::cerr);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Runs the pipeline and prints the mode-specific report.
    [[nodiscard]] PipelineOutcome run(const Exercise& exercise);

    // Runs the pipeline without printing anything but progress logs.
    [[nodiscard]] PipelineOutcome runPipeline(const Exercise& exercise);

    // Discards local edits to the exercise source ("git stash -- <path>").
    [[nodiscard]] bool reset(const Exercise& exercise);

    void setVcsProgram(std::string program) { vcsProgram_ = std::move(program); }

private:
    StagingArea& staging_;
    CompilerToolkit& toolkit_;
    ProverService& prover_;
    std::ostream& out_;
    std::ostream& err_;
    std::string vcsProgram_ = "git";

    PipelineOutcome build(const Exercise& exercise);
    PipelineOutcome execute(const Exercise& exercise);
    PipelineOutcome prove(const Exercise& exercise, bool verify);
    PipelineOutcome test(const Exercise& exercise);

    [[nodiscard]] ToolResult executeStep(const Exercise& exercise, const WorkingUnit& unit);
    [[nodiscard]] ToolResult verifyStep(const Exercise& exercise, const WorkingUnit& unit);

    void reportSuccess(const Exercise& exercise, const PipelineOutcome& outcome);
    void reportFailure(const Exercise& exercise, const PipelineOutcome& outcome);
};

} // namespace noirlings
