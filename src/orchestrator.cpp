/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/orchestrator.hpp"
#include "noirlings/exercise.hpp"
#include "noirlings/logger.hpp"
#include "noirlings/process.hpp"
#include "noirlings/prover.hpp"
#include "noirlings/scratch.hpp"
#include "noirlings/staging.hpp"
#include "noirlings/toolkit.hpp"
#include <initializer_list>
#include <sstream>
#include <system_error>

namespace noirlings {

namespace {

constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kReset = "\033[0m";

void enter(Stage stage) {
    LOG_DEBUG(std::string("Step start: ") + stageToString(stage));
}

void succeed(PipelineOutcome& outcome, Stage stage, const std::string& detail = {}) {
    LOG_DEBUG(std::string("Step done: ") + stageToString(stage));
    outcome.steps.push_back({stage, StepStatus::Succeeded, detail});
    outcome.reached = stage;
}

void fail(PipelineOutcome& outcome, Stage stage, const std::string& error) {
    LOG_WARN(std::string("Step failed at ") + stageToString(stage) + ": " + error);
    outcome.steps.push_back({stage, StepStatus::Failed, error});
    outcome.failedAt = stage;
    outcome.error = error;
}

void skip(PipelineOutcome& outcome, std::initializer_list<Stage> stages) {
    for (Stage stage : stages) {
        outcome.steps.push_back({stage, StepStatus::Skipped, {}});
    }
}

void finish(PipelineOutcome& outcome) {
    outcome.ok = true;
    outcome.reached = Stage::Done;
}

std::filesystem::path witnessPath(const WorkingUnit& unit, const Exercise& exercise) {
    return unit.targetDir() / (exercise.name + ".gz");
}

std::filesystem::path proofPath(const WorkingUnit& unit, const Exercise& exercise) {
    return unit.targetDir() / ("proof-" + exercise.name);
}

std::filesystem::path retainedKeyPath(const WorkingUnit& unit, const Exercise& exercise) {
    return unit.targetDir() / ("vk-" + exercise.name);
}

std::string display(const Exercise& exercise) {
    std::ostringstream oss;
    oss << exercise;
    return oss.str();
}

} // namespace

const char* stageToString(Stage stage) noexcept {
    switch (stage) {
        case Stage::Staged: return "staged";
        case Stage::Compiled: return "compiled";
        case Stage::Executed: return "executed";
        case Stage::Proved: return "proved";
        case Stage::Verified: return "verified";
        case Stage::Done: return "done";
        default: return "unknown";
    }
}

std::optional<StepStatus> PipelineOutcome::statusOf(Stage stage) const noexcept {
    for (const auto& step : steps) {
        if (step.stage == stage) {
            return step.status;
        }
    }
    return std::nullopt;
}

Orchestrator::Orchestrator(StagingArea& staging, CompilerToolkit& toolkit, ProverService& prover,
                           std::ostream& out, std::ostream& err)
    : staging_(staging), toolkit_(toolkit), prover_(prover), out_(out), err_(err) {
}

PipelineOutcome Orchestrator::run(const Exercise& exercise) {
    const std::string name = display(exercise);
    switch (exercise.mode.kind()) {
        case ModeKind::Build:
            out_ << kYellow << "Progress: " << kReset << "Building " << name << " exercise...\n";
            break;
        case ModeKind::Test:
            out_ << kYellow << "Progress: " << kReset << "Testing " << name << " exercise...\n";
            break;
        default:
            out_ << kYellow << "Progress: " << kReset << "Running " << name << " exercise...\n";
            break;
    }
    out_.flush();

    PipelineOutcome outcome = runPipeline(exercise);
    if (outcome.ok) {
        reportSuccess(exercise, outcome);
    } else {
        reportFailure(exercise, outcome);
    }
    return outcome;
}

PipelineOutcome Orchestrator::runPipeline(const Exercise& exercise) {
    LOG_DEBUG("Running " + exercise.name + " in " + modeKindToString(exercise.mode.kind()) + " mode");

    switch (exercise.mode.kind()) {
        case ModeKind::Build:
            return build(exercise);
        case ModeKind::Execute:
            return execute(exercise);
        case ModeKind::ProveOnly:
            return prove(exercise, false);
        case ModeKind::ProveAndVerify:
            return prove(exercise, true);
        case ModeKind::Test:
            return test(exercise);
    }

    PipelineOutcome invalid;
    invalid.error = "Invalid mode for exercise: " + exercise.name;
    return invalid;
}

PipelineOutcome Orchestrator::build(const Exercise& exercise) {
    PipelineOutcome outcome;
    enter(Stage::Staged);
    WorkingUnit unit = staging_.stage(exercise);
    succeed(outcome, Stage::Staged);

    enter(Stage::Compiled);
    ToolResult compiled = toolkit_.compile(unit);
    if (!compiled) {
        fail(outcome, Stage::Compiled, compiled.error);
        return outcome;
    }
    succeed(outcome, Stage::Compiled);

    outcome.output = compiled.output;
    finish(outcome);
    return outcome;
}

PipelineOutcome Orchestrator::execute(const Exercise& exercise) {
    PipelineOutcome outcome;
    enter(Stage::Staged);
    WorkingUnit unit = staging_.stage(exercise, exercise.mode.inputs());
    succeed(outcome, Stage::Staged);

    enter(Stage::Executed);
    ToolResult executed = executeStep(exercise, unit);
    if (!executed) {
        fail(outcome, Stage::Executed, executed.error);
        return outcome;
    }
    succeed(outcome, Stage::Executed, executed.output);

    outcome.output = executed.output;
    finish(outcome);
    return outcome;
}

PipelineOutcome Orchestrator::prove(const Exercise& exercise, bool verify) {
    PipelineOutcome outcome;
    enter(Stage::Staged);
    WorkingUnit unit = staging_.stage(exercise, exercise.mode.inputs());
    succeed(outcome, Stage::Staged);

    enter(Stage::Executed);
    ToolResult executed = executeStep(exercise, unit);
    if (!executed) {
        fail(outcome, Stage::Executed, executed.error);
        skip(outcome, {Stage::Proved});
        if (verify) skip(outcome, {Stage::Verified});
        return outcome;
    }
    succeed(outcome, Stage::Executed, executed.output);

    enter(Stage::Proved);
    ToolResult proved = prover_.prove(unit.artifactPath(), witnessPath(unit, exercise), proofPath(unit, exercise));
    if (!proved) {
        fail(outcome, Stage::Proved, proved.error);
        if (verify) skip(outcome, {Stage::Verified});
        return outcome;
    }
    succeed(outcome, Stage::Proved, proved.output);

    if (verify) {
        enter(Stage::Verified);
        ToolResult verified = verifyStep(exercise, unit);
        if (!verified) {
            fail(outcome, Stage::Verified, verified.error);
            return outcome;
        }
        succeed(outcome, Stage::Verified, verified.output);
    }

    outcome.output = executed.output;
    finish(outcome);
    return outcome;
}

PipelineOutcome Orchestrator::test(const Exercise& exercise) {
    PipelineOutcome outcome;
    enter(Stage::Staged);
    WorkingUnit unit = staging_.stage(exercise);
    succeed(outcome, Stage::Staged);

    enter(Stage::Executed);
    TestRunResult report = toolkit_.runTests(unit, unit.package);
    if (!report) {
        fail(outcome, Stage::Executed, report.error);
        return outcome;
    }

    std::size_t failed = 0;
    for (const auto& testCase : report.cases) {
        if (!testCase.passed) {
            LOG_DEBUG("Test failed: " + testCase.name);
            ++failed;
        }
    }
    if (failed > 0) {
        fail(outcome, Stage::Executed, "Some tests failed (" + std::to_string(failed) + " of " +
                                       std::to_string(report.cases.size()) + ")\n" + report.output);
        return outcome;
    }
    succeed(outcome, Stage::Executed);

    finish(outcome);
    return outcome;
}

ToolResult Orchestrator::executeStep(const Exercise& exercise, const WorkingUnit& unit) {
    ExecuteResult execution = toolkit_.execute(unit, StagingArea::kInputName);
    if (!execution) {
        return ToolResult::failure(execution.error);
    }

    std::string output = "[" + unit.package + "] Circuit witness successfully solved\n";
    if (execution.returnValue) {
        output += "[" + unit.package + "] Circuit output: " + *execution.returnValue + "\n";
    }

    SaveResult saved = toolkit_.saveWitness(execution.witness, exercise.name, unit.targetDir());
    if (!saved) {
        return ToolResult::failure(saved.error);
    }
    output += "[" + unit.package + "] Witness saved to " + saved.path.string();
    return ToolResult::success(output);
}

ToolResult Orchestrator::verifyStep(const Exercise& exercise, const WorkingUnit& unit) {
    const auto proof = proofPath(unit, exercise);

    if (exercise.mode.saveFiles()) {
        const auto vk = retainedKeyPath(unit, exercise);
        ToolResult written = prover_.writeVerificationKey(unit.artifactPath(), vk);
        if (!written) {
            return written;
        }
        return prover_.verify(vk, proof);
    }

    // Key and witness are intermediates; the proof stays.
    ToolResult verified;
    {
        ScratchFile vk(unit.targetDir());
        verified = prover_.writeVerificationKey(unit.artifactPath(), vk.path());
        if (verified) {
            verified = prover_.verify(vk.path(), proof);
        }
    }
    std::error_code ec;
    std::filesystem::remove(witnessPath(unit, exercise), ec);
    return verified;
}

void Orchestrator::reportSuccess(const Exercise& exercise, const PipelineOutcome& outcome) {
    if (!outcome.output.empty()) {
        out_ << "    " << kGreen << kBold << "Output" << kReset << " " << outcome.output << "\n";
    }

    const std::string name = display(exercise);
    out_ << kGreen << "✓ ";
    switch (exercise.mode.kind()) {
        case ModeKind::Build:
            out_ << "Successfully built " << name << "!";
            break;
        case ModeKind::Execute:
            out_ << "Successfully ran " << name << "!\n With inputs: " << exercise.mode.inputs()->resolve();
            break;
        case ModeKind::ProveOnly:
            out_ << "Successfully ran " << name << " and created proof!\n With inputs: "
                 << exercise.mode.inputs()->resolve();
            break;
        case ModeKind::ProveAndVerify:
            out_ << "Successfully ran " << name << " and verified proof!\n With inputs: "
                 << exercise.mode.inputs()->resolve();
            break;
        case ModeKind::Test:
            out_ << "Successfully tested " << name << "!";
            break;
    }
    out_ << kReset << "\n";
    out_.flush();
}

void Orchestrator::reportFailure(const Exercise& exercise, const PipelineOutcome& outcome) {
    err_ << outcome.error << "\n";

    const std::string name = display(exercise);
    const bool proverFailed = outcome.failedAt &&
        (*outcome.failedAt == Stage::Proved || *outcome.failedAt == Stage::Verified);

    err_ << kRed << "⚠ ";
    switch (exercise.mode.kind()) {
        case ModeKind::Build:
            err_ << "Compiling of " << name << " failed! Please try again.";
            break;
        case ModeKind::Execute:
            err_ << "Failed to run " << name << "! Please try again.";
            break;
        case ModeKind::ProveOnly:
            if (proverFailed) {
                err_ << "Compilation worked but failed to create proof with barretenberg for "
                     << name << "! Please try again.";
            } else {
                err_ << "Failed to execute " << name << "! Please try again.";
            }
            break;
        case ModeKind::ProveAndVerify:
            if (proverFailed) {
                err_ << "Compilation worked but failed to prove and verify with barretenberg backend for "
                     << name << "! Please try again.";
            } else {
                err_ << "Failed to execute " << name << "! Please try again.";
            }
            break;
        case ModeKind::Test:
            err_ << "Testing of " << name << " failed! Please try again. See the output above ^";
            break;
    }
    err_ << kReset << "\n";
    if (proverFailed) {
        err_ << "Are you sure you installed barretenberg properly ?\n";
    }
    err_.flush();
}

bool Orchestrator::reset(const Exercise& exercise) {
    CommandResult result = runCommand({vcsProgram_, "stash", "--", exercise.path.string()});
    if (!result.succeeded()) {
        LOG_WARN("Reset failed for " + exercise.name + ": " + result.err);
        err_ << "Failed to reset " << display(exercise) << ": " << result.err << "\n";
        return false;
    }
    LOG_INFO("Reset " + exercise.name);
    return true;
}

} // namespace noirlings
