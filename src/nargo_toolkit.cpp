/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/toolkit.hpp"
#include "noirlings/logger.hpp"
#include "noirlings/process.hpp"
#include "noirlings/scratch.hpp"
#include <algorithm>
#include <regex>
#include <sstream>
#include <system_error>
#include <utility>

namespace noirlings {

namespace {

std::string failureText(const CommandResult& result) {
    if (!result.err.empty()) return result.err;
    if (!result.out.empty()) return result.out;
    return "exit status " + std::to_string(result.exitCode);
}

} // namespace

NargoToolkit::NargoToolkit(std::string program)
    : program_(std::move(program)) {
}

ToolResult NargoToolkit::compile(const WorkingUnit& unit) {
    CommandResult result = runCommand({program_, "compile", "--package", unit.package}, unit.root);
    if (!result.succeeded()) {
        return ToolResult::failure("Failed to compile the program: " + failureText(result));
    }
    return ToolResult::success();
}

ExecuteResult NargoToolkit::execute(const WorkingUnit& unit, const std::string& inputName) {
    ExecuteResult execution;

    // nargo writes target/<name>.gz; saveWitness gives it its final name.
    const std::string witnessName = ScratchFile::uniqueName();
    CommandResult result = runCommand(
        {program_, "execute", "--package", unit.package, "--prover-name", inputName, witnessName},
        unit.root);
    if (!result.succeeded()) {
        execution.error = "Failed to execute the program: " + failureText(result);
        return execution;
    }

    execution.ok = true;
    execution.output = result.out;
    execution.returnValue = parseReturnValue(result.out);
    execution.witness.path = unit.targetDir() / (witnessName + ".gz");
    LOG_DEBUG("[" + unit.package + "] Circuit witness successfully solved");
    return execution;
}

SaveResult NargoToolkit::saveWitness(const Witness& witness, const std::string& exerciseName,
                                     const std::filesystem::path& targetDir) {
    SaveResult saved;
    std::error_code ec;
    std::filesystem::create_directories(targetDir, ec);
    if (ec) {
        saved.error = "Unable to create " + targetDir.string() + ": " + ec.message();
        return saved;
    }

    const auto destination = targetDir / (exerciseName + ".gz");
    std::filesystem::rename(witness.path, destination, ec);
    if (ec) {
        // rename fails across filesystems; fall back to a copy
        ec.clear();
        std::filesystem::copy_file(witness.path, destination,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            saved.error = "Unable to save witness to " + destination.string() + ": " + ec.message();
            return saved;
        }
        std::filesystem::remove(witness.path, ec);
    }

    saved.ok = true;
    saved.path = destination;
    return saved;
}

TestRunResult NargoToolkit::runTests(const WorkingUnit& unit, const std::string& packageFilter) {
    TestRunResult report;
    CommandResult result = runCommand({program_, "test", "--package", packageFilter}, unit.root);

    report.output = result.out;
    report.cases = parseTestReport(result.out + "\n" + result.err);

    if (!result.launched || (!result.succeeded() && report.cases.empty())) {
        report.error = "Failed to run the tests: " + failureText(result);
        return report;
    }

    // Non-zero exit with no FAIL line: nargo stopped mid-suite.
    const bool anyFailed = std::any_of(report.cases.begin(), report.cases.end(),
                                       [](const TestCase& testCase) { return !testCase.passed; });
    if (!result.succeeded() && !anyFailed) {
        report.error = "Failed to run the tests: " + failureText(result);
        return report;
    }

    report.ok = true;
    return report;
}

std::optional<std::string> NargoToolkit::parseReturnValue(const std::string& output) {
    static const std::regex outputLine(R"(Circuit output:\s*(.*\S))");
    std::smatch match;
    if (std::regex_search(output, match, outputLine)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::vector<TestCase> NargoToolkit::parseTestReport(const std::string& output) {
    static const std::regex testLine(R"(Testing\s+(\S+)\s*\.\.\.\s*(ok|FAIL|failed))",
                                     std::regex::icase);
    std::vector<TestCase> cases;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_search(line, match, testLine)) {
            std::string status = match[2].str();
            cases.push_back({match[1].str(), status == "ok" || status == "OK"});
        }
    }
    return cases;
}

} // namespace noirlings
