/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/prover.hpp"
#include "noirlings/logger.hpp"
#include "noirlings/process.hpp"
#include <utility>

namespace noirlings {

namespace {

ToolResult toToolResult(const CommandResult& result, const char* failure) {
    if (result.succeeded()) {
        return ToolResult::success(result.out);
    }
    std::string detail = result.err.empty() ? "exit status " + std::to_string(result.exitCode) : result.err;
    return ToolResult::failure(std::string(failure) + ": " + detail);
}

} // namespace

BbProver::BbProver(std::string program)
    : program_(std::move(program)) {
}

ToolResult BbProver::prove(const std::filesystem::path& artifact,
                           const std::filesystem::path& witness,
                           const std::filesystem::path& proofOut) {
    LOG_INFO("Creating proof with barretenberg");
    return toToolResult(
        runCommand({program_, "prove", "-b", artifact.string(), "-w", witness.string(), "-o", proofOut.string()}),
        "Failed to prove the program");
}

ToolResult BbProver::writeVerificationKey(const std::filesystem::path& artifact,
                                          const std::filesystem::path& vkOut) {
    LOG_INFO("Exporting verification key with barretenberg (bb)");
    return toToolResult(
        runCommand({program_, "write_vk", "-b", artifact.string(), "-o", vkOut.string()}),
        "Failed to verify the program");
}

ToolResult BbProver::verify(const std::filesystem::path& vk, const std::filesystem::path& proof) {
    LOG_INFO("Verifying proof with barretenberg (bb)");
    return toToolResult(
        runCommand({program_, "verify", "-k", vk.string(), "-p", proof.string()}),
        "Failed to verify the program");
}

} // namespace noirlings
