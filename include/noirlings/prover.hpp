/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "noirlings/types.hpp"

namespace noirlings {

// Proving backend, run out of process.
class ProverService {
public:
    virtual ~ProverService() = default;

    [[nodiscard]] virtual ToolResult prove(const std::filesystem::path& artifact,
                                           const std::filesystem::path& witness,
                                           const std::filesystem::path& proofOut) = 0;
    [[nodiscard]] virtual ToolResult writeVerificationKey(const std::filesystem::path& artifact,
                                                          const std::filesystem::path& vkOut) = 0;
    [[nodiscard]] virtual ToolResult verify(const std::filesystem::path& vk,
                                            const std::filesystem::path& proof) = 0;
};

// Barretenberg's bb command line:
//   bb prove -b <artifact> -w <witness> -o <proof>
//   bb write_vk -b <artifact> -o <vk>
//   bb verify -k <vk> -p <proof>
class BbProver final : public ProverService {
public:
    explicit BbProver(std::string program = "bb");

    [[nodiscard]] ToolResult prove(const std::filesystem::path& artifact,
                                   const std::filesystem::path& witness,
                                   const std::filesystem::path& proofOut) override;
    [[nodiscard]] ToolResult writeVerificationKey(const std::filesystem::path& artifact,
                                                  const std::filesystem::path& vkOut) override;
    [[nodiscard]] ToolResult verify(const std::filesystem::path& vk,
                                    const std::filesystem::path& proof) override;

private:
    std::string program_;
};

} // namespace noirlings
