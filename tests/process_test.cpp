/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "noirlings/process.hpp"
#include "noirlings/scratch.hpp"
#include "test_support.hpp"

using namespace noirlings;
using noirlings::testing::TempDir;
using noirlings::testing::writeFile;

TEST(RunCommand, CapturesStdoutAndStderrSeparately) {
    CommandResult result = runCommand({"/bin/sh", "-c", "echo out; echo err 1>&2"});
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST(RunCommand, ReportsNonZeroExitStatus) {
    CommandResult result = runCommand({"/bin/sh", "-c", "echo broken 1>&2; exit 3"});
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.err, "broken\n");
}

TEST(RunCommand, MissingProgramIsNotLaunched) {
    CommandResult result = runCommand({"noirlings-definitely-not-installed"});
    EXPECT_FALSE(result.launched);
    EXPECT_EQ(result.exitCode, 127);
    EXPECT_FALSE(result.err.empty());
}

TEST(RunCommand, RunsInTheGivenDirectory) {
    TempDir dir;
    writeFile(dir / "marker.txt", "here");
    CommandResult result = runCommand({"/bin/sh", "-c", "cat marker.txt"}, dir.path());
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.out, "here");
}

TEST(RunCommand, HandlesOutputLargerThanAPipeBuffer) {
    CommandResult result = runCommand({"/bin/sh", "-c",
        "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo abcdefghij 1>&2; i=$((i+1)); done"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.out.size(), 20000u * 11u);
    EXPECT_EQ(result.err.size(), 20000u * 11u);
}

TEST(FormatCommand, JoinsArgumentsWithSpaces) {
    EXPECT_EQ(formatCommand({"bb", "verify", "-k", "vk"}), "bb verify -k vk");
}

TEST(ScratchFile, NameCombinesProcessAndThread) {
    const std::string name = ScratchFile::uniqueName();
    EXPECT_EQ(name.rfind("temp_" + std::to_string(::getpid()) + "_", 0), 0u);
    EXPECT_EQ(name, ScratchFile::uniqueName());
}

TEST(ScratchFile, RemovedWhenScopeExits) {
    TempDir dir;
    std::filesystem::path path;
    {
        ScratchFile scratch(dir.path());
        path = scratch.path();
        writeFile(path, "vk");
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScratchFile, NeverCreatedIsFine) {
    TempDir dir;
    {
        ScratchFile scratch(dir.path());
        EXPECT_FALSE(std::filesystem::exists(scratch.path()));
    }
    SUCCEED();
}
