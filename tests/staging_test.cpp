/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "noirlings/errors.hpp"
#include "noirlings/exercise.hpp"
#include "noirlings/staging.hpp"
#include "test_support.hpp"

using namespace noirlings;
using noirlings::testing::readFile;
using noirlings::testing::TempDir;
using noirlings::testing::writeFile;

TEST(StagingArea, CreatesLayoutAndCopiesSource) {
    TempDir dir;
    writeFile(dir / "exercises/intro1.nr", "fn main() {}\n");
    Exercise exercise{"intro1", dir / "exercises/intro1.nr", Mode::build(), ""};

    StagingArea staging(dir / "runner_crate");
    WorkingUnit unit = staging.stage(exercise);

    EXPECT_EQ(unit.root.string(), (dir / "runner_crate").string());
    EXPECT_EQ(unit.package, "runner_crate");
    EXPECT_EQ(readFile(staging.sourcePath()), "fn main() {}\n");
    EXPECT_NE(readFile(staging.manifestPath()).find("name = \"runner_crate\""), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(staging.inputPath()));
    EXPECT_EQ(unit.artifactPath().string(), (dir / "runner_crate" / "target" / "runner_crate.json").string());
}

TEST(StagingArea, OverwritesPreviousExercise) {
    TempDir dir;
    writeFile(dir / "a.nr", "fn main() { a() }\n");
    writeFile(dir / "b.nr", "fn main() { b() }\n");

    StagingArea staging(dir / "work");
    (void)staging.stage(Exercise{"a", dir / "a.nr", Mode::build(), ""});
    (void)staging.stage(Exercise{"b", dir / "b.nr", Mode::build(), ""});

    EXPECT_EQ(readFile(staging.sourcePath()), "fn main() { b() }\n");
}

TEST(StagingArea, KeepsExistingPackageManifest) {
    TempDir dir;
    writeFile(dir / "work/Nargo.toml", "[package]\nname = \"runner_crate\"\ntype = \"bin\"\ncompiler_version = \">=0.30\"\n");
    writeFile(dir / "a.nr", "fn main() {}\n");

    StagingArea staging(dir / "work");
    (void)staging.stage(Exercise{"a", dir / "a.nr", Mode::build(), ""});

    EXPECT_NE(readFile(staging.manifestPath()).find("compiler_version"), std::string::npos);
}

TEST(StagingArea, WritesInlinedInputs) {
    TempDir dir;
    writeFile(dir / "a.nr", "fn main(x: Field) {}\n");
    ConfigPayload inputs = ConfigPayload::inlined("x = \"1\"\n");

    StagingArea staging(dir / "work");
    (void)staging.stage(Exercise{"a", dir / "a.nr", Mode::execute(inputs), ""}, inputs);

    EXPECT_EQ(readFile(staging.inputPath()), "x = \"1\"\n");
    EXPECT_EQ(staging.inputPath().filename().string(), "Prover.toml");
}

TEST(StagingArea, CopiesReferencedInputs) {
    TempDir dir;
    writeFile(dir / "a.nr", "fn main(x: Field) {}\n");
    writeFile(dir / "inputs.toml", "x = \"7\"\n");
    ConfigPayload inputs = ConfigPayload::referenced(dir / "inputs.toml");

    StagingArea staging(dir / "work");
    (void)staging.stage(Exercise{"a", dir / "a.nr", Mode::execute(inputs), ""}, inputs);

    EXPECT_EQ(readFile(staging.inputPath()), "x = \"7\"\n");
}

TEST(StagingArea, MissingSourceIsAStagingError) {
    TempDir dir;
    StagingArea staging(dir / "work");
    EXPECT_THROW((void)staging.stage(Exercise{"a", dir / "missing.nr", Mode::build(), ""}), StagingError);
}

TEST(StagingArea, MissingReferencedInputIsAConfigReadError) {
    TempDir dir;
    writeFile(dir / "a.nr", "fn main() {}\n");
    ConfigPayload inputs = ConfigPayload::referenced(dir / "nope.toml");

    StagingArea staging(dir / "work");
    EXPECT_THROW((void)staging.stage(Exercise{"a", dir / "a.nr", Mode::execute(inputs), ""}, inputs),
                 ConfigReadError);
}

TEST(StagingArea, UncreatableWorkingAreaIsAStagingError) {
    TempDir dir;
    writeFile(dir / "blocker", "a regular file where a directory should go");
    writeFile(dir / "a.nr", "fn main() {}\n");

    StagingArea staging(dir / "blocker" / "work");
    EXPECT_THROW((void)staging.stage(Exercise{"a", dir / "a.nr", Mode::build(), ""}), StagingError);
}

TEST(StagingArea, UnresolvableSourcePathIsAStagingError) {
    TempDir dir;
    // Self-referencing link: resolving anything beneath it fails with ELOOP.
    std::filesystem::create_symlink("loop", dir / "loop");
    Exercise exercise{"intro1", dir / "loop" / "intro1.nr", Mode::build(), ""};

    StagingArea staging(dir / "runner_crate");
    EXPECT_THROW((void)staging.stage(exercise), StagingError);
}
