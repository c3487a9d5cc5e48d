/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/config.hpp"
#include "noirlings/errors.hpp"
#include "noirlings/exercise.hpp"
#include "noirlings/logger.hpp"
#include "noirlings/orchestrator.hpp"
#include "noirlings/prover.hpp"
#include "noirlings/staging.hpp"
#include "noirlings/toolkit.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace noirlings;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "noirlings Exercise Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] list\n";
    std::cout << "       " << progName << " [options] run <exercise>\n";
    std::cout << "       " << progName << " [options] verify\n";
    std::cout << "       " << progName << " [options] hint <exercise>\n";
    std::cout << "       " << progName << " [options] reset <exercise>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list          Show every exercise and whether it looks done\n";
    std::cout << "  run           Build/execute/prove/test one exercise\n";
    std::cout << "  verify        Run exercises in order, stopping at the first unfinished one\n";
    std::cout << "  hint          Print the hint of an exercise\n";
    std::cout << "  reset         Discard local edits to an exercise (git stash)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --manifest <path>   Exercise manifest (default: info.json)\n";
    std::cout << "  --workspace <dir>   Working package directory (default: runner_crate)\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  NOIRLINGS_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  NOIRLINGS_MANIFEST     Manifest path\n";
    std::cout << "  NOIRLINGS_WORKSPACE    Working package directory\n";
    std::cout << "  NOIRLINGS_NARGO        nargo executable (default: nargo)\n";
    std::cout << "  NOIRLINGS_BB           bb executable (default: bb)\n";
    std::cout << "  NOIRLINGS_GIT          git executable (default: git)\n";
}

void printPending(const Exercise& exercise, const CompletionState& state) {
    std::cout << "\n\033[1mYou can keep working on this exercise,\033[0m\n";
    std::cout << "or jump into the next one by removing the `I AM NOT DONE` comment:\n\n";
    for (const auto& line : state.context) {
        std::cout << std::setw(4) << line.number << " |  ";
        if (line.isMarker) {
            std::cout << "\033[1m" << line.text << "\033[0m\n";
        } else {
            std::cout << line.text << "\n";
        }
    }
    std::cout << "\n  " << exercise << "\n";
}

std::optional<Exercise> requireExercise(const ExerciseList& list, const std::string& name) {
    auto exercise = list.find(name);
    if (!exercise) {
        std::cerr << "Error: No exercise found for '" << name << "'!\n";
    }
    return exercise;
}

int listExercises(const ExerciseList& list) {
    std::cout << std::left << std::setw(24) << "Name" << std::setw(48) << "Path" << "Status\n";
    std::size_t done = 0;
    for (const auto& exercise : list.exercises()) {
        bool looksDone = exercise.looksDone();
        if (looksDone) ++done;
        std::cout << std::left << std::setw(24) << exercise.name
                  << std::setw(48) << exercise.path.string()
                  << (looksDone ? "\033[32mDone\033[0m" : "\033[33mPending\033[0m") << "\n";
    }
    std::cout << "\nProgress: " << done << "/" << list.size() << " exercises look done\n";
    return 0;
}

int verifyExercises(const ExerciseList& list, Orchestrator& orchestrator) {
    for (const auto& exercise : list.exercises()) {
        PipelineOutcome outcome = orchestrator.run(exercise);
        if (!outcome) {
            return 1;
        }
        CompletionState state = exercise.state();
        if (!state.done) {
            printPending(exercise, state);
            return 1;
        }
    }
    std::cout << "\n\033[32mAll exercises completed!\033[0m\n";
    return 0;
}

int main(int argc, char* argv[]) {
    // Default to WARN for a clean report; NOIRLINGS_LOG_LEVEL overrides
    if (!std::getenv("NOIRLINGS_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    Settings settings = Settings::fromEnv();
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--manifest" || arg == "--workspace") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a path\n";
                return 1;
            }
            if (arg == "--manifest") {
                settings.manifest = argv[++i];
            } else {
                settings.workspace = argv[++i];
            }
            continue;
        }
        positional.push_back(arg);
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    const bool needsName = command == "run" || command == "hint" || command == "reset";
    if (needsName && positional.size() < 2) {
        std::cerr << "Error: " << command << " requires an exercise name\n";
        return 1;
    }

    try {
        ExerciseList list = ExerciseList::load(settings.manifest);

        if (command == "list") {
            return listExercises(list);
        }

        if (command == "hint") {
            auto exercise = requireExercise(list, positional[1]);
            if (!exercise) return 1;
            std::cout << exercise->hint << "\n";
            return 0;
        }

        StagingArea staging(settings.workspace);
        NargoToolkit toolkit(settings.nargo);
        BbProver prover(settings.bb);
        Orchestrator orchestrator(staging, toolkit, prover);
        orchestrator.setVcsProgram(settings.git);

        if (command == "run") {
            auto exercise = requireExercise(list, positional[1]);
            if (!exercise) return 1;
            return orchestrator.run(*exercise) ? 0 : 1;
        }

        if (command == "reset") {
            auto exercise = requireExercise(list, positional[1]);
            if (!exercise) return 1;
            if (!orchestrator.reset(*exercise)) return 1;
            std::cout << "The file " << *exercise << " has been reset!\n";
            return 0;
        }

        if (command == "verify") {
            return verifyExercises(list, orchestrator);
        }

        std::cerr << "Error: Unknown command '" << command << "'\n";
        printUsage(argv[0]);
        return 1;

    } catch (const ModeDecodeError& e) {
        std::cerr << "Error: invalid exercise mode: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
