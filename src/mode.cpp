/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/mode.hpp"
#include "noirlings/errors.hpp"
#include "noirlings/logger.hpp"

namespace noirlings {

namespace {

std::string describe(const nlohmann::json& value) {
    return std::string(value.type_name());
}

Mode decodeTag(const std::string& tag) {
    if (tag == "build") return Mode::build();
    if (tag == "test") return Mode::test();
    throw ModeDecodeError(ModeDecodeErrorKind::UnknownModeTag,
        "unknown mode `" + tag + "`, expected one of `build`, `test`");
}

Mode decodeProveAndVerify(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
            "`proveAndVerify` expects a map, got " + describe(value));
    }

    for (const auto& item : value.items()) {
        if (item.key() != "tomlFile" && item.key() != "saveFiles") {
            throw ModeDecodeError(ModeDecodeErrorKind::UnknownModeField,
                "unknown field `" + item.key() + "`, expected `tomlFile` or `saveFiles`");
        }
    }

    auto tomlFile = value.find("tomlFile");
    if (tomlFile == value.end()) {
        throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
            "`proveAndVerify` is missing `tomlFile`");
    }
    auto saveFiles = value.find("saveFiles");
    if (saveFiles == value.end() || !saveFiles->is_boolean()) {
        throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
            "`proveAndVerify` requires a boolean `saveFiles`");
    }

    return Mode::proveAndVerify(decodePayload(*tomlFile), saveFiles->get<bool>());
}

Mode decodeMap(const nlohmann::json& value) {
    if (value.size() != 1) {
        throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
            "a mode map must have exactly one key, got " + std::to_string(value.size()));
    }

    auto entry = value.begin();
    const std::string& key = entry.key();
    if (key == "execute") return Mode::execute(decodePayload(entry.value()));
    if (key == "proveOnly") return Mode::proveOnly(decodePayload(entry.value()));
    if (key == "proveAndVerify") return decodeProveAndVerify(entry.value());

    throw ModeDecodeError(ModeDecodeErrorKind::UnknownModeField,
        "unknown field `" + key + "`, expected one of `execute`, `proveOnly`, `proveAndVerify`");
}

} // namespace

ConfigPayload decodePayload(const nlohmann::json& value) {
    if (!value.is_object() || value.size() != 1) {
        throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
            "expected a map with either an `inlined` or a `path` key");
    }

    auto entry = value.begin();
    const std::string& key = entry.key();
    if (key != "inlined" && key != "path") {
        throw ModeDecodeError(ModeDecodeErrorKind::UnknownModeField,
            "unknown field `" + key + "`, expected `inlined` or `path`");
    }
    if (!entry.value().is_string()) {
        throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
            "`" + key + "` must be a string, got " + describe(entry.value()));
    }

    auto text = entry.value().get<std::string>();
    if (key == "inlined") {
        return ConfigPayload::inlined(std::move(text));
    }
    return ConfigPayload::referenced(std::move(text));
}

Mode decodeMode(const nlohmann::json& value) {
    if (value.is_string()) {
        return decodeTag(value.get<std::string>());
    }
    if (value.is_object()) {
        return decodeMap(value);
    }

    LOG_DEBUG("Rejecting mode value of type " + describe(value));
    throw ModeDecodeError(ModeDecodeErrorKind::InvalidModeShape,
        "a mode must be a string or a map, got " + describe(value));
}

const char* modeKindToString(ModeKind kind) noexcept {
    switch (kind) {
        case ModeKind::Build: return "build";
        case ModeKind::Execute: return "execute";
        case ModeKind::ProveOnly: return "proveOnly";
        case ModeKind::ProveAndVerify: return "proveAndVerify";
        case ModeKind::Test: return "test";
        default: return "unknown";
    }
}

} // namespace noirlings
