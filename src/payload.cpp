/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "noirlings/payload.hpp"
#include "noirlings/errors.hpp"
#include "noirlings/logger.hpp"
#include <fstream>
#include <iterator>
#include <utility>

namespace noirlings {

ConfigPayload::ConfigPayload(Kind kind, std::string text, std::filesystem::path path)
    : kind_(kind), text_(std::move(text)), path_(std::move(path)) {
}

ConfigPayload ConfigPayload::inlined(std::string text) {
    return ConfigPayload(Kind::Inlined, std::move(text), {});
}

ConfigPayload ConfigPayload::referenced(std::filesystem::path path) {
    return ConfigPayload(Kind::Referenced, {}, std::move(path));
}

std::string ConfigPayload::resolve() const {
    if (kind_ == Kind::Inlined) {
        return text_;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        LOG_ERROR("Unable to open input file: " + path_.string());
        throw ConfigReadError("We were unable to open the toml file: " + path_.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        LOG_ERROR("Unable to read input file: " + path_.string());
        throw ConfigReadError("We were unable to read the toml file: " + path_.string());
    }
    return content;
}

bool ConfigPayload::operator==(const ConfigPayload& other) const noexcept {
    return kind_ == other.kind_ && text_ == other.text_ && path_ == other.path_;
}

} // namespace noirlings
