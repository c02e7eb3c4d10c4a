// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/core/upload_config.hpp>
#include <hoist/io/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace hoist::core {

namespace {

// Apply recognised keys from a parsed document onto cfg
std::expected<UploadConfig, std::error_code>
apply_json(const nlohmann::json& j, UploadConfig cfg) {
    if (!j.is_object()) {
        return std::unexpected(make_error_code(io::IoErrc::config_malformed));
    }

    try {
        if (j.contains("max_retries")) {
            cfg.max_retries = j["max_retries"].get<std::uint32_t>();
        }

        if (j.contains("retry_delay_ms")) {
            cfg.retry_delay = std::chrono::milliseconds{j["retry_delay_ms"].get<std::uint64_t>()};
        }

        if (j.contains("max_concurrent")) {
            cfg.max_concurrent = j["max_concurrent"].get<std::uint32_t>();
        }

        if (j.contains("target_rate_mibs")) {
            cfg.target_rate_bps = j["target_rate_mibs"].get<double>() * MIB;
        }

        if (j.contains("auto_resume")) {
            cfg.auto_resume = j["auto_resume"].get<bool>();
        }

        if (j.contains("failed_manifest")) {
            cfg.failed_manifest_path = j["failed_manifest"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(make_error_code(io::IoErrc::config_malformed));
    }

    return cfg;
}

} // namespace

std::error_code UploadConfig::validate() const noexcept {
    if (max_retries == 0) {
        return make_error_code(UploadErrc::invalid_config);
    }
    if (!(target_rate_bps > 0.0) || std::isinf(target_rate_bps)) {
        return make_error_code(UploadErrc::invalid_config);
    }
    return {};
}

std::expected<UploadConfig, std::error_code>
parse_config(std::string_view json_text, UploadConfig base) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(make_error_code(io::IoErrc::config_malformed));
    }

    return apply_json(j, std::move(base));
}

std::expected<UploadConfig, std::error_code>
load_config(std::string_view path, UploadConfig base) {
    std::ifstream file{std::string(path)};
    if (!file) {
        return std::unexpected(make_error_code(io::IoErrc::file_not_found));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error_code(io::IoErrc::read_error));
    }

    return parse_config(contents.str(), std::move(base));
}

} // namespace hoist::core
