// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/core/failed_manifest.hpp>
#include <hoist/io/error.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace hoist::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::string FailedManifest::default_path(std::string_view file_path) {
    return std::string(file_path) + ".failed";
}

std::string FailedManifest::to_string() const {
    std::string out;
    for (std::size_t i = 0; i < chunk_ids.size(); ++i) {
        if (i > 0) out += ',';
        out += std::to_string(chunk_ids[i]);
    }
    return out;
}

std::expected<FailedManifest, std::error_code>
FailedManifest::parse(std::string_view text) {
    FailedManifest manifest;

    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = trim(text.substr(0, comma));
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

        if (token.empty()) continue;

        std::uint32_t id = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), id);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            spdlog::error("manifest: bad chunk id '{}'", token);
            return std::unexpected(make_error_code(io::IoErrc::manifest_malformed));
        }
        manifest.chunk_ids.push_back(id);
    }

    return manifest;
}

std::error_code FailedManifest::save(std::string_view path) const noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::ofstream file(p, std::ios::trunc);
        if (!file) {
            return make_error_code(io::IoErrc::write_error);
        }

        file << to_string() << '\n';
        file.flush();
        if (!file) {
            return make_error_code(io::IoErrc::write_error);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("manifest: cannot write {}: {}", path, e.what());
        return make_error_code(io::IoErrc::write_error);
    }
}

std::expected<FailedManifest, std::error_code>
FailedManifest::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::filesystem::path(path)};
        if (!file) {
            return std::unexpected(make_error_code(io::IoErrc::file_not_found));
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        return parse(contents.str());
    } catch (const std::exception& e) {
        spdlog::error("manifest: cannot read {}: {}", path, e.what());
        return std::unexpected(make_error_code(io::IoErrc::read_error));
    }
}

bool FailedManifest::exists(std::string_view path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec);
}

void FailedManifest::remove(std::string_view path) noexcept {
    std::error_code ec;
    std::filesystem::remove(std::filesystem::path(path), ec);
    if (ec) {
        spdlog::debug("manifest: remove {} failed: {}", path, ec.message());
    }
}

} // namespace hoist::core
