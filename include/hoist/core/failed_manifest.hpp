// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace hoist::core {

// Failed-chunk manifest: plain text, comma-separated decimal chunk IDs ("1,3").
// Written on partial failure, read back to restrict a retry to exactly those IDs.
struct FailedManifest {
    std::vector<std::uint32_t> chunk_ids;

    // "<file>.failed"
    [[nodiscard]] static std::string default_path(std::string_view file_path);

    [[nodiscard]] std::string to_string() const;

    // Whitespace and empty tokens are ignored; anything non-numeric is malformed
    [[nodiscard]] static std::expected<FailedManifest, std::error_code>
    parse(std::string_view text);

    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    [[nodiscard]] static std::expected<FailedManifest, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static bool exists(std::string_view path) noexcept;

    static void remove(std::string_view path) noexcept;
};

} // namespace hoist::core
