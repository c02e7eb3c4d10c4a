// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace hoist::io {

// Local resource failures: temp files, manifests, config files, child processes.
// Never retried by the uploaders.
enum class IoErrc {
    success = 0,
    file_not_found,
    read_error,
    write_error,
    temp_file_failed,
    spawn_failed,
    manifest_malformed,
    config_malformed,
};

namespace detail {

struct IoErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hoist::io";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<IoErrc>(ev)) {
            case IoErrc::success:            return "Success";
            case IoErrc::file_not_found:     return "File not found";
            case IoErrc::read_error:         return "Read error";
            case IoErrc::write_error:        return "Write error";
            case IoErrc::temp_file_failed:   return "Temporary file could not be prepared";
            case IoErrc::spawn_failed:       return "Could not run transfer command";
            case IoErrc::manifest_malformed: return "Malformed chunk manifest";
            case IoErrc::config_malformed:   return "Malformed configuration file";
            default:                         return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::IoErrcCategory& io_errc_category() noexcept {
    static detail::IoErrcCategory category;
    return category;
}

inline std::error_code make_error_code(IoErrc e) noexcept {
    return {static_cast<int>(e), io_errc_category()};
}

} // namespace hoist::io

namespace std {

template<>
struct is_error_code_enum<hoist::io::IoErrc> : true_type {};

} // namespace std
