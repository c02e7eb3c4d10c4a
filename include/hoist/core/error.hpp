// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace hoist::core {

enum class UploadErrc {
    success = 0,
    no_chunks,
    invalid_chunk_size,
    invalid_offset,
    invalid_config,
    start_out_of_range,
    transfer_failed,
    retries_exhausted,
    worker_crashed,
    all_chunks_failed,
    partial_failure,
    interrupted,
    invalid_destination,
    http_error,
};

namespace detail {

struct UploadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hoist::upload";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<UploadErrc>(ev)) {
            case UploadErrc::success:             return "Success";
            case UploadErrc::no_chunks:           return "No chunks to upload";
            case UploadErrc::invalid_chunk_size:  return "Chunk size must be positive";
            case UploadErrc::invalid_offset:      return "Offset is outside the payload";
            case UploadErrc::invalid_config:      return "Invalid upload configuration";
            case UploadErrc::start_out_of_range:  return "Start chunk index exceeds total chunks";
            case UploadErrc::transfer_failed:     return "Chunk transfer failed";
            case UploadErrc::retries_exhausted:   return "Retries exhausted";
            case UploadErrc::worker_crashed:      return "Upload worker crashed";
            case UploadErrc::all_chunks_failed:   return "All chunks failed";
            case UploadErrc::partial_failure:     return "Some chunks failed";
            case UploadErrc::interrupted:         return "Upload interrupted";
            case UploadErrc::invalid_destination: return "Invalid destination";
            case UploadErrc::http_error:          return "HTTP error response";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::UploadErrcCategory& upload_errc_category() noexcept {
    static detail::UploadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(UploadErrc e) noexcept {
    return {static_cast<int>(e), upload_errc_category()};
}

} // namespace hoist::core

namespace std {

template<>
struct is_error_code_enum<hoist::core::UploadErrc> : true_type {};

} // namespace std
