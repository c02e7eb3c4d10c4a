// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/config.hpp>
#include <hoist/core/upload_config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoist::cli {

// CLI result: process exit code, or the error that stopped the run early
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string destination;
    std::string operation;
    std::string file;

    std::size_t offset{0};        // Byte offset into the file
    std::size_t chunk_offset{0};  // Chunk index to resume from
    std::size_t chunk_size{core::DEFAULT_CHUNK_SIZE};
    std::string network;
    bool auto_resume{false};
    bool parallel{false};

    // Unset means "config file or built-in default"
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint32_t> max_concurrent;
    std::optional<double> target_rate_mibs;

    std::string retry_chunks;  // Failed-chunk manifest to retry
    std::string command;       // External transfer command template
    std::string config_path;

    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};

    std::string error;  // First parse problem, empty if none
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Config file overlay, then command line overrides, then validation
[[nodiscard]] std::expected<core::UploadConfig, std::error_code>
build_config(const CliArgs& args);

// Command line that resumes a sequential run at `chunk_index`
[[nodiscard]] std::string resume_hint(std::string_view program_name,
                                      const CliArgs& args,
                                      std::size_t chunk_index);

// Command line that retries exactly the chunks listed in `manifest_path`
[[nodiscard]] std::string retry_hint(std::string_view program_name,
                                     const CliArgs& args,
                                     std::string_view manifest_path);

// Command line that reruns a parallel upload in which every chunk failed
[[nodiscard]] std::string rerun_hint(std::string_view program_name, const CliArgs& args);

// Console logger: pattern plus level from --verbose / --quiet
void setup_logging(bool verbose, bool quiet);

// Run one upload as described by `args`
[[nodiscard]] CliResult upload(std::string_view program_name, const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace hoist::cli
