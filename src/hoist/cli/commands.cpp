// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/cli/commands.hpp>
#include <hoist/cli/progress_bar.hpp>
#include <hoist/core/chunker.hpp>
#include <hoist/core/error.hpp>
#include <hoist/core/failed_manifest.hpp>
#include <hoist/core/parallel_scheduler.hpp>
#include <hoist/core/sequential_uploader.hpp>
#include <hoist/io/error.hpp>
#include <hoist/store/chunk_store.hpp>
#include <hoist/transfer/command_transfer.hpp>
#include <hoist/transfer/http_transfer.hpp>
#include <hoist/transfer/url.hpp>
#include <hoist/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>

namespace hoist::cli {

using core::UploadErrc;

namespace {

constexpr std::string_view MEM_SCHEME = "mem://";

template<typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool parse_rate(const char* text, double& out) noexcept {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0';
}

// Quote only when the shell would otherwise split or expand the value
std::string quote_arg(std::string_view value) {
    bool plain = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || std::string_view("_-./:=@,+%").find(static_cast<char>(c)) != std::string_view::npos;
    });
    return plain ? std::string(value) : transfer::CommandTransfer::shell_quote(value);
}

// Positional arguments plus the options that shape the chunk sequence
std::string base_command(std::string_view program_name, const CliArgs& args) {
    std::string cmd = fmt::format("{} {} {} {}", program_name, quote_arg(args.destination),
                                  quote_arg(args.operation), quote_arg(args.file));
    if (args.offset > 0) {
        cmd += fmt::format(" --offset {}", args.offset);
    }
    if (args.chunk_size != core::DEFAULT_CHUNK_SIZE) {
        cmd += fmt::format(" --chunk-size {}", args.chunk_size);
    }
    if (!args.network.empty()) {
        cmd += fmt::format(" --network {}", quote_arg(args.network));
    }
    if (!args.command.empty()) {
        cmd += fmt::format(" --command {}", quote_arg(args.command));
    }
    if (!args.config_path.empty()) {
        cmd += fmt::format(" --config {}", quote_arg(args.config_path));
    }
    return cmd;
}

std::expected<core::Bytes, std::error_code> read_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error_code(io::IoErrc::file_not_found));
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::unexpected(make_error_code(io::IoErrc::read_error));
    }

    auto size = file.tellg();
    if (size < 0) {
        return std::unexpected(make_error_code(io::IoErrc::read_error));
    }
    file.seekg(0);

    core::Bytes data(static_cast<std::size_t>(size));
    if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return std::unexpected(make_error_code(io::IoErrc::read_error));
    }
    return data;
}

// Owns curl's global state for the duration of an HTTP upload
struct CurlGlobal {
    CurlGlobal() { transfer::HttpTransfer::global_init(); }
    ~CurlGlobal() { transfer::HttpTransfer::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Byte-level progress fed from worker threads
class ProgressReporter {
public:
    explicit ProgressReporter(std::uint64_t total)
        : bar_(total, "Uploading")
        , start_(std::chrono::steady_clock::now()) {}

    void add(std::size_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_ += bytes;
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        double rate = elapsed.count() > 0.0 ? static_cast<double>(sent_) / elapsed.count() : 0.0;
        bar_.update(sent_, rate);
    }

    void finish(bool ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) {
            bar_.finish();
        } else {
            bar_.clear();
        }
    }

private:
    std::mutex mutex_;
    ProgressBar bar_;
    std::uint64_t sent_{0};
    std::chrono::steady_clock::time_point start_;
};

core::Bytes concatenate(std::span<const core::ChunkInfo> chunks) {
    core::Bytes out;
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    }
    return out;
}

// True when a sequential failure came from a chunk upload rather than setup
bool reached_transfer(std::error_code ec) {
    return ec != UploadErrc::no_chunks
        && ec != UploadErrc::start_out_of_range
        && ec != UploadErrc::invalid_config;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    std::vector<std::string> positional;

    auto fail = [&](std::string message) {
        if (args.error.empty()) {
            args.error = std::move(message);
        }
    };

    auto value_of = [&](int& i, const std::string& name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        fail(fmt::format("missing value for {}", name));
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-a" || arg == "--autoresume") {
            args.auto_resume = true;
        } else if (arg == "-p" || arg == "--parallel") {
            args.parallel = true;
        } else if (arg == "-o" || arg == "--offset") {
            if (const char* v = value_of(i, arg); v && !parse_number(v, args.offset)) {
                fail(fmt::format("invalid byte offset '{}'", v));
            }
        } else if (arg == "--chunk-offset") {
            if (const char* v = value_of(i, arg); v && !parse_number(v, args.chunk_offset)) {
                fail(fmt::format("invalid chunk offset '{}'", v));
            }
        } else if (arg == "--chunk-size") {
            if (const char* v = value_of(i, arg); v) {
                if (!parse_number(v, args.chunk_size) || args.chunk_size == 0) {
                    fail(fmt::format("invalid chunk size '{}'", v));
                }
            }
        } else if (arg == "--max-retries") {
            if (const char* v = value_of(i, arg); v) {
                std::uint32_t n = 0;
                if (parse_number(v, n)) {
                    args.max_retries = n;
                } else {
                    fail(fmt::format("invalid retry count '{}'", v));
                }
            }
        } else if (arg == "--max-concurrent") {
            if (const char* v = value_of(i, arg); v) {
                std::uint32_t n = 0;
                if (parse_number(v, n)) {
                    args.max_concurrent = n;
                } else {
                    fail(fmt::format("invalid concurrency '{}'", v));
                }
            }
        } else if (arg == "--target-rate") {
            if (const char* v = value_of(i, arg); v) {
                double rate = 0.0;
                if (parse_rate(v, rate)) {
                    args.target_rate_mibs = rate;
                } else {
                    fail(fmt::format("invalid target rate '{}'", v));
                }
            }
        } else if (arg == "-n" || arg == "--network") {
            if (const char* v = value_of(i, arg)) args.network = v;
        } else if (arg == "--retry-chunks") {
            if (const char* v = value_of(i, arg)) args.retry_chunks = v;
        } else if (arg == "--command") {
            if (const char* v = value_of(i, arg)) args.command = v;
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value_of(i, arg)) args.config_path = v;
        } else if (arg.size() > 1 && arg.front() == '-') {
            fail(fmt::format("unknown option '{}'", arg));
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.size() > 3) {
        fail(fmt::format("unexpected argument '{}'", positional[3]));
    } else if (positional.size() < 3) {
        fail("expected <DESTINATION> <OPERATION> <FILE>");
    } else {
        args.destination = positional[0];
        args.operation = positional[1];
        args.file = positional[2];
    }

    return args;
}

std::expected<core::UploadConfig, std::error_code> build_config(const CliArgs& args) {
    core::UploadConfig config;

    if (!args.config_path.empty()) {
        auto loaded = core::load_config(args.config_path, config);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.max_retries) config.max_retries = *args.max_retries;
    if (args.max_concurrent) config.max_concurrent = *args.max_concurrent;
    if (args.target_rate_mibs) config.target_rate_bps = *args.target_rate_mibs * core::MIB;
    if (args.auto_resume) config.auto_resume = true;

    if (config.failed_manifest_path.empty() && !args.file.empty()) {
        config.failed_manifest_path = core::FailedManifest::default_path(args.file);
    }

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

std::string resume_hint(std::string_view program_name, const CliArgs& args, std::size_t chunk_index) {
    std::string cmd = base_command(program_name, args);
    if (!args.retry_chunks.empty()) {
        cmd += fmt::format(" --retry-chunks {}", quote_arg(args.retry_chunks));
    }
    cmd += fmt::format(" --chunk-offset {} --autoresume", chunk_index);
    if (args.max_retries) {
        cmd += fmt::format(" --max-retries {}", *args.max_retries);
    }
    return cmd;
}

std::string retry_hint(std::string_view program_name, const CliArgs& args, std::string_view manifest_path) {
    std::string cmd = base_command(program_name, args);
    cmd += fmt::format(" --parallel --retry-chunks {}", quote_arg(manifest_path));
    if (args.max_concurrent) {
        cmd += fmt::format(" --max-concurrent {}", *args.max_concurrent);
    }
    if (args.target_rate_mibs) {
        cmd += fmt::format(" --target-rate {}", *args.target_rate_mibs);
    }
    return cmd;
}

std::string rerun_hint(std::string_view program_name, const CliArgs& args) {
    std::string cmd = base_command(program_name, args);
    cmd += " --parallel";
    if (!args.retry_chunks.empty()) {
        cmd += fmt::format(" --retry-chunks {}", quote_arg(args.retry_chunks));
    }
    if (args.chunk_offset > 0) {
        cmd += fmt::format(" --chunk-offset {}", args.chunk_offset);
    }
    if (args.max_retries) {
        cmd += fmt::format(" --max-retries {}", *args.max_retries);
    }
    if (args.max_concurrent) {
        cmd += fmt::format(" --max-concurrent {}", *args.max_concurrent);
    }
    if (args.target_rate_mibs) {
        cmd += fmt::format(" --target-rate {}", *args.target_rate_mibs);
    }
    return cmd;
}

void setup_logging(bool verbose, bool quiet) {
    auto logger = spdlog::get("hoist");
    if (!logger) {
        logger = spdlog::stderr_color_mt("hoist");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult upload(std::string_view program_name, const CliArgs& args) {
    auto config = build_config(args);
    if (!config) {
        spdlog::error("Invalid configuration: {}", config.error().message());
        return std::unexpected(config.error());
    }

    // Transfer selection
    std::optional<CurlGlobal> curl_global;
    std::unique_ptr<transfer::HttpTransfer> http;
    std::unique_ptr<transfer::CommandTransfer> command;
    store::ChunkStore store;
    const bool dry_run = args.command.empty() && args.destination.starts_with(MEM_SCHEME);
    core::TransferFn transfer;

    if (!args.command.empty()) {
        command = std::make_unique<transfer::CommandTransfer>(
            args.command, args.destination, args.operation, args.network);
        transfer = command->as_transfer();
    } else if (args.destination.starts_with("http://") || args.destination.starts_with("https://")) {
        auto url = transfer::Url::parse(args.destination);
        if (!url) {
            spdlog::error("Invalid destination URL: {}", args.destination);
            return std::unexpected(url.error());
        }
        curl_global.emplace();
        http = std::make_unique<transfer::HttpTransfer>(*url, args.operation, args.network);
        transfer = http->as_transfer();
        spdlog::debug("Posting chunks to {}", http->endpoint().full());
    } else if (dry_run) {
        transfer = args.parallel ? store.put_sink() : store.append_sink();
        spdlog::info("Dry run into memory store");
    } else {
        spdlog::error("Destination '{}' is not a URL; pass --command to upload with an external tool",
                      args.destination);
        return std::unexpected(make_error_code(UploadErrc::invalid_destination));
    }

    // Chunking
    spdlog::info("Uploading {}", args.file);
    auto data = read_file(args.file);
    if (!data) {
        spdlog::error("Cannot read {}: {}", args.file, data.error().message());
        return std::unexpected(data.error());
    }

    if (args.offset > data->size()) {
        spdlog::error("Byte offset {} is past the end of {} ({} bytes)", args.offset, args.file, data->size());
        return std::unexpected(make_error_code(UploadErrc::invalid_offset));
    }

    auto pieces = core::split(*data, args.chunk_size, args.offset);
    if (!pieces) {
        spdlog::error("Cannot split {}: {}", args.file, pieces.error().message());
        return std::unexpected(pieces.error());
    }
    data->clear();
    data->shrink_to_fit();

    auto chunks = core::to_chunk_info(std::move(*pieces));
    const std::size_t total_chunks = chunks.size();
    spdlog::info("Total chunks: {}", total_chunks);
    if (args.offset > 0) {
        spdlog::info("Starting from byte offset: {}", args.offset);
    }

    if (!args.retry_chunks.empty()) {
        auto manifest = core::FailedManifest::load(args.retry_chunks);
        if (!manifest) {
            spdlog::error("Cannot read failed-chunk manifest {}: {}",
                          args.retry_chunks, manifest.error().message());
            return std::unexpected(manifest.error());
        }
        chunks = core::filter_by_ids(std::move(chunks), manifest->chunk_ids);
        spdlog::info("Retrying {} of {} listed chunks from {}",
                     chunks.size(), manifest->chunk_ids.size(), args.retry_chunks);
        if (chunks.size() != manifest->chunk_ids.size()) {
            spdlog::warn("{} listed chunk IDs do not exist in this file",
                         manifest->chunk_ids.size() - chunks.size());
        }
    }

    std::size_t start_from_chunk = 0;
    if (args.chunk_offset > 0) {
        spdlog::info("Starting from chunk {}", args.chunk_offset + 1);
        if (args.parallel) {
            chunks = core::skip_chunks(std::move(chunks), args.chunk_offset);
        } else {
            start_from_chunk = args.chunk_offset;
        }
    }

    if (config->auto_resume && !args.parallel) {
        spdlog::info("Auto-resume enabled with {} max retries per chunk", config->max_retries);
    }

    // What the store must hold afterwards
    core::Bytes expected;
    if (dry_run && start_from_chunk < chunks.size()) {
        expected = concatenate(std::span<const core::ChunkInfo>(chunks).subspan(start_from_chunk));
    }

    std::uint64_t total_bytes = 0;
    for (std::size_t i = start_from_chunk; i < chunks.size(); ++i) {
        total_bytes += chunks[i].size;
    }

    // Progress: a bar in normal mode, per-chunk log lines with --verbose
    std::unique_ptr<ProgressReporter> reporter;
    if (!args.quiet && !args.verbose && total_bytes > 0) {
        reporter = std::make_unique<ProgressReporter>(total_bytes);
        transfer = [inner = std::move(transfer), r = reporter.get()](
                       std::uint32_t id, std::span<const std::uint8_t> payload) {
            auto result = inner(id, payload);
            if (result) {
                r->add(payload.size());
            }
            return result;
        };
    }

    if (args.parallel) {
        config->progress_hook = [](std::uint64_t id, std::uint64_t size, std::string_view status) {
            spdlog::debug("Chunk {} ({} bytes): {}", id, size, status);
        };
    } else {
        config->progress_hook = [](std::uint64_t current, std::uint64_t total, std::string_view status) {
            spdlog::debug("Chunk {}/{}: {}", current, total, status);
        };
    }

    // Run
    const std::string manifest_path = config->failed_manifest_path;
    core::UploadOutcome outcome;
    if (args.parallel) {
        core::ParallelScheduler scheduler(std::move(*config), std::move(transfer));
        outcome = scheduler.run(std::move(chunks));
    } else {
        core::SequentialUploader uploader(std::move(*config), std::move(transfer));
        outcome = uploader.upload(chunks, start_from_chunk);
    }

    if (reporter) {
        reporter->finish(outcome.ok());
    }

    switch (outcome.status) {
        case core::UploadStatus::success:
            break;

        case core::UploadStatus::interrupted:
            spdlog::error("Upload interrupted at chunk {}: {}", outcome.interrupted_at + 1, outcome.reason);
            spdlog::error("{} chunks uploaded, 1 failed", outcome.successful_ids.size());
            std::cout << "\nTo resume from this point, run:\n"
                      << resume_hint(program_name, args, outcome.interrupted_at) << std::endl;
            return 1;

        case core::UploadStatus::partial_failure:
            spdlog::error("Upload incomplete: {}", outcome.reason);
            spdlog::error("{} chunks uploaded, {} failed",
                          outcome.successful_ids.size(), outcome.failed_ids.size());
            for (const auto& [id, why] : outcome.failed_ids) {
                spdlog::error("  chunk {}: {}", id, why);
            }
            if (outcome.manifest_error) {
                spdlog::error("Failed chunk IDs could not be saved: {}", outcome.manifest_error.message());
            } else if (!manifest_path.empty()) {
                std::cout << "\nTo retry the failed chunks, run:\n"
                          << retry_hint(program_name, args, manifest_path) << std::endl;
            }
            return 1;

        case core::UploadStatus::failed:
            spdlog::error("Upload failed: {}", outcome.reason);
            if (args.parallel) {
                if (outcome.error == UploadErrc::all_chunks_failed) {
                    spdlog::error("0 chunks uploaded, {} failed", outcome.failed_ids.size());
                    std::cout << "\nTo upload the file again, run:\n"
                              << rerun_hint(program_name, args) << std::endl;
                }
            } else if (reached_transfer(outcome.error)) {
                const std::size_t resume_at = start_from_chunk + outcome.successful_ids.size();
                spdlog::error("{} chunks uploaded, 1 failed", outcome.successful_ids.size());
                std::cout << "\nTo resume from the failed chunk, run:\n"
                          << resume_hint(program_name, args, resume_at) << std::endl;
            }
            return 1;
    }

    if (dry_run) {
        core::Bytes received;
        if (args.parallel) {
            if (args.chunk_offset == 0 && args.retry_chunks.empty() && !store.is_complete(total_chunks)) {
                spdlog::error("Dry run: store holds {} of {} chunks", store.chunk_count(), total_chunks);
                return 1;
            }
            auto merged = store.consolidate();
            if (!merged) {
                spdlog::error("Dry run: {}", merged.error().message());
                return 1;
            }
            received = std::move(*merged);
        } else {
            received = store.take_buffer();
        }

        if (received != expected) {
            spdlog::error("Dry run: reassembled {} bytes do not match the {} bytes sent",
                          received.size(), expected.size());
            return 1;
        }
        spdlog::info("Dry run: {} bytes reassembled intact", received.size());
    }

    if (!args.retry_chunks.empty()) {
        core::FailedManifest::remove(args.retry_chunks);
    }

    spdlog::info("Upload completed successfully: {} in {:.1f}s",
                 ProgressBar::format_bytes(outcome.stats.bytes_uploaded),
                 std::chrono::duration<double>(outcome.stats.elapsed).count());
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Hoist " << hoist::version.to_string() << " - chunked, resumable uploader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <DESTINATION> <OPERATION> <FILE>\n";
    std::cout << "\n";
    std::cout << "DESTINATION:\n";
    std::cout << "  http(s)://host/path     POST each chunk to <DESTINATION>/<OPERATION>\n";
    std::cout << "  mem://name              Dry run into memory, verifies reassembly\n";
    std::cout << "  anything else           Requires --command\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -o, --offset <N>        Byte offset to start chunking from\n";
    std::cout << "      --chunk-offset <N>  Chunk index to resume from\n";
    std::cout << "      --chunk-size <N>    Chunk size in bytes (default: " << core::DEFAULT_CHUNK_SIZE << ")\n";
    std::cout << "  -n, --network <NAME>    Network selector passed to the transfer\n";
    std::cout << "  -a, --autoresume        Retry chunks and stop resumably (sequential mode)\n";
    std::cout << "      --max-retries <N>   Attempts per chunk (default: " << core::DEFAULT_MAX_RETRIES << ")\n";
    std::cout << "  -p, --parallel          Upload chunks concurrently\n";
    std::cout << "      --max-concurrent <N> Parallel worker cap (default: " << core::DEFAULT_MAX_CONCURRENT << ")\n";
    std::cout << "      --target-rate <MiB/s> Parallel target rate (default: " << core::DEFAULT_TARGET_RATE_MIBS << ")\n";
    std::cout << "      --retry-chunks <FILE> Upload only the chunk IDs listed in FILE\n";
    std::cout << "      --command <TEMPLATE> Run TEMPLATE per chunk; placeholders {dest} {op} {file} {id} {network}\n";
    std::cout << "                          {file} holds the raw chunk bytes; any encoding is up to the command\n";
    std::cout << "  -c, --config <FILE>     JSON configuration file\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/api store model.bin\n";
    std::cout << "  " << program_name << " -p --max-concurrent 8 https://example.com/api store model.bin\n";
    std::cout << "  " << program_name << " --command 'aws s3 cp {file} s3://{dest}/{op}/chunk-{id}' bucket uploads model.bin\n";
}

void print_version() noexcept {
    std::cout << "Hoist " << hoist::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace hoist::cli
