// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/transfer/command_transfer.hpp>
#include <hoist/io/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hoist::transfer {

using core::UploadErrc;
using io::IoErrc;

namespace {

constexpr std::size_t MAX_CAPTURED_OUTPUT = 4 * 1024;

// RAII temp file: closed and unlinked on scope exit
struct TempFile {
    int fd = -1;
    std::string path;

    TempFile() = default;
    ~TempFile() {
        if (fd >= 0) ::close(fd);
        if (!path.empty()) ::unlink(path.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
};

// RAII pipe from popen
struct Pipe {
    FILE* ptr = nullptr;

    explicit Pipe(FILE* f) : ptr(f) {}
    ~Pipe() { if (ptr) ::pclose(ptr); }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    // Returns the raw wait status and releases the pipe
    int close() noexcept {
        int status = ::pclose(ptr);
        ptr = nullptr;
        return status;
    }
};

core::TransferResult write_temp(TempFile& file, std::span<const std::uint8_t> payload) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return core::transfer_failure(make_error_code(IoErrc::temp_file_failed),
                                      fmt::format("no temp directory: {}", ec.message()));
    }

    std::string pattern = (dir / "hoist-chunk-XXXXXX").string();
    // Not inherited by commands spawned from other workers
    file.fd = ::mkostemp(pattern.data(), O_CLOEXEC);
    if (file.fd < 0) {
        return core::transfer_failure(make_error_code(IoErrc::temp_file_failed),
                                      fmt::format("mkostemp {}: {}", pattern, std::strerror(errno)));
    }
    file.path = pattern;

    const auto* data = payload.data();
    std::size_t remaining = payload.size();
    while (remaining > 0) {
        ssize_t n = ::write(file.fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return core::transfer_failure(make_error_code(IoErrc::temp_file_failed),
                                          fmt::format("write {}: {}", file.path, std::strerror(errno)));
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fsync(file.fd) != 0) {
        return core::transfer_failure(make_error_code(IoErrc::temp_file_failed),
                                      fmt::format("fsync {}: {}", file.path, std::strerror(errno)));
    }
    return {};
}

} // namespace

CommandTransfer::CommandTransfer(std::string command_template,
                                 std::string destination,
                                 std::string operation,
                                 std::string network)
    : template_(std::move(command_template))
    , destination_(std::move(destination))
    , operation_(std::move(operation))
    , network_(std::move(network)) {}

std::string CommandTransfer::shell_quote(std::string_view value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string CommandTransfer::render(std::uint32_t chunk_id, std::string_view file) const {
    std::string out;
    out.reserve(template_.size() + file.size() + destination_.size() + 32);

    std::size_t pos = 0;
    while (pos < template_.size()) {
        auto open = template_.find('{', pos);
        if (open == std::string::npos) {
            out.append(template_, pos);
            break;
        }
        out.append(template_, pos, open - pos);

        auto close = template_.find('}', open);
        if (close == std::string::npos) {
            out.append(template_, open);
            break;
        }

        std::string_view name(template_.data() + open + 1, close - open - 1);
        if (name == "dest") {
            out += shell_quote(destination_);
        } else if (name == "op") {
            out += shell_quote(operation_);
        } else if (name == "file") {
            out += shell_quote(file);
        } else if (name == "id") {
            out += std::to_string(chunk_id);
        } else if (name == "network") {
            out += shell_quote(network_);
        } else {
            // Unknown placeholder, leave it for the shell
            out.append(template_, open, close - open + 1);
        }
        pos = close + 1;
    }
    return out;
}

core::TransferResult CommandTransfer::send(std::uint32_t chunk_id,
                                           std::span<const std::uint8_t> payload) const {
    TempFile file;
    if (auto written = write_temp(file, payload); !written) {
        return written;
    }

    // Subshell so stderr of every command in the template is captured
    std::string command = "(\n" + render(chunk_id, file.path) + "\n) 2>&1";
    spdlog::debug("chunk {}: running {}", chunk_id, command);

    Pipe pipe(::popen(command.c_str(), "r"));
    if (!pipe.ptr) {
        return core::transfer_failure(make_error_code(IoErrc::spawn_failed),
                                      fmt::format("popen: {}", std::strerror(errno)));
    }

    std::string output;
    std::array<char, 512> buf{};
    while (std::size_t n = std::fread(buf.data(), 1, buf.size(), pipe.ptr)) {
        if (output.size() < MAX_CAPTURED_OUTPUT) {
            output.append(buf.data(), std::min(n, MAX_CAPTURED_OUTPUT - output.size()));
        }
    }

    int status = pipe.close();
    if (status == -1) {
        return core::transfer_failure(make_error_code(IoErrc::spawn_failed),
                                      fmt::format("pclose: {}", std::strerror(errno)));
    }

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }

    if (WIFSIGNALED(status)) {
        return core::transfer_failure(make_error_code(UploadErrc::transfer_failed),
                                      fmt::format("command killed by signal {}: {}",
                                                  WTERMSIG(status), output));
    }
    if (int code = WEXITSTATUS(status); code != 0) {
        return core::transfer_failure(make_error_code(UploadErrc::transfer_failed),
                                      fmt::format("command exited with {}: {}", code, output));
    }

    return {};
}

core::TransferFn CommandTransfer::as_transfer() const {
    return [this](std::uint32_t chunk_id, std::span<const std::uint8_t> payload) {
        return send(chunk_id, payload);
    };
}

} // namespace hoist::transfer
