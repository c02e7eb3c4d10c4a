// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hoist/core/transfer.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace hoist::transfer {

// Hands each chunk to an external tool. The payload goes to a private temp
// file and the template is run through /bin/sh with these placeholders:
//   {dest} {op} {file} {id} {network}
// Every substituted value is single-quoted. Non-zero exit fails the chunk
// and the tool's combined output becomes the error message.
class CommandTransfer {
public:
    CommandTransfer(std::string command_template,
                    std::string destination,
                    std::string operation,
                    std::string network = {});

    CommandTransfer(const CommandTransfer&) = delete;
    CommandTransfer& operator=(const CommandTransfer&) = delete;

    [[nodiscard]] core::TransferResult send(std::uint32_t chunk_id,
                                            std::span<const std::uint8_t> payload) const;

    // Bound to this object; it must outlive the returned function
    [[nodiscard]] core::TransferFn as_transfer() const;

    // Command line for one chunk stored at `file`
    [[nodiscard]] std::string render(std::uint32_t chunk_id, std::string_view file) const;

    [[nodiscard]] const std::string& command_template() const noexcept { return template_; }

    // 'it'\''s' style quoting for /bin/sh
    [[nodiscard]] static std::string shell_quote(std::string_view value);

private:
    std::string template_;
    std::string destination_;
    std::string operation_;
    std::string network_;
};

} // namespace hoist::transfer
