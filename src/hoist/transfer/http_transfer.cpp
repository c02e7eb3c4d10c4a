// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/transfer/http_transfer.hpp>
#include <hoist/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>

namespace hoist::transfer {

using core::UploadErrc;

namespace {

constexpr std::size_t MAX_ERROR_BODY = 4 * 1024;  // Keep error text short

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) {
        ptr = curl_slist_append(ptr, header.c_str());
    }
};

// Collects the start of the response body for error reporting
std::size_t body_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t bytes = size * nmemb;
    if (body->size() < MAX_ERROR_BODY) {
        body->append(ptr, std::min(bytes, MAX_ERROR_BODY - body->size()));
    }
    return bytes;
}

} // namespace

HttpTransfer::HttpTransfer(Url destination, std::string operation, std::string network)
    : endpoint_(destination.with_segment(operation))
    , endpoint_str_(endpoint_.full())
    , network_(std::move(network)) {}

core::TransferResult HttpTransfer::send(std::uint32_t chunk_id,
                                        std::span<const std::uint8_t> payload) const {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return core::transfer_failure(make_error_code(UploadErrc::transfer_failed),
                                      "curl_easy_init failed");
    }

    HeaderList headers;
    headers.append("Content-Type: application/octet-stream");
    headers.append("X-Chunk-Id: " + std::to_string(chunk_id));
    if (!network_.empty()) {
        headers.append("X-Network: " + network_);
    }
    headers.append("Expect:");  // No 100-continue round trip for 2 MB bodies

    std::string body;
    char error_buf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, endpoint_str_.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_POST, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(payload.data()));
    curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.ptr);

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.ptr, CURLOPT_ERRORBUFFER, error_buf);

    // Connect timeout only; the transfer itself is unbounded
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(core::CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);  // Worker threads
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        std::string why = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(result);
        spdlog::debug("chunk {}: curl error {}: {}", chunk_id, static_cast<int>(result), why);
        return core::transfer_failure(make_error_code(UploadErrc::transfer_failed),
                                      fmt::format("curl error {}: {}", static_cast<int>(result), why));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        return core::transfer_failure(make_error_code(UploadErrc::http_error),
                                      fmt::format("HTTP {}: {}", http_code, body));
    }

    return {};
}

core::TransferFn HttpTransfer::as_transfer() const {
    return [this](std::uint32_t chunk_id, std::span<const std::uint8_t> payload) {
        return send(chunk_id, payload);
    };
}

void HttpTransfer::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpTransfer::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace hoist::transfer
