// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hoist/transfer/url.hpp>
#include <algorithm>
#include <cctype>

namespace hoist::transfer {

using core::UploadErrc;

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(UploadErrc::invalid_destination));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(UploadErrc::invalid_destination));
    }

    auto rest_start = scheme_end + 3;  // Skip "://"

    auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
    auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
    auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());
    auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip user:pass@
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(UploadErrc::invalid_destination));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
        url.host_ = std::string(authority.substr(0, colon));
        url.port_ = std::string(authority.substr(colon + 1));
    } else {
        url.host_ = std::string(authority);
    }

    if (path_start < url_str.length() && path_start < std::min(query_start, fragment_start)) {
        url.path_ = std::string(url_str.substr(path_start, std::min(query_start, fragment_start) - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(UploadErrc::invalid_destination));
    }

    if (!url.port_.empty() &&
        !std::all_of(url.port_.begin(), url.port_.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::unexpected(make_error_code(UploadErrc::invalid_destination));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

Url Url::with_segment(std::string_view segment) const {
    Url url = *this;
    while (!segment.empty() && segment.front() == '/') {
        segment.remove_prefix(1);
    }
    if (segment.empty()) {
        return url;
    }
    if (url.path_.empty() || url.path_.back() != '/') {
        url.path_ += '/';
    }
    url.path_ += segment;
    return url;
}

} // namespace hoist::transfer
