/**
 * @file url_guard.cpp
 * @brief Bundle URL validation
 */

#include "locbridge/download/url_guard.h"

#include <curl/curl.h>

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>

namespace locbridge::download {

namespace {

struct curlu_deleter {
    void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

struct curl_string_deleter {
    void operator()(char* s) const { curl_free(s); }
};

using curlu_ptr = std::unique_ptr<CURLU, curlu_deleter>;
using curl_string = std::unique_ptr<char, curl_string_deleter>;

auto rejected(std::string message) -> unexpected {
    return make_error(error_code::url_rejected, "download: " + std::move(message));
}

auto get_part(CURLU* url, CURLUPart part) -> std::optional<std::string> {
    char* raw = nullptr;
    if (curl_url_get(url, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return std::nullopt;
    }
    curl_string owned(raw);
    return std::string(owned.get());
}

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

auto is_blocked_v4(const std::array<uint8_t, 4>& a) -> bool {
    if (a[0] == 0 && a[1] == 0 && a[2] == 0 && a[3] == 0) return true;  // unspecified
    if (a[0] == 127) return true;                                       // loopback
    if (a[0] == 10) return true;
    if (a[0] == 172 && (a[1] & 0xF0) == 16) return true;
    if (a[0] == 192 && a[1] == 168) return true;
    if (a[0] == 169 && a[1] == 254) return true;                        // link-local
    if ((a[0] & 0xF0) == 224) return true;                              // multicast
    return false;
}

auto is_blocked_v6(const std::array<uint8_t, 16>& a) -> bool {
    // IPv4-mapped ::ffff:a.b.c.d is judged by its IPv4 address
    bool mapped = std::all_of(a.begin(), a.begin() + 10, [](uint8_t b) { return b == 0; }) &&
                  a[10] == 0xFF && a[11] == 0xFF;
    if (mapped) {
        return is_blocked_v4({a[12], a[13], a[14], a[15]});
    }

    bool leading_zero = std::all_of(a.begin(), a.begin() + 15, [](uint8_t b) { return b == 0; });
    if (leading_zero && (a[15] == 0 || a[15] == 1)) return true;  // :: and ::1
    if (a[0] == 0xFE && (a[1] & 0xC0) == 0x80) return true;       // fe80::/10
    if ((a[0] & 0xFE) == 0xFC) return true;                       // fc00::/7
    if (a[0] == 0xFF) return true;                                // ff00::/8
    return false;
}

}  // namespace

auto is_blocked_ip_literal(std::string_view host) -> bool {
    std::string literal(host);
    if (literal.size() >= 2 && literal.front() == '[' && literal.back() == ']') {
        literal = literal.substr(1, literal.size() - 2);
    }
    // Zone ids ("fe80::1%eth0") are not part of the address
    if (auto zone = literal.find('%'); zone != std::string::npos) {
        literal.resize(zone);
    }

    std::array<uint8_t, 4> v4{};
    if (inet_pton(AF_INET, literal.c_str(), v4.data()) == 1) {
        return is_blocked_v4(v4);
    }
    std::array<uint8_t, 16> v6{};
    if (inet_pton(AF_INET6, literal.c_str(), v6.data()) == 1) {
        return is_blocked_v6(v6);
    }
    return false;
}

auto validate_bundle_url(std::string_view url) -> result<std::string> {
    const auto* ws = " \t\r\n\v\f";
    auto first = url.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return rejected("empty url");
    }
    std::string raw(url.substr(first, url.find_last_not_of(ws) - first + 1));

    curlu_ptr handle(curl_url());
    if (!handle) {
        return make_error(error_code::internal_error, "download: failed to allocate URL parser");
    }
    if (auto rc = curl_url_set(handle.get(), CURLUPART_URL, raw.c_str(),
                               CURLU_NON_SUPPORT_SCHEME);
        rc != CURLUE_OK) {
        return rejected(std::string("bad url: ") + curl_url_strerror(rc));
    }

    auto scheme = to_lower(get_part(handle.get(), CURLUPART_SCHEME).value_or(""));
    if (scheme != "https") {
        return rejected("unsupported url scheme \"" + scheme + "\"");
    }

    auto host = to_lower(get_part(handle.get(), CURLUPART_HOST).value_or(""));
    if (host.empty()) {
        return rejected("url has empty host");
    }

    if (get_part(handle.get(), CURLUPART_USER) || get_part(handle.get(), CURLUPART_PASSWORD)) {
        return rejected("url must not contain userinfo");
    }

    if (auto fragment = get_part(handle.get(), CURLUPART_FRAGMENT);
        fragment && !fragment->empty()) {
        return rejected("url must not contain fragment");
    }

    if (host == "localhost") {
        return rejected("localhost is not allowed");
    }
    if (ends_with(host, ".localhost") || ends_with(host, ".local") ||
        ends_with(host, ".internal")) {
        return rejected("local/internal hostname is not allowed");
    }

    if (is_blocked_ip_literal(host)) {
        return rejected("ip " + host + " is not allowed");
    }

    auto normalized = get_part(handle.get(), CURLUPART_URL);
    if (!normalized) {
        return rejected("bad url");
    }
    return *normalized;
}

auto resolve_redirect_url(std::string_view base, std::string_view location)
    -> result<std::string> {
    std::string target(location);
    const auto* ws = " \t\r\n\v\f";
    auto first = target.find_first_not_of(ws);
    if (first == std::string::npos) {
        return rejected("redirect without location");
    }
    target = target.substr(first, target.find_last_not_of(ws) - first + 1);

    curlu_ptr handle(curl_url());
    if (!handle) {
        return make_error(error_code::internal_error, "download: failed to allocate URL parser");
    }
    std::string base_url(base);
    if (auto rc = curl_url_set(handle.get(), CURLUPART_URL, base_url.c_str(), 0);
        rc != CURLUE_OK) {
        return rejected(std::string("bad url: ") + curl_url_strerror(rc));
    }
    // With a base already set, a relative URL is resolved against it
    if (auto rc = curl_url_set(handle.get(), CURLUPART_URL, target.c_str(),
                               CURLU_NON_SUPPORT_SCHEME);
        rc != CURLUE_OK) {
        return rejected(std::string("bad redirect location: ") + curl_url_strerror(rc));
    }

    auto resolved = get_part(handle.get(), CURLUPART_URL);
    if (!resolved) {
        return rejected("bad redirect location");
    }
    return validate_bundle_url(*resolved);
}

}  // namespace locbridge::download
