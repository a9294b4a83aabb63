// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/core/http_session.hpp>
#include <rangefile/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string_view>
#include <utility>

namespace rangefile::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirects)
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// Body sink with a hard cap so a server ignoring the Range header cannot
// make us buffer the whole resource
struct BodyBuffer {
    Bytes data;
    std::size_t limit{0};
    bool overflow{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<BodyBuffer*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    if (body->data.size() + total > body->limit) {
        body->overflow = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }

    const std::size_t offset = body->data.size();
    try {
        body->data.resize(offset + total);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    std::memcpy(body->data.data() + offset, ptr, total);
    return total;
}

std::error_code curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(ReadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(ReadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(ReadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(ReadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(ReadErrc::invalid_url);
        default:
            return make_error_code(ReadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, const TransportOptions& opts) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(opts.max_redirects));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.user_agent.c_str());
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession()
    : HttpSession(TransportOptions{}) {}

HttpSession::HttpSession(TransportOptions options)
    : options_(std::move(options)) {
    if (options_.user_agent.empty()) {
        options_.user_agent = rangefile::user_agent();
    }
}

std::error_code HttpSession::status_error(long http_code) noexcept {
    if (http_code < 400) return {};
    if (http_code == 404 || http_code == 410) return make_error_code(ReadErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(ReadErrc::permission_denied);
    if (http_code == 416) return make_error_code(ReadErrc::invalid_range);
    if (http_code >= 500) return make_error_code(ReadErrc::server_error);
    return make_error_code(ReadErrc::network_error);
}

std::error_code HttpSession::classify_range_response(long http_code, std::uint64_t start,
                                                     std::uint64_t body_size,
                                                     std::uint64_t expected_size,
                                                     bool overflow) noexcept {
    if (auto ec = status_error(http_code)) {
        return ec;
    }

    // More bytes than asked for: the server ignored the range
    if (overflow) {
        return make_error_code(ReadErrc::short_read);
    }

    // 200 is acceptable only when the range happened to be the whole body
    const bool whole_body = http_code == 200 && start == 0 && body_size == expected_size;
    if (http_code != 206 && !whole_body) {
        return make_error_code(ReadErrc::short_read);
    }

    if (body_size != expected_size) {
        return make_error_code(ReadErrc::short_read);
    }
    return {};
}

bool HttpSession::parse_length(const std::string& value, std::uint64_t& out) noexcept {
    if (value.empty()) return false;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    return ec == std::errc{} && ptr == value.data() + value.size();
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl = CurlHandle(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(ReadErrc::network_error));
    }

    HttpResponse response{};

    apply_common_options(curl.ptr, url, options_);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::warn("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    if (auto ec = status_error(http_code)) {
        spdlog::warn("HEAD {} returned HTTP {}", url, http_code);
        return std::unexpected(ec);
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD
    auto cl_it = response.headers.find("content-length");
    if (cl_it == response.headers.end() || !parse_length(cl_it->second, response.content_length)) {
        response.content_length = 0;
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = (ar_it != response.headers.end() && ar_it->second.find("bytes") != std::string::npos);

    return response;
}

std::expected<ResourceInfo, std::error_code>
HttpSession::probe_metadata(const std::string& url) noexcept {
    auto response = head(url);
    if (!response) {
        return std::unexpected(response.error());
    }

    // Without Content-Length there is no address space to seek in
    if (response->headers.find("content-length") == response->headers.end()) {
        spdlog::warn("HEAD {} has no Content-Length", url);
        return ResourceInfo{0, false, response->content_type};
    }

    spdlog::debug("HEAD {}: length={} ranges={}", url, response->content_length, response->accepts_ranges);
    return ResourceInfo{response->content_length, response->accepts_ranges, response->content_type};
}

std::expected<Bytes, std::error_code>
HttpSession::fetch_range(const std::string& url, std::uint64_t start, std::uint64_t end) noexcept {
    if (end < start) {
        return std::unexpected(make_error_code(ReadErrc::invalid_range));
    }

    CurlHandle curl = CurlHandle(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(ReadErrc::network_error));
    }

    const std::uint64_t expected_size = end - start + 1;

    BodyBuffer body;
    body.limit = static_cast<std::size_t>(expected_size);
    std::string range;

    try {
        body.data.reserve(static_cast<std::size_t>(expected_size));
        range = std::to_string(start) + "-" + std::to_string(end);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ReadErrc::out_of_memory));
    }

    apply_common_options(curl.ptr, url, options_);
    curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(RECEIVE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);

    // The write callback aborts the transfer once the body overflows
    if (result != CURLE_OK && !body.overflow) {
        spdlog::warn("GET {} bytes={} failed: {}", url, range, curl_easy_strerror(result));
        return std::unexpected(curl_error(result));
    }

    if (auto ec = classify_range_response(http_code, start, body.data.size(), expected_size, body.overflow)) {
        spdlog::warn("GET {} bytes={} rejected (HTTP {}, {} of {} bytes{}): {}",
                     url, range, http_code, body.data.size(), expected_size,
                     body.overflow ? ", overflow" : "", ec.message());
        return std::unexpected(ec);
    }

    return std::move(body.data);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

std::error_code HttpSession::global_init() noexcept {
    CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
        spdlog::error("curl_global_init failed: {}", curl_easy_strerror(result));
        return make_error_code(ReadErrc::network_error);
    }
    return {};
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace rangefile::core
