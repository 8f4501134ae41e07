#include "include/http_client.hpp"
#include "include/interrupts.hpp"

#include <chrono>
#include <format>
#include <stdexcept>
#include <curl/curl.h>

namespace {

constexpr auto kUserAgent = "regionping/1.0 (+latency probe)";

struct CurlSlistDeleter {
    void operator()(struct curl_slist* list) const noexcept {
        if (list) curl_slist_free_all(list);
    }
};

class CurlHeaders {
    std::unique_ptr<struct curl_slist, CurlSlistDeleter> list_;

public:
    void add(const std::string& header) {
        auto new_head = curl_slist_append(list_.get(), header.c_str());
        if (new_head && !list_) {
            list_.reset(new_head);
        }
    }

    struct curl_slist* get() const { return list_.get(); }
};

void setup_cache_busting(CURL* handle, CurlHeaders& headers) {
    headers.add("Accept: */*");
    headers.add("Cache-Control: no-cache");
    headers.add("Pragma: no-cache");
    headers.add("Connection: keep-alive");

    curl_easy_setopt(handle, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
}

long to_curl_ssl_version(TlsVersion version) {
    switch (version) {
        case TlsVersion::Tls1_2:
            return CURL_SSLVERSION_TLSv1_2 | CURL_SSLVERSION_MAX_TLSv1_2;
        case TlsVersion::Tls1_1:
            return CURL_SSLVERSION_TLSv1_1 | CURL_SSLVERSION_MAX_TLSv1_1;
        case TlsVersion::Tls1_0:
            return CURL_SSLVERSION_TLSv1_0 | CURL_SSLVERSION_MAX_TLSv1_0;
        case TlsVersion::Default:
            break;
    }
    return CURL_SSLVERSION_DEFAULT;
}

ProbeErrorKind classify(CURLcode code) {
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return ProbeErrorKind::Interrupted;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CIPHER:
            return ProbeErrorKind::Tls;
        default:
            return ProbeErrorKind::Network;
    }
}

}

std::string_view tls_version_name(TlsVersion version) noexcept {
    switch (version) {
        case TlsVersion::Tls1_2: return "TLS 1.2";
        case TlsVersion::Tls1_1: return "TLS 1.1";
        case TlsVersion::Tls1_0: return "TLS 1.0";
        case TlsVersion::Default: break;
    }
    return "default";
}

HttpClient::HttpClient(HttpTimeouts timeouts)
    : handle_(curl_easy_init(), curl_easy_cleanup), timeouts_(timeouts) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::discard_body(void*, size_t size, size_t nmemb, void*) noexcept {
    return size * nmemb;
}

std::expected<ProbeTiming, ProbeError> HttpClient::probe(const std::string& url) {
    // Reset keeps the connection cache, so the TCP/TLS session is reused.
    curl_easy_reset(handle_.get());

    CurlHeaders headers;
    setup_cache_busting(handle_.get(), headers);

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, nullptr);

    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, timeouts_.total_sec);
    curl_easy_setopt(handle_.get(), CURLOPT_CONNECTTIMEOUT, timeouts_.connect_sec);
    curl_easy_setopt(handle_.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_SSLVERSION, to_curl_ssl_version(tls_version_));

    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION,
        +[](void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                return g_interrupted ? 1 : 0;
        });
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(handle_.get());
    auto end = std::chrono::steady_clock::now();

    if (res != CURLE_OK) {
        return std::unexpected(ProbeError{
            classify(res), std::format("Network error: {}", curl_easy_strerror(res)), 0});
    }

    long status = 0;
    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return std::unexpected(ProbeError{
            ProbeErrorKind::HttpStatus, std::format("HTTP status {}", status), status});
    }

    std::chrono::duration<double, std::milli> elapsed = end - start;
    return ProbeTiming{elapsed.count(), status};
}
