#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

typedef void CURL;

enum class TlsVersion { Default, Tls1_2, Tls1_1, Tls1_0 };

std::string_view tls_version_name(TlsVersion version) noexcept;

enum class ProbeErrorKind { Network, Tls, HttpStatus, Interrupted };

struct ProbeError {
    ProbeErrorKind kind = ProbeErrorKind::Network;
    std::string message;
    long http_status = 0;
};

struct ProbeTiming {
    double elapsed_ms = 0.0;
    long http_status = 0;
};

struct HttpTimeouts {
    long total_sec = 10;
    long connect_sec = 10;
};

// Seam between the sampler/connectivity logic and libcurl.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual std::expected<ProbeTiming, ProbeError> probe(const std::string& url) = 0;
    virtual void set_tls_version(TlsVersion version) = 0;
    virtual TlsVersion tls_version() const = 0;
};

class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpTimeouts timeouts = {});
    ~HttpClient() override = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<ProbeTiming, ProbeError> probe(const std::string& url) override;
    void set_tls_version(TlsVersion version) override { tls_version_ = version; }
    TlsVersion tls_version() const override { return tls_version_; }

private:
    std::unique_ptr<CURL, void(*)(CURL*)> handle_;
    HttpTimeouts timeouts_;
    TlsVersion tls_version_ = TlsVersion::Default;

    static size_t discard_body(void* ptr, size_t size, size_t nmemb, void* userdata) noexcept;
};
