#pragma once

#include <chv/result.hpp>
#include <cstdint>
#include <string>

namespace chv {

struct HttpResponse {
    long status = 0;       // 0 for non-HTTP schemes such as file://
    std::string body;
};

// Receives a download as it streams in. Returning an error from either
// call aborts the transfer, and download() returns that same error.
class DownloadSink {
public:
    virtual ~DownloadSink() = default;

    // Called once before the first byte; total is 0 when the size is unknown
    virtual Status begin(uint64_t total_bytes) = 0;
    virtual Status write(const char* data, size_t len) = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Fetch a whole response into memory. Status >= 400 is an error.
    virtual Result<HttpResponse> get(const std::string& url) = 0;

    // Stream a response body into sink
    virtual Status download(const std::string& url, DownloadSink& sink) = 0;
};

struct TransportOptions {
    long connect_timeout_seconds = 15;
    long timeout_seconds = 600;
    std::string user_agent = "chv";
};

// libcurl-backed transport. Follows redirects; all failures are Network
// errors unless the sink reported its own.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(TransportOptions options = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> get(const std::string& url) override;
    Status download(const std::string& url, DownloadSink& sink) override;

private:
    TransportOptions options_;
};

} // namespace chv
