#include <chv/http.hpp>
#include <chv/log.hpp>

#include <curl/curl.h>

#include <memory>
#include <optional>

namespace chv {

namespace {

// curl_global_init is not thread-safe and must run once per process
struct CurlGlobal {
    CURLcode code;
    CurlGlobal() : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { curl_global_cleanup(); }
};

bool ensure_curl_global() {
    static CurlGlobal global;
    return global.code == CURLE_OK;
}

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct DownloadContext {
    CURL* curl = nullptr;
    DownloadSink* sink = nullptr;
    bool started = false;
    std::optional<ChvError> sink_error;
};

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t feed_sink(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<DownloadContext*>(userdata);
    size_t len = size * nmemb;

    if (!ctx->started) {
        ctx->started = true;
        curl_off_t total = -1;
        curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &total);
        auto st = ctx->sink->begin(total > 0 ? static_cast<uint64_t>(total) : 0);
        if (st.is_err()) {
            ctx->sink_error = std::move(st).error();
            return 0;
        }
    }

    auto st = ctx->sink->write(ptr, len);
    if (st.is_err()) {
        ctx->sink_error = std::move(st).error();
        return 0;  // makes curl abort with CURLE_WRITE_ERROR
    }
    return len;
}

} // namespace

CurlTransport::CurlTransport(TransportOptions options)
    : options_(std::move(options)) {}

CurlTransport::~CurlTransport() = default;

static Result<EasyHandle> make_handle(const std::string& url,
                                      const TransportOptions& opts) {
    if (!ensure_curl_global()) {
        return ChvError{ChvError::Network, "failed to initialise libcurl"};
    }
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return ChvError{ChvError::Network, "curl_easy_init failed"};
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, opts.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opts.user_agent.c_str());
    return Result<EasyHandle>::ok(std::move(curl));
}

static ChvError curl_failure(CURL* curl, CURLcode res, const std::string& url) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    if (code >= 400) {
        return ChvError{ChvError::Network,
            "HTTP " + std::to_string(code) + " from " + url};
    }
    return ChvError{ChvError::Network,
        std::string(curl_easy_strerror(res)) + " (" + url + ")"};
}

Result<HttpResponse> CurlTransport::get(const std::string& url) {
    auto handle = make_handle(url, options_);
    if (handle.is_err()) return std::move(handle).error();
    CURL* curl = handle.value().get();

    HeaderList headers(curl_slist_append(nullptr,
        "Accept: application/vnd.github+json"));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    HttpResponse resp;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);

    log::debug("GET %s", url.c_str());
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) return curl_failure(curl, res, url);

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return Result<HttpResponse>::ok(std::move(resp));
}

Status CurlTransport::download(const std::string& url, DownloadSink& sink) {
    auto handle = make_handle(url, options_);
    if (handle.is_err()) return std::move(handle).error();
    CURL* curl = handle.value().get();

    DownloadContext ctx;
    ctx.curl = curl;
    ctx.sink = &sink;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, feed_sink);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    log::debug("downloading %s", url.c_str());
    CURLcode res = curl_easy_perform(curl);
    if (ctx.sink_error) return std::move(*ctx.sink_error);
    if (res != CURLE_OK) return curl_failure(curl, res, url);

    // Empty bodies never reach the write callback
    if (!ctx.started) {
        CHV_TRY(sink.begin(0));
    }
    return ok_status();
}

} // namespace chv
