/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - probe() and fetchRange() on the libcurl easy API, one handle per request.
 * - Honors timeout, TLS verify/CA, proxy, per-task headers, redirects, and Range.
 * - The HTTP status is checked before the first body byte reaches the sink: error bodies
 *   are never written to a partial artifact, and a 200 answer to a resumed Range request
 *   fails with ResumeNotSupported instead of appending the whole object at the offset.
 * - Cooperative cancellation is polled from both the write and the xferinfo callbacks so
 *   a stalled connection still stops promptly.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <modelfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace modelfetch::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            err.code = ErrorCode::ClientError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

Error makeHttpError(long status) {
    // 408 and 429 are the server asking us to come back later.
    const bool retryable = status >= 500 || status == 408 || status == 429;
    return Error{retryable ? ErrorCode::ServerError : ErrorCode::ClientError,
                 "HTTP error " + std::to_string(status)};
}

bool isHttpUrl(std::string_view url) {
    auto lower = to_lower(url.substr(0, std::min<size_t>(url.size(), 8)));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

void ensureGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> contentRangeTotal{};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    // Redirects produce several header blocks; only the final one counts.
    void resetForNewResponse() { *this = HeaderParseContext{}; }
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        ctx->resetForNewResponse();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes")
            ctx->acceptRangesBytes = true;
    } else if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc())
            ctx->contentLength = tmp;
    } else if (key == "content-range") {
        // bytes 0-0/12345
        auto slash = val.rfind('/');
        if (slash != std::string::npos) {
            std::uint64_t tmp{0};
            auto res = std::from_chars(val.data() + slash + 1, val.data() + val.size(), tmp);
            if (res.ec == std::errc())
                ctx->contentRangeTotal = tmp;
        }
        ctx->acceptRangesBytes = true;
    } else if (key == "etag") {
        auto v = val;
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
            v = v.substr(1, v.size() - 2);
        ctx->etag = std::move(v);
    } else if (key == "last-modified") {
        ctx->lastModified = val;
    }
    return total;
}

struct WriteContext {
    CURL* curl{nullptr};
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t offset{0};
    bool http{true};
    bool statusChecked{false};
    long status{0};
    bool cancelRequested{false};
    bool resumeRejected{false};
    std::optional<Error> sinkError;
    std::uint64_t downloaded{0};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (!ctx->statusChecked) {
        ctx->statusChecked = true;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
        if (ctx->http && ctx->offset > 0 && ctx->status == 200) {
            ctx->resumeRejected = true;
            return 0;
        }
    }
    if (ctx->http && ctx->status >= 400) {
        // Drain the error body; the status is reported after perform().
        return total;
    }

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }
    ctx->downloaded += static_cast<std::uint64_t>(total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const FetchOptions& options) {
    const auto timeout = options.timeout.count() > 0 ? options.timeout.count() : 0;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(timeout > 0 ? std::min<long long>(timeout, 30000) : 30000));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty())
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());

    if (options.proxy && !options.proxy->empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "modelfetch/1.0");
}

// Owns an easy handle and header list for the duration of one request.
struct EasyHandle {
    CURL* curl{curl_easy_init()};
    curl_slist* headers{nullptr};
    ~EasyHandle() {
        if (headers)
            curl_slist_free_all(headers);
        if (curl)
            curl_easy_cleanup(curl);
    }
};

} // namespace

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureGlobalInit(); }
    ~CurlHttpAdapter() override = default;

    Expected<ProbeResult> probe(std::string_view url, const FetchOptions& options) override {
        EasyHandle h;
        if (!h.curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        const std::string u(url);
        HeaderParseContext hctx{};
        h.headers = build_header_list(options.headers);

        curl_easy_setopt(h.curl, CURLOPT_URL, u.c_str());
        curl_easy_setopt(h.curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h.curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
        configure_common(h.curl, options);

        CURLcode rc = curl_easy_perform(h.curl);
        long status = 0;
        curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &status);

        const bool http = isHttpUrl(url);
        if (rc != CURLE_OK || (http && status >= 400 && status != 408 && status != 429)) {
            // Some servers reject HEAD; try GET range 0-0 as fallback
            spdlog::debug("HEAD probe of {} failed (rc={}, status={}), attempting GET Range 0-0",
                          u, static_cast<int>(rc), status);
            hctx = HeaderParseContext{};
            curl_easy_setopt(h.curl, CURLOPT_NOBODY, 0L);
            curl_easy_setopt(h.curl, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(h.curl, CURLOPT_RANGE, "0-0");
            curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION,
                             +[](char*, size_t size, size_t nmemb, void*) -> size_t {
                                 return size * nmemb;
                             });
            rc = curl_easy_perform(h.curl);
            if (rc != CURLE_OK)
                return makeCurlError(rc, "probe(GET range)");
            curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &status);
            if (http && status >= 400)
                return makeHttpError(status);
            if (status == 206) {
                hctx.acceptRangesBytes = true;
                hctx.contentLength = hctx.contentRangeTotal;
            }
        } else if (http && status >= 400) {
            return makeHttpError(status);
        }

        ProbeResult out;
        out.resumeSupported = hctx.acceptRangesBytes;
        out.contentLength = hctx.contentLength;
        if (!out.contentLength) {
            curl_off_t cl = -1;
            if (curl_easy_getinfo(h.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK &&
                cl >= 0 && status != 206) {
                out.contentLength = static_cast<std::uint64_t>(cl);
            }
        }
        out.etag = hctx.etag;
        out.lastModified = hctx.lastModified;
        spdlog::debug("Probe {}: length={} ranges={}", u,
                      out.contentLength ? std::to_string(*out.contentLength) : "unknown",
                      out.resumeSupported);
        return out;
    }

    Expected<void> fetchRange(std::string_view url, const FetchOptions& options,
                              std::uint64_t offset, std::uint64_t size, const ByteSink& sink,
                              const ShouldCancel& shouldCancel) override {
        if (!sink)
            return Error{ErrorCode::InvalidArgument, "No sink provided"};

        EasyHandle h;
        if (!h.curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        const std::string u(url);
        h.headers = build_header_list(options.headers);

        std::string range;
        if (offset > 0 || size > 0) {
            range = std::to_string(offset) + "-";
            if (size > 0)
                range += std::to_string(offset + size - 1);
            curl_easy_setopt(h.curl, CURLOPT_RANGE, range.c_str());
        }

        WriteContext wctx;
        wctx.curl = h.curl;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        wctx.offset = offset;
        wctx.http = isHttpUrl(url);

        HeaderParseContext hctx{};
        curl_easy_setopt(h.curl, CURLOPT_URL, u.c_str());
        curl_easy_setopt(h.curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
        curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(h.curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h.curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(h.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h.curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h.curl, CURLOPT_XFERINFODATA, &wctx);
        configure_common(h.curl, options);

        CURLcode rc = curl_easy_perform(h.curl);
        long status = wctx.status;
        curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &status);

        if (wctx.resumeRejected) {
            return Error{ErrorCode::ResumeNotSupported,
                         "Server ignored Range request at offset " + std::to_string(offset)};
        }
        if (wctx.cancelRequested)
            return Error{ErrorCode::Cancelled, "Transfer cancelled"};
        if (wctx.sinkError)
            return *wctx.sinkError;
        if (wctx.http && status >= 400)
            return makeHttpError(status);
        if (rc != CURLE_OK)
            return makeCurlError(rc, "fetchRange(GET)");

        if (hctx.etag)
            spdlog::debug("HTTP fetch captured ETag: {}", *hctx.etag);
        spdlog::debug("Fetched {} bytes from {} (offset {}, status {})", wctx.downloaded, u,
                      offset, status);
        return Expected<void>{};
    }
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace modelfetch::downloader
