/*
 * http_transport_curl.cpp
 *
 * Notes
 * - IHttpTransport over the libcurl easy API: one handle per request, no pooling.
 * - Honors connect/read timeouts, TLS verify/CA, proxy, request headers, redirects.
 * - Captures response headers of the final hop and its status line reason phrase.
 * - HTTP error statuses are returned as responses; only CURLcode failures become
 *   TransportFailure.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <repofetch/fetch/transport.h>
#include <repofetch/version.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <string_view>

namespace repofetch::fetch {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

static bool curl_has_tls() {
    const auto* info = curl_version_info(CURLVERSION_NOW);
    return info != nullptr && (info->features & CURL_VERSION_SSL) != 0;
}

static bool is_socks_proxy(const std::optional<std::string>& proxy) {
    return proxy && to_lower(*proxy).starts_with("socks");
}

// Map CURLcode to TransportFailure
static TransportFailure makeCurlFailure(CURLcode code, const TransportRequest& req) {
    TransportFailure f;
    f.message = std::string(curl_easy_strerror(code));
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
#if LIBCURL_VERSION_NUM >= 0x074900
        case CURLE_PROXY:
#endif
            f.kind = TransportFailureKind::Proxy;
            break;
        case CURLE_COULDNT_CONNECT:
            // With an explicit proxy the only peer we connect to is the proxy itself.
            f.kind = (req.proxy && !req.proxy->empty()) ? TransportFailureKind::Proxy
                                                        : TransportFailureKind::Connection;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_NOT_BUILT_IN:
        case CURLE_URL_MALFORMAT:
            if (to_lower(req.url).starts_with("https:") && !curl_has_tls()) {
                f.kind = TransportFailureKind::Tls;
            } else {
                f.kind = TransportFailureKind::InvalidSchema;
                if (is_socks_proxy(req.proxy)) {
                    f.message = "Missing dependencies for SOCKS support: " + f.message;
                }
            }
            break;
        case CURLE_OPERATION_TIMEDOUT:
            f.kind = TransportFailureKind::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_INITFAILED:
            f.kind = TransportFailureKind::Tls;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            f.kind = TransportFailureKind::Connection;
            break;
        default:
            f.kind = TransportFailureKind::Other;
            break;
    }
    return f;
}

// Header parser context; reset on every status line so only the final hop survives
struct HeaderParseContext {
    std::optional<std::string> reason;
    std::vector<Header> headers;
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.empty())
        return total;

    // "HTTP/1.1 304 Not Modified" / "HTTP/2 200"
    if (line.starts_with("HTTP/")) {
        ctx->headers.clear();
        ctx->reason.reset();
        auto sp1 = line.find(' ');
        if (sp1 != std::string_view::npos) {
            auto sp2 = line.find(' ', sp1 + 1);
            if (sp2 != std::string_view::npos) {
                auto reason = trim(line.substr(sp2 + 1));
                if (!reason.empty())
                    ctx->reason = std::move(reason);
            }
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    ctx->headers.push_back(Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    return total;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const {
        if (curl != nullptr)
            curl_easy_cleanup(curl);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list != nullptr)
            curl_slist_free_all(list);
    }
};

// Helper to build curl_slist from headers
static std::unique_ptr<curl_slist, CurlSlistDeleter>
build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return std::unique_ptr<curl_slist, CurlSlistDeleter>(list);
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const TransportRequest& req) {
    // Timeouts: connect phase is bounded directly; the read phase aborts when the
    // transfer stalls below 1 byte/s for the read timeout.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::max<long long>(req.timeout.connect.count(), 1)));
    const auto readSecs = std::max<long long>((req.timeout.read.count() + 999) / 1000, 1);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(readSecs));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, req.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, req.tls.insecure ? 0L : 2L);
    if (!req.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, req.tls.caPath.c_str());
    }

    // Proxy
    if (req.proxy && !req.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, req.proxy->c_str());
    }

    // Accept any encoding curl can decode (gzip/deflate/br)
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, REPOFETCH_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpTransport() override = default;

    Result<TransportResponse, TransportFailure> get(const TransportRequest& req) override {
        std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
        if (!curl) {
            return TransportFailure{TransportFailureKind::Other, "curl_easy_init failed", {}};
        }

        if (req.tls.insecure && !req.suppressInsecureWarning) {
            spdlog::warn("Unverified HTTPS request to {}: certificate verification is disabled",
                         req.url);
        }

        auto list = build_header_list(req.headers);
        HeaderParseContext hctx{};
        TransportResponse response;

        curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

        configure_common(curl.get(), req);

        spdlog::debug("GET {}", req.url);
        CURLcode rc = curl_easy_perform(curl.get());

        curl_off_t totalUs = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_TOTAL_TIME_T, &totalUs);
        const auto elapsed = std::chrono::milliseconds(totalUs / 1000);

        if (rc != CURLE_OK) {
            auto failure = makeCurlFailure(rc, req);
            failure.elapsed = elapsed;
            spdlog::debug("GET {} failed after {}ms: {}", req.url, elapsed.count(),
                          failure.message);
            return failure;
        }

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        response.status = static_cast<int>(http_status);
        response.reason = std::move(hctx.reason);
        response.headers = std::move(hctx.headers);
        response.elapsed = elapsed;
        return response;
    }

    bool tlsAvailable() const override { return curl_has_tls(); }
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport() {
    return std::make_unique<CurlHttpTransport>();
}

} // namespace repofetch::fetch
