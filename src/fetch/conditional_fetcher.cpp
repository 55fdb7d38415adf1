#include <repofetch/fetch/conditional_fetcher.h>
#include <repofetch/fetch/url.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace repofetch::fetch {

namespace {

bool isSuccess(int status) {
    return status >= 200 && status < 300;
}

// Copy a response header into the record only when present and non-empty.
template <typename Setter>
void copyHeader(const TransportResponse& response, std::string_view name, Setter&& set) {
    if (auto v = response.header(name); v && !v->empty()) {
        set(std::move(*v));
    }
}

} // namespace

ConditionalFetcher::ConditionalFetcher(IHttpTransport& transport, config::FetchSettings settings)
    : transport_(transport), settings_(std::move(settings)), translator_(settings_) {}

std::vector<Header> ConditionalFetcher::conditionalHeaders(const cache::ValidatorRecord& record) {
    std::vector<Header> headers;
    if (auto etag = record.etag(); !etag.empty()) {
        headers.push_back(Header{"If-None-Match", std::move(etag)});
    }
    if (auto mod = record.lastModified(); !mod.empty()) {
        headers.push_back(Header{"If-Modified-Since", std::move(mod)});
    }
    return headers;
}

TransportRequest ConditionalFetcher::buildRequest(std::string_view url, std::string_view filename,
                                                  const cache::ValidatorRecord& record) const {
    TransportRequest req;
    req.url = url::joinUrl(url, filename);
    req.headers = conditionalHeaders(record);
    req.timeout.connect = settings_.connectTimeout;
    req.timeout.read = settings_.readTimeout;
    req.proxy = settings_.proxy;
    req.tls.insecure = !settings_.sslVerify;
    req.tls.caPath = settings_.caPath;
    // Verification was switched off on purpose; one warning per request is noise.
    req.suppressInsecureWarning = !settings_.sslVerify;
    return req;
}

FetchResult ConditionalFetcher::fetch(std::string_view url, std::string_view filename,
                                      cache::ValidatorRecord& record) const {
    const auto request = buildRequest(url, filename, record);
    for (const auto& h : request.headers) {
        spdlog::debug("Conditional request header {}: {}", h.name, h.value);
    }

    auto result = transport_.get(request);
    if (!result) {
        const auto& failure = result.error();
        spdlog::debug("Transport failure ({}) for {}: {}",
                      transportFailureKindName(failure.kind), request.url, failure.message);
        return translator_.translate(failure, url, filename, transport_.tlsAvailable());
    }

    auto& response = result.value();
    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("{}", describeResponse(response));
    }

    if (response.status == 304) {
        spdlog::debug("{} not modified", request.url);
        return FetchOutcome::notModified();
    }

    if (!isSuccess(response.status)) {
        auto err = translator_.translate(response, url, filename);
        if (err.kind == FetchErrorKind::EmptyChannel) {
            return FetchOutcome::empty(std::move(err));
        }
        return err;
    }

    record.clear();
    record.setSourceUrl(std::string(url));
    copyHeader(response, "Etag", [&](std::string v) { record.setEtag(std::move(v)); });
    copyHeader(response, "Last-Modified",
               [&](std::string v) { record.setLastModified(std::move(v)); });
    copyHeader(response, "Cache-Control",
               [&](std::string v) { record.setCacheControl(std::move(v)); });

    spdlog::debug("Fetched {} ({} bytes, etag='{}', last_modified='{}')", request.url,
                  response.body.size(), record.etag(), record.lastModified());
    return FetchOutcome::fresh(std::move(response.body));
}

// ---------------- ChannelRepoInterface ----------------

ChannelRepoInterface::ChannelRepoInterface(const ConditionalFetcher& fetcher, std::string url,
                                           std::string filename)
    : fetcher_(fetcher), url_(std::move(url)),
      filename_(filename.empty() ? std::string(kDefaultIndexFilename) : std::move(filename)) {}

FetchResult ChannelRepoInterface::repodata(cache::ValidatorRecord& record) {
    return fetcher_.fetch(url_, filename_, record);
}

// ---------------- describeResponse ----------------

std::string describeResponse(const TransportResponse& response, std::size_t maxBody) {
    std::string out = "< HTTP " + std::to_string(response.status);
    if (response.reason && !response.reason->empty()) {
        out += " " + *response.reason;
    }
    for (const auto& h : response.headers) {
        out += "\n< " + h.name + ": " + h.value;
    }
    out += "\n< Elapsed: " + std::to_string(response.elapsed.count()) + "ms";
    if (!response.body.empty()) {
        out += "\n";
        if (response.body.size() > maxBody) {
            out.append(response.body, 0, maxBody);
            out += " ... (" + std::to_string(response.body.size()) + " bytes)";
        } else {
            out += response.body;
        }
    }
    return out;
}

} // namespace repofetch::fetch
