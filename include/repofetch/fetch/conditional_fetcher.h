#pragma once

#include <repofetch/cache/validator_store.h>
#include <repofetch/config/fetch_settings.h>
#include <repofetch/core/types.h>
#include <repofetch/fetch/error_translator.h>
#include <repofetch/fetch/fetch_error.h>
#include <repofetch/fetch/transport.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace repofetch::fetch {

inline constexpr const char* kDefaultIndexFilename = "repodata.json";

enum class OutcomeKind {
    Fresh,       // new body; record repopulated from response headers
    NotModified, // 304; reuse the cached artifact
    Empty        // channel serves nothing here; cache an empty index
};

constexpr const char* outcomeKindName(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Fresh: return "fresh";
        case OutcomeKind::NotModified: return "not-modified";
        case OutcomeKind::Empty: return "empty";
    }
    return "fresh";
}

/**
 * Successful result of a conditional fetch.
 */
struct FetchOutcome {
    OutcomeKind kind{OutcomeKind::NotModified};
    std::string body;                      // Fresh only
    std::optional<FetchError> emptyReason; // Empty only

    static FetchOutcome fresh(std::string body) {
        return FetchOutcome{OutcomeKind::Fresh, std::move(body), std::nullopt};
    }
    static FetchOutcome notModified() { return FetchOutcome{OutcomeKind::NotModified, {}, {}}; }
    static FetchOutcome empty(FetchError reason) {
        return FetchOutcome{OutcomeKind::Empty, {}, std::move(reason)};
    }
};

using FetchResult = Result<FetchOutcome, FetchError>;

/**
 * Issues one conditional GET per call using the validators in a ValidatorRecord.
 *
 * No retries, no threads: the transport call is the only blocking operation and
 * is bounded by the configured timeouts.
 */
class ConditionalFetcher {
public:
    ConditionalFetcher(IHttpTransport& transport, config::FetchSettings settings);

    /**
     * GET join(url, filename).
     *
     * 304 leaves `record` untouched. 2xx clears it and stores the url plus whichever
     * of ETag, Last-Modified and Cache-Control the response carried. Anything else
     * goes through ErrorTranslator; an EmptyChannel translation is reported as
     * OutcomeKind::Empty.
     */
    FetchResult fetch(std::string_view url, std::string_view filename,
                      cache::ValidatorRecord& record) const;

    // If-None-Match / If-Modified-Since for the non-empty validators of `record`.
    static std::vector<Header> conditionalHeaders(const cache::ValidatorRecord& record);

    TransportRequest buildRequest(std::string_view url, std::string_view filename,
                                  const cache::ValidatorRecord& record) const;

    const config::FetchSettings& settings() const noexcept { return settings_; }

private:
    IHttpTransport& transport_;
    config::FetchSettings settings_;
    ErrorTranslator translator_;
};

/**
 * Source of one index document; the caller owns the record and persists it.
 */
class IRepoInterface {
public:
    virtual ~IRepoInterface() = default;

    virtual FetchResult repodata(cache::ValidatorRecord& record) = 0;

    [[nodiscard]] virtual std::string url() const = 0;
    [[nodiscard]] virtual std::string filename() const = 0;
};

/**
 * Binds a channel subdir URL and index filename to a ConditionalFetcher.
 */
class ChannelRepoInterface final : public IRepoInterface {
public:
    ChannelRepoInterface(const ConditionalFetcher& fetcher, std::string url,
                         std::string filename = kDefaultIndexFilename);

    FetchResult repodata(cache::ValidatorRecord& record) override;

    std::string url() const override { return url_; }
    std::string filename() const override { return filename_; }

private:
    const ConditionalFetcher& fetcher_;
    std::string url_;
    std::string filename_;
};

// Status line, headers and the first `maxBody` bytes of the body, for debug logs.
std::string describeResponse(const TransportResponse& response, std::size_t maxBody = 256);

} // namespace repofetch::fetch
