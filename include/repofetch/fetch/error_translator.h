#pragma once

#include <repofetch/config/fetch_settings.h>
#include <repofetch/fetch/fetch_error.h>
#include <repofetch/fetch/transport.h>

#include <optional>
#include <string>
#include <string_view>

namespace repofetch::fetch {

/**
 * Maps transport failures and unsuccessful HTTP responses onto FetchError.
 *
 * `channelUrl` is the subdir URL the document lives under (".../linux-64",
 * ".../noarch") and `filename` the document name; the target URL reported in the
 * error is their join.
 */
class ErrorTranslator {
public:
    explicit ErrorTranslator(config::FetchSettings settings);

    [[nodiscard]] FetchError translate(const TransportFailure& failure,
                                       std::string_view channelUrl, std::string_view filename,
                                       bool tlsAvailable) const;

    [[nodiscard]] FetchError translate(const TransportResponse& response,
                                       std::string_view channelUrl,
                                       std::string_view filename) const;

    const config::FetchSettings& settings() const noexcept { return settings_; }

private:
    struct HttpContext {
        std::optional<int> status;
        std::optional<std::string> reason;
        std::optional<std::chrono::milliseconds> elapsed;
        std::string cause;
    };

    FetchError translateHttp(HttpContext ctx, std::string_view channelUrl,
                             std::string_view filename) const;

    FetchError forbiddenOrMissing(HttpContext ctx, std::string_view channelUrl,
                                  std::string_view filename) const;

    std::string unauthorizedMessage(std::string_view channelUrl) const;

    config::FetchSettings settings_;
};

} // namespace repofetch::fetch
