#include <repofetch/fetch/error_translator.h>
#include <repofetch/fetch/url.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace repofetch::fetch {

namespace {

constexpr const char* kNoArchSubdir = "noarch";

FetchError makeError(FetchErrorKind kind, std::string message, std::string_view channelUrl,
                     std::string_view filename) {
    FetchError err;
    err.kind = kind;
    err.message = std::move(message);
    err.channelUrl = std::string(channelUrl);
    err.url = url::joinUrl(channelUrl, filename);
    return err;
}

bool mentionsSocks(std::string_view message) {
    return message.find("SOCKS") != std::string_view::npos ||
           message.find("socks") != std::string_view::npos;
}

std::string proxyMessage() {
    return "The request could not be completed because of an error in the proxy "
           "configuration.\n"
           "Check the proxy settings for typos: the 'proxy' key of the [remote] config\n"
           "section, environment variables ending in '_PROXY' (HTTPS_PROXY, HTTP_PROXY,\n"
           "ALL_PROXY), credentials in ~/.netrc, and any system-wide proxy settings.\n";
}

std::string socksMessage() {
    return "The environment is configured to use a SOCKS proxy, but the HTTP transport\n"
           "was built without SOCKS proxy support. To proceed, remove the proxy\n"
           "configuration, install a libcurl build with SOCKS support, and then re-enable\n"
           "the proxy configuration.\n";
}

} // namespace

ErrorTranslator::ErrorTranslator(config::FetchSettings settings) : settings_(std::move(settings)) {}

FetchError ErrorTranslator::translate(const TransportFailure& failure, std::string_view channelUrl,
                                      std::string_view filename, bool tlsAvailable) const {
    switch (failure.kind) {
        case TransportFailureKind::Proxy: {
            auto err = makeError(FetchErrorKind::ProxyError, proxyMessage(), channelUrl, filename);
            err.cause = failure.message;
            err.elapsed = failure.elapsed;
            return err;
        }

        case TransportFailureKind::InvalidSchema: {
            if (mentionsSocks(failure.message)) {
                auto err = makeError(FetchErrorKind::MissingOptionalDependency, socksMessage(),
                                     channelUrl, filename);
                err.cause = failure.message;
                err.elapsed = failure.elapsed;
                return err;
            }
            // Not ours to interpret; hand the transport's own description back.
            auto err = makeError(FetchErrorKind::Transport, failure.message, channelUrl, filename);
            err.cause = failure.message;
            err.elapsed = failure.elapsed;
            return err;
        }

        case TransportFailureKind::Tls: {
            FetchError err;
            if (!tlsAvailable) {
                err = makeError(FetchErrorKind::TLSUnavailable,
                                "No TLS backend appears to be available on this machine. TLS is\n"
                                "required to download package index data over https.\n\n"
                                "Exception: " +
                                    failure.message + "\n",
                                channelUrl, filename);
            } else {
                err = makeError(FetchErrorKind::TLSVerificationError,
                                "Encountered a TLS error. Most likely a certificate verification "
                                "issue.\n\n"
                                "Exception: " +
                                    failure.message + "\n",
                                channelUrl, filename);
            }
            err.cause = failure.message;
            err.elapsed = failure.elapsed;
            return err;
        }

        case TransportFailureKind::Timeout:
        case TransportFailureKind::Connection:
        case TransportFailureKind::Other:
            break;
    }

    // No HTTP response at all: handled like an HTTP failure without a status.
    return translateHttp(HttpContext{std::nullopt, std::nullopt, failure.elapsed, failure.message},
                         channelUrl, filename);
}

FetchError ErrorTranslator::translate(const TransportResponse& response,
                                      std::string_view channelUrl,
                                      std::string_view filename) const {
    std::string cause = "HTTP " + std::to_string(response.status);
    if (response.reason && !response.reason->empty()) {
        cause += " " + *response.reason;
    }
    return translateHttp(HttpContext{response.status, response.reason, response.elapsed,
                                     std::move(cause)},
                         channelUrl, filename);
}

FetchError ErrorTranslator::translateHttp(HttpContext ctx, std::string_view channelUrl,
                                          std::string_view filename) const {
    const auto status = ctx.status;

    if (status && (*status == 403 || *status == 404)) {
        return forbiddenOrMissing(std::move(ctx), channelUrl, filename);
    }

    FetchErrorKind kind = FetchErrorKind::GenericHTTPError;
    std::string message;
    if (status && *status == 401) {
        kind = FetchErrorKind::Unauthorized;
        message = unauthorizedMessage(channelUrl);
    } else if (status && *status >= 500 && *status < 600) {
        kind = FetchErrorKind::ServerError;
        message =
            "A remote server error occurred when trying to retrieve this URL.\n\n"
            "A 500-type error (e.g. 500, 501, 502, 503, etc.) indicates the server failed to\n"
            "fulfill a valid request. The problem may be spurious, and will resolve itself if\n"
            "you try your request again. If the problem persists, consider notifying the\n"
            "maintainer of the remote server.\n";
    } else {
        const auto quoted = "'" + url::unquote(channelUrl) + "'";
        message = "An HTTP error occurred when trying to retrieve this URL.\n"
                  "HTTP errors are often intermittent, and a simple retry will get you on your "
                  "way.\n";
        if (!settings_.defaultDistributionHost.empty() &&
            channelUrl.starts_with(settings_.defaultDistributionHost)) {
            message += "\nIf your current network blocks " + settings_.defaultDistributionHost +
                       ", please file\na support request with your network engineering team.\n";
            message += "\n" + quoted + "\n";
        } else {
            message += quoted + "\n";
        }
    }

    auto err = makeError(kind, std::move(message), channelUrl, filename);
    err.status = ctx.status;
    err.reason = std::move(ctx.reason);
    err.elapsed = ctx.elapsed;
    err.cause = std::move(ctx.cause);
    return err;
}

FetchError ErrorTranslator::forbiddenOrMissing(HttpContext ctx, std::string_view channelUrl,
                                               std::string_view filename) const {
    const int status = ctx.status.value_or(404);
    const auto target = url::joinUrl(channelUrl, filename);
    const auto channelRoot = url::dirname(channelUrl);

    FetchErrorKind kind = FetchErrorKind::InvalidChannel;
    if (url::lastSegment(channelUrl) == kNoArchSubdir && settings_.allowNonChannelUrls) {
        kind = FetchErrorKind::EmptyChannel;
        spdlog::warn("Unable to retrieve repodata (response: {}) for {}", status, target);
    } else {
        spdlog::info("Unable to retrieve repodata (response: {}) for {}", status, target);
    }

    std::string message;
    if (kind == FetchErrorKind::EmptyChannel) {
        message = "The channel at <" + channelRoot +
                  "> does not serve a noarch index; treating it as empty.\n";
    } else {
        message = "The channel is not accessible or is invalid.\n"
                  "  channel name: " +
                  url::lastSegment(channelRoot) +
                  "\n"
                  "  channel url: " +
                  channelRoot +
                  "\n\n"
                  "You will need to adjust your channel configuration to proceed.\n"
                  "A valid channel must contain a 'noarch/" +
                  std::string(filename) +
                  "' file, even when it lists no packages.\n";
        if (!settings_.helpUrl.empty()) {
            message += "Further configuration help can be found at <" + settings_.helpUrl + ">.\n";
        }
    }

    auto err = makeError(kind, std::move(message), channelUrl, filename);
    err.status = status;
    err.reason = std::move(ctx.reason);
    err.elapsed = ctx.elapsed;
    err.cause = std::move(ctx.cause);
    return err;
}

std::string ErrorTranslator::unauthorizedMessage(std::string_view channelUrl) const {
    const auto help = settings_.helpUrl.empty()
                          ? std::string{}
                          : "Further configuration help can be found at <" + settings_.helpUrl +
                                ">.\n";

    if (auto token = url::extractToken(channelUrl)) {
        return "The token '" + *token +
               "' given for the URL is invalid.\n\n"
               "If this token was pulled from anaconda-client, you will need to use\n"
               "anaconda-client to reauthenticate.\n\n"
               "If you supplied this token directly, you will need to adjust your\n"
               "channel configuration to proceed.\n\n" +
               help;
    }

    const auto aliasLocation = url::location(settings_.channelAlias);
    if (!aliasLocation.empty() && channelUrl.find(aliasLocation) != std::string_view::npos) {
        return "The remote server has indicated you are using invalid credentials for this "
               "channel.\n\n"
               "If the remote site is anaconda.org or follows the Anaconda Server API, you\n"
               "will need to\n"
               "    (a) remove the invalid token from your system with `anaconda logout`,\n"
               "        optionally followed by collecting a new token with `anaconda login`, or\n"
               "    (b) provide a valid token directly in the channel URL.\n\n" +
               help;
    }

    return "The credentials you have provided for this URL are invalid.\n\n"
           "You will need to modify your configuration to proceed.\n" +
           help;
}

// ---------------- FetchError ----------------

std::string FetchError::render() const {
    std::string out;
    if (status) {
        out = "HTTP " + std::to_string(*status);
        if (reason && !reason->empty()) {
            out += " " + *reason;
        }
        out += " for url <" + url + ">";
    } else {
        out = std::string(fetchErrorKindName(kind)) + " for url <" + url + ">";
    }
    if (elapsed) {
        const auto ms = elapsed->count();
        out += fmt::format("\nElapsed: {:02}:{:02}.{:03}", ms / 60000, (ms / 1000) % 60,
                           ms % 1000);
    }
    out += "\n\n";
    out += message;
    if (!cause.empty() && !status && message.find(cause) == std::string::npos) {
        out += "\n" + cause + "\n";
    }
    return out;
}

} // namespace repofetch::fetch
