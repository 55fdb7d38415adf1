#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace repofetch::fetch {

/**
 * Closed set of failures a fetch can report.
 */
enum class FetchErrorKind {
    ProxyError,
    MissingOptionalDependency,
    TLSUnavailable,
    TLSVerificationError,
    InvalidChannel,
    EmptyChannel, // soft: channel exists but serves nothing for this subdir
    Unauthorized,
    ServerError,
    GenericHTTPError,
    Transport // transport failure passed through untranslated
};

constexpr const char* fetchErrorKindName(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::ProxyError: return "ProxyError";
        case FetchErrorKind::MissingOptionalDependency: return "MissingOptionalDependency";
        case FetchErrorKind::TLSUnavailable: return "TLSUnavailable";
        case FetchErrorKind::TLSVerificationError: return "TLSVerificationError";
        case FetchErrorKind::InvalidChannel: return "InvalidChannel";
        case FetchErrorKind::EmptyChannel: return "EmptyChannel";
        case FetchErrorKind::Unauthorized: return "Unauthorized";
        case FetchErrorKind::ServerError: return "ServerError";
        case FetchErrorKind::GenericHTTPError: return "GenericHTTPError";
        case FetchErrorKind::Transport: return "Transport";
    }
    return "Transport";
}

/**
 * Translated fetch failure. `message` is the multi-line explanation meant for
 * users; the remaining fields are the structured context for logs and callers.
 */
struct FetchError {
    FetchErrorKind kind{FetchErrorKind::GenericHTTPError};
    std::string message;
    std::string url;        // full URL of the requested document
    std::string channelUrl; // channel subdir URL the document was requested from
    std::optional<int> status{};
    std::optional<std::string> reason{};
    std::optional<std::chrono::milliseconds> elapsed{};
    std::string cause; // description of the underlying transport failure or response

    [[nodiscard]] bool isSoft() const noexcept { return kind == FetchErrorKind::EmptyChannel; }

    // Headline plus message, e.g.
    //   HTTP 404 NOT FOUND for url <https://host/chan/noarch/repodata.json>
    //   Elapsed: 00:00.120
    //
    //   <message>
    [[nodiscard]] std::string render() const;
};

} // namespace repofetch::fetch
