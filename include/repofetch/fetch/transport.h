#pragma once

/*
 * HTTP transport abstraction for the fetch layer.
 *
 * The conditional fetcher only needs one capability: a synchronous GET that
 * reports either a complete response (any HTTP status) or a transport failure
 * classified well enough for ErrorTranslator to act on. Connection pooling,
 * TLS and proxy resolution all live behind this interface.
 */

#include <repofetch/core/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace repofetch::fetch {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

struct Timeouts {
    std::chrono::milliseconds connect{9150};
    // Abort when no bytes arrive for this long
    std::chrono::milliseconds read{60000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

struct TransportRequest {
    std::string url;
    std::vector<Header> headers;
    Timeouts timeout{};
    std::optional<std::string> proxy;
    TlsConfig tls{};
    // Set when the caller already knows verification is off and does not want a
    // warning per request.
    bool suppressInsecureWarning{false};
};

struct TransportResponse {
    int status{0};
    std::optional<std::string> reason;
    std::vector<Header> headers;
    std::string body;
    std::chrono::milliseconds elapsed{0};

    // Case-insensitive lookup; first occurrence wins.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

enum class TransportFailureKind {
    Proxy,         // proxy could not be resolved or refused the tunnel
    InvalidSchema, // URL or proxy scheme the transport cannot handle
    Tls,           // handshake or certificate verification failed
    Timeout,
    Connection, // DNS, connect, send or receive failure
    Other
};

constexpr const char* transportFailureKindName(TransportFailureKind kind) {
    switch (kind) {
        case TransportFailureKind::Proxy: return "proxy";
        case TransportFailureKind::InvalidSchema: return "invalid-schema";
        case TransportFailureKind::Tls: return "tls";
        case TransportFailureKind::Timeout: return "timeout";
        case TransportFailureKind::Connection: return "connection";
        case TransportFailureKind::Other: return "other";
    }
    return "other";
}

struct TransportFailure {
    TransportFailureKind kind{TransportFailureKind::Other};
    std::string message;
    std::optional<std::chrono::milliseconds> elapsed{};
};

/**
 * Synchronous HTTP GET capability.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * Perform one GET. HTTP error statuses are returned as responses, not failures.
     */
    virtual Result<TransportResponse, TransportFailure> get(const TransportRequest& request) = 0;

    /**
     * Whether the transport was built with a TLS backend at all.
     */
    [[nodiscard]] virtual bool tlsAvailable() const = 0;
};

/**
 * Factory for the libcurl-backed transport.
 */
std::unique_ptr<IHttpTransport> makeCurlHttpTransport();

} // namespace repofetch::fetch
