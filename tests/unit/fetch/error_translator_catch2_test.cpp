#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <repofetch/fetch/error_translator.h>

#include <string>
#include <vector>

using namespace repofetch::fetch;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using repofetch::config::FetchSettings;

namespace {

TransportResponse httpStatus(int status, std::string reason = {}) {
    TransportResponse r;
    r.status = status;
    if (!reason.empty())
        r.reason = std::move(reason);
    r.elapsed = std::chrono::milliseconds(61234);
    return r;
}

TransportFailure failure(TransportFailureKind kind, std::string message) {
    return TransportFailure{kind, std::move(message), std::chrono::milliseconds(40)};
}

} // namespace

TEST_CASE("ErrorTranslator proxy failures", "[fetch][errors][proxy]") {
    ErrorTranslator tr{FetchSettings{}};
    auto err = tr.translate(failure(TransportFailureKind::Proxy, "Could not resolve proxy: px"),
                            "https://conda.anaconda.org/conda-forge/linux-64", "repodata.json",
                            true);
    CHECK(err.kind == FetchErrorKind::ProxyError);
    CHECK_THAT(err.message, ContainsSubstring("_PROXY"));
    CHECK(err.url == "https://conda.anaconda.org/conda-forge/linux-64/repodata.json");
    CHECK(err.cause == "Could not resolve proxy: px");
    CHECK_FALSE(err.isSoft());
}

TEST_CASE("ErrorTranslator schema failures", "[fetch][errors][schema]") {
    ErrorTranslator tr{FetchSettings{}};
    const std::string chan = "https://repo.anaconda.com/pkgs/main/linux-64";

    SECTION("SOCKS proxy without support") {
        auto err = tr.translate(
            failure(TransportFailureKind::InvalidSchema,
                    "Missing dependencies for SOCKS support: socks5h://127.0.0.1:9050"),
            chan, "repodata.json", true);
        CHECK(err.kind == FetchErrorKind::MissingOptionalDependency);
        CHECK_THAT(err.message, ContainsSubstring("SOCKS proxy support"));
        CHECK(err.elapsed == std::chrono::milliseconds(40));
    }

    SECTION("other schema failures pass through") {
        auto err = tr.translate(
            failure(TransportFailureKind::InvalidSchema, "Protocol \"gopher\" not supported"),
            chan, "repodata.json", true);
        CHECK(err.kind == FetchErrorKind::Transport);
        CHECK(err.message == "Protocol \"gopher\" not supported");
    }
}

TEST_CASE("ErrorTranslator keeps elapsed time for every failure kind",
          "[fetch][errors][elapsed]") {
    ErrorTranslator tr{FetchSettings{}};
    const std::string chan = "https://conda.anaconda.org/conda-forge/linux-64";

    const std::vector<TransportFailure> failures = {
        failure(TransportFailureKind::Proxy, "Could not resolve proxy: px"),
        failure(TransportFailureKind::InvalidSchema,
                "Missing dependencies for SOCKS support: socks5://px:1080"),
        failure(TransportFailureKind::InvalidSchema, "Protocol \"ftp\" not supported"),
        failure(TransportFailureKind::Tls, "SSL certificate problem"),
        failure(TransportFailureKind::Timeout, "Operation timed out"),
        failure(TransportFailureKind::Connection, "Could not resolve host"),
        failure(TransportFailureKind::Other, "Failure when receiving data"),
    };
    for (const auto& f : failures) {
        for (bool tls : {true, false}) {
            auto err = tr.translate(f, chan, "repodata.json", tls);
            INFO(fetchErrorKindName(err.kind) << ": " << f.message);
            CHECK(err.elapsed == std::chrono::milliseconds(40));
        }
    }
}

TEST_CASE("ErrorTranslator TLS failures", "[fetch][errors][tls]") {
    ErrorTranslator tr{FetchSettings{}};
    const std::string chan = "https://conda.anaconda.org/conda-forge/noarch";

    SECTION("no TLS backend") {
        auto err = tr.translate(failure(TransportFailureKind::Tls, "SSL not compiled in"), chan,
                                "repodata.json", false);
        CHECK(err.kind == FetchErrorKind::TLSUnavailable);
        CHECK_THAT(err.message, ContainsSubstring("No TLS backend"));
        CHECK_THAT(err.message, ContainsSubstring("Exception: SSL not compiled in"));
    }

    SECTION("verification failure") {
        auto err = tr.translate(
            failure(TransportFailureKind::Tls, "SSL certificate problem: self signed certificate"),
            chan, "repodata.json", true);
        CHECK(err.kind == FetchErrorKind::TLSVerificationError);
        CHECK_THAT(err.message, StartsWith("Encountered a TLS error"));
        CHECK_THAT(err.message, ContainsSubstring("self signed certificate"));
    }
}

TEST_CASE("ErrorTranslator 403 and 404", "[fetch][errors][404]") {
    FetchSettings permissive;
    permissive.allowNonChannelUrls = true;

    SECTION("noarch in permissive mode is soft") {
        ErrorTranslator tr{permissive};
        auto err = tr.translate(httpStatus(404, "NOT FOUND"),
                                "https://example.com/chan/noarch/", "repodata.json");
        CHECK(err.kind == FetchErrorKind::EmptyChannel);
        CHECK(err.isSoft());
        CHECK(err.status == 404);
    }

    SECTION("platform subdir is always invalid") {
        ErrorTranslator tr{permissive};
        auto err = tr.translate(httpStatus(403), "https://example.com/chan/linux-64",
                                "repodata.json");
        CHECK(err.kind == FetchErrorKind::InvalidChannel);
        CHECK_THAT(err.message, StartsWith("The channel is not accessible or is invalid."));
        CHECK_THAT(err.message, ContainsSubstring("channel name: chan"));
        CHECK_THAT(err.message, ContainsSubstring("channel url: https://example.com/chan"));
        CHECK_THAT(err.message, ContainsSubstring("noarch/repodata.json"));
    }

    SECTION("noarch without permissive mode is invalid") {
        ErrorTranslator tr{FetchSettings{}};
        auto err = tr.translate(httpStatus(404), "https://example.com/chan/noarch",
                                "repodata.json");
        CHECK(err.kind == FetchErrorKind::InvalidChannel);
    }
}

TEST_CASE("ErrorTranslator 401 messages", "[fetch][errors][401]") {
    ErrorTranslator tr{FetchSettings{}};

    SECTION("token in url") {
        auto err = tr.translate(httpStatus(401),
                                "https://conda.anaconda.org/t/tk-123_abc/private/linux-64",
                                "repodata.json");
        CHECK(err.kind == FetchErrorKind::Unauthorized);
        CHECK_THAT(err.message,
                   ContainsSubstring("The token 'tk-123_abc' given for the URL is invalid."));
    }

    SECTION("channel alias host") {
        auto err = tr.translate(httpStatus(401), "https://conda.anaconda.org/private/linux-64",
                                "repodata.json");
        CHECK(err.kind == FetchErrorKind::Unauthorized);
        CHECK_THAT(err.message, ContainsSubstring("anaconda logout"));
    }

    SECTION("any other host") {
        auto err = tr.translate(httpStatus(401), "https://mirror.example.com/private/linux-64",
                                "repodata.json");
        CHECK(err.kind == FetchErrorKind::Unauthorized);
        CHECK_THAT(err.message,
                   StartsWith("The credentials you have provided for this URL are invalid."));
    }
}

TEST_CASE("ErrorTranslator server and generic errors", "[fetch][errors][http]") {
    ErrorTranslator tr{FetchSettings{}};

    SECTION("5xx") {
        for (int status : {500, 502, 503, 599}) {
            auto err = tr.translate(httpStatus(status), "https://example.com/c/linux-64",
                                    "repodata.json");
            CHECK(err.kind == FetchErrorKind::ServerError);
            CHECK_THAT(err.message, StartsWith("A remote server error occurred"));
        }
    }

    SECTION("generic keeps the unquoted url") {
        auto err = tr.translate(httpStatus(418, "I'm a teapot"),
                                "https://example.com/my%20chan/linux-64", "repodata.json");
        CHECK(err.kind == FetchErrorKind::GenericHTTPError);
        CHECK_THAT(err.message, StartsWith("An HTTP error occurred"));
        CHECK_THAT(err.message, ContainsSubstring("'https://example.com/my chan/linux-64'"));
        CHECK_THAT(err.message, !ContainsSubstring("network engineering team"));
    }

    SECTION("default distribution host adds a network note") {
        auto err = tr.translate(httpStatus(429), "https://repo.anaconda.com/pkgs/main/linux-64",
                                "repodata.json");
        CHECK(err.kind == FetchErrorKind::GenericHTTPError);
        CHECK_THAT(err.message, ContainsSubstring("network engineering team"));
    }

    SECTION("connection failure without a status") {
        auto err = tr.translate(failure(TransportFailureKind::Connection, "Connection refused"),
                                "https://example.com/c/linux-64", "repodata.json", true);
        CHECK(err.kind == FetchErrorKind::GenericHTTPError);
        CHECK_FALSE(err.status);
        CHECK(err.cause == "Connection refused");
    }
}

TEST_CASE("FetchError render", "[fetch][errors][render]") {
    ErrorTranslator tr{FetchSettings{}};

    SECTION("with status") {
        auto err = tr.translate(httpStatus(404, "NOT FOUND"), "https://example.com/c/linux-64",
                                "repodata.json");
        auto text = err.render();
        CHECK_THAT(text, StartsWith("HTTP 404 NOT FOUND for url "
                                    "<https://example.com/c/linux-64/repodata.json>\n"
                                    "Elapsed: 01:01.234\n\n"));
        CHECK_THAT(text, ContainsSubstring(err.message));
    }

    SECTION("without status includes the cause once") {
        auto err = tr.translate(failure(TransportFailureKind::Timeout, "Operation timed out"),
                                "https://example.com/c/linux-64", "repodata.json", true);
        auto text = err.render();
        CHECK_THAT(text, StartsWith("GenericHTTPError for url"));
        CHECK_THAT(text, ContainsSubstring("Elapsed: 00:00.040"));
        CHECK_THAT(text, ContainsSubstring("Operation timed out"));
    }
}
