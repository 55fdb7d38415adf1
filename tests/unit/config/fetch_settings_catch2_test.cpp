#include <catch2/catch_test_macros.hpp>

#include <repofetch/config/config_helpers.h>
#include <repofetch/config/fetch_settings.h>

#include "../../support/temp_dir_scope.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace repofetch::config;
using repofetch::test_support::TempDirScope;

namespace {

// Sets (or unsets) an environment variable for the scope and restores it afterwards.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
            old_ = std::string(old);
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }
    ~EnvGuard() {
        if (old_)
            ::setenv(name_.c_str(), old_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
    std::optional<std::string> old_;
};

// Clears every variable resolveFetchSettings reads so the host environment cannot leak in.
struct CleanFetchEnv {
    EnvGuard sslVerify{"REPOFETCH_SSL_VERIFY", nullptr};
    EnvGuard caPath{"REPOFETCH_CA_PATH", nullptr};
    EnvGuard connect{"REPOFETCH_CONNECT_TIMEOUT_MS", nullptr};
    EnvGuard read{"REPOFETCH_READ_TIMEOUT_MS", nullptr};
    EnvGuard proxy{"REPOFETCH_PROXY", nullptr};
    EnvGuard permissive{"REPOFETCH_ALLOW_NON_CHANNEL_URLS", nullptr};
    EnvGuard alias{"REPOFETCH_CHANNEL_ALIAS", nullptr};
    EnvGuard host{"REPOFETCH_DEFAULT_HOST", nullptr};
};

fs::path writeConfig(const fs::path& dir, const std::string& text) {
    auto p = dir / "config.toml";
    std::ofstream out(p, std::ios::trunc);
    out << text;
    return p;
}

} // namespace

TEST_CASE("config helpers parse primitive values", "[config][helpers]") {
    CHECK(parse_bool(" Yes ") == std::optional<bool>(true));
    CHECK(parse_bool("off") == std::optional<bool>(false));
    CHECK_FALSE(parse_bool("maybe"));

    CHECK(parse_ms("250") == std::optional<std::chrono::milliseconds>(250));
    CHECK_FALSE(parse_ms("-1"));
    CHECK_FALSE(parse_ms("10s"));
    CHECK_FALSE(parse_ms(""));

    CHECK(unquote("  \"quoted\"  ") == "quoted");
    CHECK(unquote("'single'") == "single");
}

TEST_CASE("parse_config_value reads sections and dotted keys", "[config][helpers]") {
    auto tmp = TempDirScope::unique_under("repofetch-config");
    auto path = writeConfig(tmp.path(), "remote.proxy = \"http://dotted:1\"\n"
                                        "# comment\n"
                                        "[other]\n"
                                        "ssl_verify = false\n"
                                        "[remote]\n"
                                        "ssl_verify = true # trailing\n");

    CHECK(parse_config_value(path, "remote", "ssl_verify") == std::optional<std::string>("true"));
    CHECK(parse_config_value(path, "other", "ssl_verify") == std::optional<std::string>("false"));
    CHECK(parse_config_value(path, "remote", "proxy") ==
          std::optional<std::string>("http://dotted:1"));
    CHECK_FALSE(parse_config_value(path, "remote", "missing"));
    CHECK_FALSE(parse_config_value(tmp.path() / "nope.toml", "remote", "proxy"));
}

TEST_CASE("get_config_path honours override and environment", "[config][helpers]") {
    CHECK(get_config_path("/tmp/x.toml") == fs::path("/tmp/x.toml"));

    SECTION("REPOFETCH_CONFIG") {
        EnvGuard cfg("REPOFETCH_CONFIG", "/etc/repofetch.toml");
        CHECK(get_config_path() == fs::path("/etc/repofetch.toml"));
    }

    SECTION("XDG_CONFIG_HOME") {
        EnvGuard cfg("REPOFETCH_CONFIG", nullptr);
        EnvGuard xdg("XDG_CONFIG_HOME", "/xdg");
        CHECK(get_config_path() == fs::path("/xdg/repofetch/config.toml"));
    }
}

TEST_CASE("resolveFetchSettings defaults", "[config][settings]") {
    CleanFetchEnv clean;
    auto tmp = TempDirScope::unique_under("repofetch-config");
    auto s = resolveFetchSettings(tmp.path() / "absent.toml");

    CHECK(s.sslVerify);
    CHECK(s.caPath.empty());
    CHECK(s.connectTimeout == std::chrono::milliseconds(9150));
    CHECK(s.readTimeout == std::chrono::milliseconds(60000));
    CHECK_FALSE(s.proxy);
    CHECK_FALSE(s.allowNonChannelUrls);
    CHECK(s.channelAlias == "https://conda.anaconda.org");
    CHECK(s.defaultDistributionHost == "https://repo.anaconda.com/");
    CHECK(s.helpUrl == "https://conda.io/docs/config.html");
}

TEST_CASE("resolveFetchSettings reads the remote section", "[config][settings]") {
    CleanFetchEnv clean;
    auto tmp = TempDirScope::unique_under("repofetch-config");
    auto path = writeConfig(tmp.path(), "[remote]\n"
                                        "ssl_verify = no\n"
                                        "connect_timeout_ms = 1000\n"
                                        "read_timeout_ms = 2000\n"
                                        "proxy = \"http://proxy:8080\"\n"
                                        "allow_non_channel_urls = true\n"
                                        "channel_alias = \"https://mirror.example.com\"\n"
                                        "help_url = \"https://docs.example.com\"\n");

    auto s = resolveFetchSettings(path);
    CHECK_FALSE(s.sslVerify);
    CHECK(s.connectTimeout == std::chrono::milliseconds(1000));
    CHECK(s.readTimeout == std::chrono::milliseconds(2000));
    CHECK(s.proxy == std::optional<std::string>("http://proxy:8080"));
    CHECK(s.allowNonChannelUrls);
    CHECK(s.channelAlias == "https://mirror.example.com");
    CHECK(s.helpUrl == "https://docs.example.com");

    SECTION("environment wins over the file") {
        EnvGuard verify("REPOFETCH_SSL_VERIFY", "1");
        EnvGuard read("REPOFETCH_READ_TIMEOUT_MS", "42");
        auto e = resolveFetchSettings(path);
        CHECK(e.sslVerify);
        CHECK(e.readTimeout == std::chrono::milliseconds(42));
        CHECK(e.connectTimeout == std::chrono::milliseconds(1000));
    }

    SECTION("invalid values keep the default") {
        EnvGuard connect("REPOFETCH_CONNECT_TIMEOUT_MS", "soon");
        EnvGuard verify("REPOFETCH_SSL_VERIFY", "perhaps");
        auto e = resolveFetchSettings(path);
        CHECK(e.connectTimeout == std::chrono::milliseconds(9150));
        CHECK(e.sslVerify);
    }
}
