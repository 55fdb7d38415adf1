#include <repofetch/config/config_helpers.h>
#include <repofetch/config/fetch_settings.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace repofetch::config {

namespace {

constexpr const char* kSection = "remote";

// env -> config file -> nullopt
std::optional<std::string> lookup(const std::filesystem::path& configPath, const char* envName,
                                  const char* key) {
    if (envName != nullptr) {
        if (const char* env = std::getenv(envName); env && *env) {
            return std::string(env);
        }
    }
    if (configPath.empty())
        return std::nullopt;
    return parse_config_value(configPath, kSection, key);
}

void applyBool(const std::filesystem::path& configPath, const char* envName, const char* key,
               bool& out) {
    if (auto raw = lookup(configPath, envName, key)) {
        if (auto v = parse_bool(*raw)) {
            out = *v;
        } else {
            spdlog::warn("Ignoring invalid boolean for remote.{}: '{}'", key, *raw);
        }
    }
}

void applyMs(const std::filesystem::path& configPath, const char* envName, const char* key,
             std::chrono::milliseconds& out) {
    if (auto raw = lookup(configPath, envName, key)) {
        if (auto v = parse_ms(*raw)) {
            out = *v;
        } else {
            spdlog::warn("Ignoring invalid duration for remote.{}: '{}'", key, *raw);
        }
    }
}

void applyString(const std::filesystem::path& configPath, const char* envName, const char* key,
                 std::string& out) {
    if (auto raw = lookup(configPath, envName, key); raw && !raw->empty()) {
        out = *raw;
    }
}

} // namespace

FetchSettings resolveFetchSettings(const std::filesystem::path& configPath) {
    const auto path = configPath.empty() ? get_config_path() : configPath;

    FetchSettings s;
    applyBool(path, "REPOFETCH_SSL_VERIFY", "ssl_verify", s.sslVerify);
    applyString(path, "REPOFETCH_CA_PATH", "ca_path", s.caPath);
    if (!s.caPath.empty()) {
        s.caPath = expand_tilde(s.caPath).string();
    }
    applyMs(path, "REPOFETCH_CONNECT_TIMEOUT_MS", "connect_timeout_ms", s.connectTimeout);
    applyMs(path, "REPOFETCH_READ_TIMEOUT_MS", "read_timeout_ms", s.readTimeout);
    if (auto proxy = lookup(path, "REPOFETCH_PROXY", "proxy"); proxy && !proxy->empty()) {
        s.proxy = *proxy;
    }
    applyBool(path, "REPOFETCH_ALLOW_NON_CHANNEL_URLS", "allow_non_channel_urls",
              s.allowNonChannelUrls);
    applyString(path, "REPOFETCH_CHANNEL_ALIAS", "channel_alias", s.channelAlias);
    applyString(path, "REPOFETCH_DEFAULT_HOST", "default_distribution_host",
                s.defaultDistributionHost);
    applyString(path, nullptr, "help_url", s.helpUrl);

    spdlog::debug("Fetch settings: ssl_verify={} connect_timeout={}ms read_timeout={}ms "
                  "allow_non_channel_urls={} channel_alias={}",
                  s.sslVerify, s.connectTimeout.count(), s.readTimeout.count(),
                  s.allowNonChannelUrls, s.channelAlias);
    return s;
}

} // namespace repofetch::config
