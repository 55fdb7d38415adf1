#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace repofetch::config {

/**
 * Settings consumed by the fetch layer.
 *
 * Resolution order for every field: environment variable, then the [remote]
 * section of config.toml, then the default below.
 */
struct FetchSettings {
    bool sslVerify{true};
    std::string caPath; // empty = system default

    std::chrono::milliseconds connectTimeout{9150};
    std::chrono::milliseconds readTimeout{60000};

    std::optional<std::string> proxy;

    // Permissive mode: a 403/404 on a noarch subdir means "channel has no content"
    bool allowNonChannelUrls{false};

    std::string channelAlias{"https://conda.anaconda.org"};
    std::string defaultDistributionHost{"https://repo.anaconda.com/"};
    std::string helpUrl{"https://conda.io/docs/config.html"};
};

/**
 * Resolve settings from environment and the given config file. An empty path
 * means "use get_config_path()". A missing config file is not an error.
 */
FetchSettings resolveFetchSettings(const std::filesystem::path& configPath = {});

} // namespace repofetch::config
