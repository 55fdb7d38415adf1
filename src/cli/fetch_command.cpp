/*
 * repofetch/src/cli/fetch_command.cpp
 *
 * `repofetch fetch` and `repofetch state` subcommands.
 * - fetch: load validators, conditional GET, write artifact, save validators.
 * - state: show what load() would hand to the next fetch.
 *
 * Output is human-readable by default; --json prints one JSON object on stdout.
 */

#include <repofetch/cache/index_cache.h>
#include <repofetch/cache/validator_store.h>
#include <repofetch/cli/commands.h>
#include <repofetch/config/config_helpers.h>
#include <repofetch/config/fetch_settings.h>
#include <repofetch/fetch/conditional_fetcher.h>
#include <repofetch/fetch/transport.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace repofetch::cli {

namespace {

struct FetchOpts {
    std::string url;
    std::string filename{fetch::kDefaultIndexFilename};
    std::optional<fs::path> cache_dir;
    std::optional<fs::path> config_path;
    bool allow_non_channel_urls{false};
    bool tls_insecure{false};
    bool emit_json{false};
};

json errorToJson(const fetch::FetchError& err) {
    json j = {{"kind", fetch::fetchErrorKindName(err.kind)},
              {"url", err.url},
              {"channel_url", err.channelUrl},
              {"message", err.message},
              {"cause", err.cause}};
    j["status"] = err.status ? json(*err.status) : json(nullptr);
    j["reason"] = err.reason ? json(*err.reason) : json(nullptr);
    j["elapsed_ms"] = err.elapsed ? json(err.elapsed->count()) : json(nullptr);
    return j;
}

int runFetch(const FetchOpts& opts) {
    auto settings = config::resolveFetchSettings(opts.config_path.value_or(fs::path{}));
    if (opts.allow_non_channel_urls) {
        settings.allowNonChannelUrls = true;
    }
    if (opts.tls_insecure) {
        settings.sslVerify = false;
    }

    auto transport = fetch::makeCurlHttpTransport();
    fetch::ConditionalFetcher fetcher(*transport, settings);
    fetch::ChannelRepoInterface repo(fetcher, opts.url, opts.filename);
    cache::IndexCache indexCache(opts.cache_dir.value_or(config::get_cache_dir()));

    auto result = indexCache.refresh(repo);
    if (!result) {
        const auto& err = result.error();
        if (opts.emit_json) {
            fmt::print("{}\n", json{{"success", false}, {"error", errorToJson(err)}}
                                  .dump(-1, ' ', false, json::error_handler_t::replace));
        } else {
            fmt::print(stderr, "{}\n", err.render());
        }
        return kExitFetchError;
    }

    const auto& r = result.value();
    if (opts.emit_json) {
        json out = {{"success", true},
                    {"outcome", fetch::outcomeKindName(r.kind)},
                    {"artifact", r.artifactPath.string()},
                    {"bytes", r.content.size()},
                    {"state", r.record.toJson()}};
        fmt::print("{}\n", out.dump(-1, ' ', false, json::error_handler_t::replace));
    } else {
        fmt::print("{}: {} ({} bytes)\n", fetch::outcomeKindName(r.kind),
                   r.artifactPath.string(), r.content.size());
    }
    return kExitOk;
}

} // namespace

void registerFetchCommand(CLI::App& app) {
    auto* sub = app.add_subcommand(
        "fetch", "Refresh the cached index document of a channel subdir using conditional GET.");

    auto opts = std::make_shared<FetchOpts>();

    sub->add_option("url", opts->url, "Channel subdir URL, e.g. https://host/channel/noarch")
        ->required()
        ->check(CLI::NonEmpty());
    sub->add_option("-f,--filename", opts->filename, "Index document name (default repodata.json).");
    sub->add_option("--cache-dir", opts->cache_dir,
                    "Cache directory (default $XDG_CACHE_HOME/repofetch).");
    sub->add_option("--config", opts->config_path, "Config file (default: standard location).");
    sub->add_flag("--allow-non-channel-urls", opts->allow_non_channel_urls,
                  "Treat a missing noarch index as an empty channel.");
    sub->add_flag("--tls-insecure", opts->tls_insecure,
                  "Disable TLS verification (NOT RECOMMENDED).");
    sub->add_flag("--json", opts->emit_json, "Emit the result as JSON to stdout.");

    sub->callback([opts]() {
        int rc = runFetch(*opts);
        if (rc != kExitOk) {
            throw CLI::RuntimeError(rc);
        }
    });
}

void registerStateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("state", "Show the validator record of a cached document.");

    auto artifact = std::make_shared<fs::path>();
    sub->add_option("artifact", *artifact, "Cached index document (e.g. <key>.json)")
        ->required()
        ->check(CLI::ExistingFile);

    sub->callback([artifact]() {
        cache::ValidatorStore store(*artifact, cache::statePathFor(*artifact));
        auto record = store.load();
        fmt::print("{}\n",
                   record.toJson().dump(2, ' ', false, json::error_handler_t::replace));
    });
}

} // namespace repofetch::cli
