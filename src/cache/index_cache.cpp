#include <repofetch/cache/file_io.h>
#include <repofetch/cache/index_cache.h>
#include <repofetch/fetch/url.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <utility>

namespace repofetch::cache {

namespace fs = std::filesystem;

namespace {

constexpr const char* kEmptyIndex = "{}";

} // namespace

std::string cacheKeyFor(std::string_view url) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : url) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return fmt::format("{:016x}", h);
}

IndexCache::IndexCache(fs::path cacheDir) : cacheDir_(std::move(cacheDir)) {}

fs::path IndexCache::artifactPathFor(std::string_view url, std::string_view filename) const {
    return cacheDir_ / (cacheKeyFor(fetch::url::joinUrl(url, filename)) + ".json");
}

ValidatorStore IndexCache::storeFor(std::string_view url, std::string_view filename) const {
    auto artifact = artifactPathFor(url, filename);
    auto state = statePathFor(artifact);
    return ValidatorStore(std::move(artifact), std::move(state), std::string(filename));
}

Result<RefreshResult, fetch::FetchError> IndexCache::refresh(fetch::IRepoInterface& repo) {
    const auto url = repo.url();
    const auto filename = repo.filename();
    auto store = storeFor(url, filename);

    RefreshResult out;
    out.artifactPath = store.artifactPath();
    out.record = store.load();

    auto fetched = repo.repodata(out.record);
    if (!fetched) {
        return fetched.error();
    }

    auto& outcome = fetched.value();
    out.kind = outcome.kind;

    // Failures to persist are logged but not fatal: the caller still gets the
    // content, and a stale or missing state only forces a full fetch next time.
    auto persist = [&](std::string_view content) {
        if (auto w = writeFileAtomic(store.artifactPath(), content); !w) {
            spdlog::warn("Failed to write cached {} for {}: {}", filename, url,
                         w.error().message);
            return;
        }
        if (auto s = store.save(out.record); !s) {
            spdlog::warn("Failed to save cache state for {}: {}", url, s.error().message);
        }
    };

    switch (outcome.kind) {
        case fetch::OutcomeKind::Fresh:
            persist(outcome.body);
            out.content = std::move(outcome.body);
            break;

        case fetch::OutcomeKind::NotModified: {
            auto text = readFile(store.artifactPath());
            if (text) {
                out.content = std::move(text).value();
            } else {
                spdlog::debug("304 for {} but no cached artifact: {}", url,
                              text.error().message);
            }
            break;
        }

        case fetch::OutcomeKind::Empty:
            out.record.clear();
            out.record.setSourceUrl(url);
            persist(kEmptyIndex);
            out.content = kEmptyIndex;
            break;
    }

    spdlog::debug("Refreshed {} -> {} ({})", fetch::url::joinUrl(url, filename),
                  out.artifactPath.string(), fetch::outcomeKindName(out.kind));
    return out;
}

} // namespace repofetch::cache
