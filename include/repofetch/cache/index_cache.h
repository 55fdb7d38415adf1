#pragma once

#include <repofetch/cache/validator_store.h>
#include <repofetch/fetch/conditional_fetcher.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace repofetch::cache {

/**
 * What a refresh produced: the outcome kind, the document text now on disk, and
 * the record that was persisted alongside it.
 */
struct RefreshResult {
    fetch::OutcomeKind kind{fetch::OutcomeKind::NotModified};
    std::string content;
    std::filesystem::path artifactPath;
    ValidatorRecord record;
};

/**
 * Directory of cached index documents, one artifact + state file per channel
 * subdir. Runs the full load -> fetch -> write -> save cycle for a repo.
 */
class IndexCache {
public:
    explicit IndexCache(std::filesystem::path cacheDir);

    /**
     * Refresh the entry for `repo`.
     *
     * Fresh: the body replaces the artifact, then the state is saved.
     * NotModified: the existing artifact is read back unchanged.
     * Empty: "{}" is cached as the artifact so later runs see an empty index.
     * Translated errors are returned untouched; nothing on disk changes.
     */
    Result<RefreshResult, fetch::FetchError> refresh(fetch::IRepoInterface& repo);

    std::filesystem::path artifactPathFor(std::string_view url, std::string_view filename) const;
    ValidatorStore storeFor(std::string_view url, std::string_view filename) const;

    const std::filesystem::path& cacheDir() const noexcept { return cacheDir_; }

private:
    std::filesystem::path cacheDir_;
};

/**
 * Stable file-name key for a URL: 16 lowercase hex digits (FNV-1a 64).
 */
std::string cacheKeyFor(std::string_view url);

} // namespace repofetch::cache
