#pragma once

#include <repofetch/cache/file_io.h>
#include <repofetch/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace repofetch::cache {

// Canonical keys of the state file
inline constexpr const char* kKeyEtag = "etag";
inline constexpr const char* kKeyMod = "mod";
inline constexpr const char* kKeyCacheControl = "cache_control";
inline constexpr const char* kKeySize = "size";
inline constexpr const char* kKeyMtimeNs = "mtime_ns";
inline constexpr const char* kKeyUrl = "url";

/**
 * Cache validators and artifact stat for one cached index document.
 *
 * Every field is either present or absent. Accessors never fail: an absent string
 * reads as "" and an absent number as 0. Keys this type does not know about are
 * kept in extras() and written back unchanged.
 */
class ValidatorRecord {
public:
    ValidatorRecord() = default;

    std::string etag() const { return etag_.value_or(""); }
    std::string lastModified() const { return lastModified_.value_or(""); }
    std::string cacheControl() const { return cacheControl_.value_or(""); }
    std::string sourceUrl() const { return sourceUrl_.value_or(""); }
    std::uint64_t size() const { return size_.value_or(0); }
    std::int64_t mtimeNs() const { return mtimeNs_.value_or(0); }

    bool hasEtag() const noexcept { return etag_.has_value(); }
    bool hasLastModified() const noexcept { return lastModified_.has_value(); }
    bool hasCacheControl() const noexcept { return cacheControl_.has_value(); }
    bool hasSourceUrl() const noexcept { return sourceUrl_.has_value(); }
    bool hasSize() const noexcept { return size_.has_value(); }
    bool hasMtimeNs() const noexcept { return mtimeNs_.has_value(); }

    void setEtag(std::string v) { etag_ = std::move(v); }
    void setLastModified(std::string v) { lastModified_ = std::move(v); }
    void setCacheControl(std::string v) { cacheControl_ = std::move(v); }
    void setSourceUrl(std::string v) { sourceUrl_ = std::move(v); }
    void setSize(std::uint64_t v) { size_ = v; }
    void setMtimeNs(std::int64_t v) { mtimeNs_ = v; }

    const nlohmann::json& extras() const noexcept { return extras_; }
    void setExtra(const std::string& key, nlohmann::json value);

    // Drop every field, extras included.
    void clear();
    bool empty() const noexcept;

    // Reset etag/mod/cache_control to "" and size to 0. Everything else stays.
    void invalidateValidators();

    // True when the recorded size and mtime_ns both equal the artifact's stat.
    bool matches(const ArtifactStat& stat) const noexcept;

    nlohmann::json toJson() const;

    // Expects canonical keys (see migrateLegacyFields). Well-known keys holding a
    // value of the wrong JSON type are dropped.
    static ValidatorRecord fromJson(const nlohmann::json& j);

    bool operator==(const ValidatorRecord& other) const = default;

private:
    std::optional<std::string> etag_;
    std::optional<std::string> lastModified_;
    std::optional<std::string> cacheControl_;
    std::optional<std::string> sourceUrl_;
    std::optional<std::uint64_t> size_;
    std::optional<std::int64_t> mtimeNs_;
    nlohmann::json extras_ = nlohmann::json::object();
};

/**
 * Rewrite legacy underscore-prefixed keys (_mod, _etag, _cache_control, _url) to
 * their canonical names. A canonical key already present wins over its alias.
 * Returns the number of aliases removed.
 */
std::size_t migrateLegacyFields(nlohmann::json& state);

/**
 * Conventional state file path for an artifact: "<dir>/<stem>.state.json".
 */
std::filesystem::path statePathFor(const std::filesystem::path& artifactPath);

/**
 * Loads and saves the state file that sits beside a cached index document.
 *
 * The record read back is only trusted while the artifact's (size, mtime_ns) is
 * what save() recorded; otherwise its validators are cleared so the next fetch is
 * unconditional. Not safe against concurrent writers of the same entry.
 */
class ValidatorStore {
public:
    ValidatorStore(std::filesystem::path artifactPath, std::filesystem::path statePath,
                   std::string indexFilename = "repodata.json");

    /**
     * Read the state file. Missing or corrupt state, or a missing artifact, yields an
     * empty record.
     */
    ValidatorRecord load() const;

    /**
     * Stamp the artifact's current size/mtime_ns into `record` and persist it.
     * Must be called after the artifact has been written.
     */
    Result<void> save(ValidatorRecord& record) const;

    const std::filesystem::path& artifactPath() const noexcept { return artifactPath_; }
    const std::filesystem::path& statePath() const noexcept { return statePath_; }
    const std::string& indexFilename() const noexcept { return indexFilename_; }

private:
    std::filesystem::path artifactPath_;
    std::filesystem::path statePath_;
    std::string indexFilename_;
};

} // namespace repofetch::cache
