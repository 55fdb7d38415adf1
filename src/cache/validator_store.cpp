#include <repofetch/cache/validator_store.h>

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace repofetch::cache {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr std::array<std::pair<const char*, const char*>, 4> kLegacyAliases{{
    {"_mod", kKeyMod},
    {"_etag", kKeyEtag},
    {"_cache_control", kKeyCacheControl},
    {"_url", kKeyUrl},
}};

bool isWellKnown(const std::string& key) {
    return key == kKeyEtag || key == kKeyMod || key == kKeyCacheControl || key == kKeySize ||
           key == kKeyMtimeNs || key == kKeyUrl;
}

std::optional<std::string> stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end())
        return std::nullopt;
    if (!it->is_string()) {
        spdlog::debug("State field '{}' is not a string; ignoring", key);
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

// ---------------- ValidatorRecord ----------------

void ValidatorRecord::setExtra(const std::string& key, json value) {
    extras_[key] = std::move(value);
}

void ValidatorRecord::clear() {
    etag_.reset();
    lastModified_.reset();
    cacheControl_.reset();
    sourceUrl_.reset();
    size_.reset();
    mtimeNs_.reset();
    extras_ = json::object();
}

bool ValidatorRecord::empty() const noexcept {
    return !etag_ && !lastModified_ && !cacheControl_ && !sourceUrl_ && !size_ && !mtimeNs_ &&
           extras_.empty();
}

void ValidatorRecord::invalidateValidators() {
    etag_ = std::string{};
    lastModified_ = std::string{};
    cacheControl_ = std::string{};
    size_ = 0;
}

bool ValidatorRecord::matches(const ArtifactStat& stat) const noexcept {
    return mtimeNs_ && size_ && *mtimeNs_ == stat.mtimeNs && *size_ == stat.size;
}

json ValidatorRecord::toJson() const {
    json j = extras_.is_object() ? extras_ : json::object();
    if (etag_)
        j[kKeyEtag] = *etag_;
    if (lastModified_)
        j[kKeyMod] = *lastModified_;
    if (cacheControl_)
        j[kKeyCacheControl] = *cacheControl_;
    if (size_)
        j[kKeySize] = *size_;
    if (mtimeNs_)
        j[kKeyMtimeNs] = *mtimeNs_;
    if (sourceUrl_)
        j[kKeyUrl] = *sourceUrl_;
    return j;
}

ValidatorRecord ValidatorRecord::fromJson(const json& j) {
    ValidatorRecord r;
    if (!j.is_object())
        return r;

    r.etag_ = stringField(j, kKeyEtag);
    r.lastModified_ = stringField(j, kKeyMod);
    r.cacheControl_ = stringField(j, kKeyCacheControl);
    r.sourceUrl_ = stringField(j, kKeyUrl);

    if (auto it = j.find(kKeySize); it != j.end()) {
        if (it->is_number_unsigned()) {
            r.size_ = it->get<std::uint64_t>();
        } else if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            r.size_ = static_cast<std::uint64_t>(it->get<std::int64_t>());
        }
    }
    if (auto it = j.find(kKeyMtimeNs); it != j.end() && it->is_number_integer()) {
        r.mtimeNs_ = it->get<std::int64_t>();
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!isWellKnown(it.key())) {
            r.extras_[it.key()] = it.value();
        }
    }
    return r;
}

// ---------------- free functions ----------------

std::size_t migrateLegacyFields(json& state) {
    if (!state.is_object())
        return 0;
    std::size_t migrated = 0;
    for (const auto& [alias, canonical] : kLegacyAliases) {
        auto it = state.find(alias);
        if (it == state.end())
            continue;
        if (!state.contains(canonical)) {
            state[canonical] = *it;
        }
        state.erase(std::string(alias));
        ++migrated;
    }
    if (migrated > 0) {
        spdlog::debug("Migrated {} legacy state field(s)", migrated);
    }
    return migrated;
}

fs::path statePathFor(const fs::path& artifactPath) {
    auto out = artifactPath;
    if (out.extension() == ".json") {
        out.replace_extension(".state.json");
    } else {
        out += ".state.json";
    }
    return out;
}

// ---------------- ValidatorStore ----------------

ValidatorStore::ValidatorStore(fs::path artifactPath, fs::path statePath,
                               std::string indexFilename)
    : artifactPath_(std::move(artifactPath)), statePath_(std::move(statePath)),
      indexFilename_(std::move(indexFilename)) {}

ValidatorRecord ValidatorStore::load() const {
    spdlog::debug("Load {} cache from {}", indexFilename_, statePath_.string());

    auto text = readFile(statePath_);
    if (!text) {
        spdlog::debug("Could not load state: {}", text.error().message);
        return {};
    }

    json state;
    try {
        state = json::parse(text.value());
    } catch (const json::parse_error& e) {
        spdlog::debug("Could not load state: {}", e.what());
        return {};
    }
    if (!state.is_object()) {
        spdlog::debug("Could not load state: {} is not a JSON object", statePath_.string());
        return {};
    }

    // State and artifact must be read as a pair; without the artifact the
    // validators describe nothing.
    auto stat = statArtifact(artifactPath_);
    if (!stat) {
        spdlog::debug("Could not load state: artifact {} is missing", artifactPath_.string());
        return {};
    }

    migrateLegacyFields(state);
    auto record = ValidatorRecord::fromJson(state);
    if (!record.matches(*stat)) {
        spdlog::debug("State for {} does not match artifact (size {} vs {}, mtime_ns {} vs {}); "
                      "clearing validators",
                      artifactPath_.string(), record.size(), stat->size, record.mtimeNs(),
                      stat->mtimeNs);
        record.invalidateValidators();
    }
    return record;
}

Result<void> ValidatorStore::save(ValidatorRecord& record) const {
    auto stat = statArtifact(artifactPath_);
    if (!stat) {
        return Error{ErrorCode::FileNotFound,
                     "Cannot save state: artifact " + artifactPath_.string() + " does not exist"};
    }
    record.setMtimeNs(stat->mtimeNs);
    record.setSize(stat->size);

    // Header values are raw bytes; dump() rejects anything that is not UTF-8.
    std::string text;
    try {
        text = record.toJson().dump(2);
    } catch (const json::type_error& e) {
        return Error{ErrorCode::WriteError,
                     "Cannot serialize state for " + artifactPath_.string() + ": " + e.what()};
    }

    auto r = writeFileAtomic(statePath_, text);
    if (!r) {
        return r;
    }
    spdlog::debug("Saved {} state to {} (size={}, mtime_ns={})", indexFilename_,
                  statePath_.string(), stat->size, stat->mtimeNs);
    return {};
}

} // namespace repofetch::cache
