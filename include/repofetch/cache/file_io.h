#pragma once

#include <repofetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace repofetch::cache {

/**
 * Size and nanosecond modification time of a file, as reported by stat(2).
 */
struct ArtifactStat {
    std::uint64_t size{0};
    std::int64_t mtimeNs{0};
};

/**
 * stat(2) the given path. Returns nullopt when the file does not exist or cannot be
 * inspected.
 */
std::optional<ArtifactStat> statArtifact(const std::filesystem::path& path);

/**
 * Write `content` to a sibling temporary file, fsync it, then rename over `path`.
 * Readers observe either the old or the new content, never a partial write.
 */
Result<void> writeFileAtomic(const std::filesystem::path& path, std::string_view content);

/**
 * Read the whole file. FileNotFound when missing; CorruptedData on read failure.
 */
Result<std::string> readFile(const std::filesystem::path& path);

} // namespace repofetch::cache
