#include <repofetch/cache/file_io.h>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace repofetch::cache {

namespace fs = std::filesystem;

namespace {

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::WriteError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::WriteError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return {};
}

fs::path tempPathFor(const fs::path& target) {
    auto tmp = target;
    tmp += ".tmp-" + std::to_string(::getpid());
    return tmp;
}

} // namespace

std::optional<ArtifactStat> statArtifact(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    ArtifactStat out;
    out.size = static_cast<std::uint64_t>(st.st_size);
#if defined(__APPLE__)
    out.mtimeNs = static_cast<std::int64_t>(st.st_mtimespec.tv_sec) * 1'000'000'000LL +
                  static_cast<std::int64_t>(st.st_mtimespec.tv_nsec);
#else
    out.mtimeNs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL +
                  static_cast<std::int64_t>(st.st_mtim.tv_nsec);
#endif
    return out;
}

Result<void> writeFileAtomic(const fs::path& path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         "Failed to create directory " + path.parent_path().string() + ": " +
                             ec.message()};
        }
    }

    const auto tmp = tempPathFor(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Failed to open for write: " + tmp.string()};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return Error{ErrorCode::WriteError, "Failed to write: " + tmp.string()};
        }
    }

    if (auto r = fsync_file(tmp); !r) {
        fs::remove(tmp, ec);
        return r;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        return Error{ErrorCode::WriteError,
                     "Failed to rename " + tmp.string() + " -> " + path.string() + ": " +
                         ec.message()};
    }
    spdlog::debug("Wrote {} bytes to {}", content.size(), path.string());
    return {};
}

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Error{ErrorCode::FileNotFound, "No such file: " + path.string()};
        }
        return Error{ErrorCode::PermissionDenied, "Failed to open for read: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::CorruptedData, "Failed to read: " + path.string()};
    }
    return ss.str();
}

} // namespace repofetch::cache
