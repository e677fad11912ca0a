/*
 * modelfetch/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Partial artifacts live next to their destination ("<dest>.part") so finalize is a
 *   same-directory rename
 * - Resume reopens the partial at the committed offset; uncommitted tail bytes are cut
 * - EXDEV fallback: copy + fsync + replace when the destination sits on another device
 * - Cache accounting walks the cache directory for regular file sizes
 */

#include <modelfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace modelfetch::downloader {

namespace fs = std::filesystem;

namespace {

Expected<void> fsync_path(const fs::path& p, int flags, std::string_view what) {
    int fd = ::open(p.c_str(), flags);
    if (fd < 0) {
        return Error{ErrorCode::IoError, std::string("open() failed for ") + std::string(what) +
                                             ": " + p.string() + " (" + std::strerror(errno) +
                                             ")"};
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return Error{ErrorCode::IoError, std::string("fsync() failed for ") + std::string(what) +
                                             ": " + p.string() + " (" + std::strerror(err) + ")"};
    }
    ::close(fd);
    return Expected<void>{};
}

Expected<void> fsync_file(const fs::path& p) {
    return fsync_path(p, O_RDONLY, "file");
}

Expected<void> fsync_dir(const fs::path& dir) {
    return fsync_path(dir.empty() ? fs::path(".") : dir, O_RDONLY | O_DIRECTORY, "directory");
}

void ensure_file_private(const fs::path& p) {
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set file perms on {}: {}", p.string(), ec.message());
    }
}

} // namespace

class DiskWriter final : public IDiskWriter {
public:
    Expected<void> openForResume(const fs::path& partialFile,
                                 std::uint64_t resumeOffset) override {
        std::error_code ec;
        if (partialFile.has_parent_path()) {
            fs::create_directories(partialFile.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Failed to create directory " +
                                                     partialFile.parent_path().string() + ": " +
                                                     ec.message()};
            }
        }

        if (!fs::exists(partialFile, ec)) {
            if (resumeOffset > 0) {
                return Error{ErrorCode::IoError,
                             "Partial artifact missing, cannot resume at offset " +
                                 std::to_string(resumeOffset) + ": " + partialFile.string()};
            }
            std::ofstream os(partialFile, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "Failed to create partial artifact: " + partialFile.string()};
            }
            ensure_file_private(partialFile);
            return Expected<void>{};
        }

        const auto size = fs::file_size(partialFile, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to stat " + partialFile.string() + ": " + ec.message()};
        }
        if (size < resumeOffset) {
            return Error{ErrorCode::IoError, "Partial artifact " + partialFile.string() +
                                                 " holds " + std::to_string(size) +
                                                 " bytes, expected at least " +
                                                 std::to_string(resumeOffset)};
        }
        if (size > resumeOffset) {
            spdlog::debug("Truncating {} from {} to committed offset {}", partialFile.string(),
                          size, resumeOffset);
            fs::resize_file(partialFile, resumeOffset, ec);
            if (ec) {
                return Error{ErrorCode::IoError,
                             "Failed to truncate " + partialFile.string() + ": " + ec.message()};
            }
        }
        return Expected<void>{};
    }

    Expected<void> writeAt(const fs::path& partialFile, std::uint64_t offset,
                           std::span<const std::byte> data) override {
        std::fstream fsio(partialFile, std::ios::binary | std::ios::in | std::ios::out);
        if (!fsio.good()) {
            return Error{ErrorCode::IoError,
                         "Failed to open partial artifact for write: " + partialFile.string()};
        }

        fsio.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!fsio.good()) {
            return Error{ErrorCode::IoError, "seekp failed on: " + partialFile.string()};
        }

        fsio.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!fsio.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + partialFile.string()};
        }
        // Durability is sync()'s job.
        fsio.close();
        return Expected<void>{};
    }

    Expected<void> sync(const fs::path& partialFile) override {
        auto r = fsync_file(partialFile);
        if (!r.ok())
            return r;
        return fsync_dir(partialFile.parent_path());
    }

    Expected<void> finalize(const fs::path& partialFile, const fs::path& destination) override {
        std::error_code ec;
        if (destination.has_parent_path()) {
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Failed to create directory " +
                                                     destination.parent_path().string()};
            }
        }

        std::error_code ren_ec;
        fs::rename(partialFile, destination, ren_ec);
        if (ren_ec) {
            if (ren_ec != std::errc::cross_device_link) {
                return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() +
                                                     ") from " + partialFile.string() + " to " +
                                                     destination.string()};
            }
            spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                         destination.string());
            auto copied = copy_file_fsync_replace(partialFile, destination);
            if (!copied.ok())
                return copied.error();
            std::error_code del_ec;
            fs::remove(partialFile, del_ec);
        }

        auto rr = fsync_dir(destination.parent_path());
        if (!rr.ok()) {
            spdlog::debug("fsync on destination dir failed (continuing): {}",
                          rr.error().message);
        }
        return Expected<void>{};
    }

    std::optional<std::uint64_t> sizeOf(const fs::path& file) noexcept override {
        std::error_code ec;
        const auto sz = fs::file_size(file, ec);
        if (ec)
            return std::nullopt;
        return static_cast<std::uint64_t>(sz);
    }

    std::uint64_t usedBytes(const fs::path& dir) noexcept override {
        std::uint64_t total = 0;
        std::error_code ec;
        if (dir.empty() || !fs::is_directory(dir, ec))
            return 0;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied,
                                            ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code fe;
            if (it->is_regular_file(fe)) {
                const auto sz = it->file_size(fe);
                if (!fe)
                    total += static_cast<std::uint64_t>(sz);
            }
        }
        return total;
    }

    bool remove(const fs::path& file) noexcept override {
        std::error_code ec;
        const bool removed = fs::remove(file, ec);
        if (ec) {
            spdlog::debug("remove: failed to remove {}: {}", file.string(), ec.message());
            return false;
        }
        return removed;
    }

private:
    static Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
        const fs::path tmp = dst.string() + ".copy";
        {
            std::ifstream is(src, std::ios::binary);
            if (!is.good()) {
                return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
            }
            std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "copy: failed to open destination: " + tmp.string()};
            }
            std::vector<char> buffer(1 << 20);
            while (is.good()) {
                is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const std::streamsize got = is.gcount();
                if (got > 0) {
                    os.write(buffer.data(), got);
                    if (!os.good()) {
                        return Error{ErrorCode::IoError,
                                     "copy: write failed for destination: " + tmp.string()};
                    }
                }
            }
            if (!is.eof()) {
                return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
            }
        }

        auto rf = fsync_file(tmp);
        if (!rf.ok())
            return rf;
        std::error_code ec;
        fs::rename(tmp, dst, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "rename() failed for " + dst.string() + ": " + ec.message()};
        }
        return Expected<void>{};
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace modelfetch::downloader
