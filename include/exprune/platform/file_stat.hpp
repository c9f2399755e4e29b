#pragma once

/** \file file_stat.hpp
 *  \brief Portable file metadata (kind + three timestamps) and file removal.
 *
 * Metadata is read without following symlinks, so a symlink is reported as
 * FileKind::symlink whatever it points to.
 *
 * Timestamps:
 * - modified: st_mtime / last write time
 * - accessed: st_atime (POSIX only)
 * - changed:  st_ctime, the inode status-change time (POSIX only)
 * A timestamp the platform cannot provide is left disengaged.
 */

#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "exprune/error.hpp"

#ifndef _WIN32
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace exprune::platform {

using sys_clock = std::chrono::system_clock;

enum class FileKind { regular, directory, symlink, other };

struct FileStat {
    FileKind kind{FileKind::other};
    std::optional<sys_clock::time_point> modified;
    std::optional<sys_clock::time_point> accessed;
    std::optional<sys_clock::time_point> changed;

    [[nodiscard]] bool is_regular() const noexcept { return kind == FileKind::regular; }
    [[nodiscard]] bool is_directory() const noexcept { return kind == FileKind::directory; }
};

/** \brief Map an errno value to the library error taxonomy. */
[[nodiscard]] inline auto error_from_errno(int err, const std::string& what, const char* component)
    -> core::error {
    const auto code = (err == ENOENT || err == ENOTDIR) ? core::error_code::not_found
                                                        : core::error_code::io_failed;
    return core::error{code, what + ": " + std::strerror(err), component};
}

#ifndef _WIN32
/** Converts a stat timespec; seconds outside the clock's range clamp to time_point::min()/max(). */
[[nodiscard]] inline auto to_time_point(const struct timespec& ts) noexcept -> sys_clock::time_point {
    constexpr auto max_secs = std::chrono::duration_cast<std::chrono::seconds>(sys_clock::duration::max()).count();
    constexpr auto min_secs = std::chrono::duration_cast<std::chrono::seconds>(sys_clock::duration::min()).count();
    if (static_cast<long long>(ts.tv_sec) >= max_secs) return sys_clock::time_point::max();
    if (static_cast<long long>(ts.tv_sec) <= min_secs) return sys_clock::time_point::min();
    const auto since_epoch = std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
    return sys_clock::time_point{std::chrono::duration_cast<sys_clock::duration>(since_epoch)};
}
#endif

/** \brief lstat-style metadata read.
 *
 * \param path File to inspect
 * \return FileStat or not_found/io_failed
 */
[[nodiscard]] inline auto stat_no_follow(const std::filesystem::path& path)
    -> std::expected<FileStat, core::error> {
#ifdef _WIN32
    std::error_code ec;
    const auto st = std::filesystem::symlink_status(path, ec);
    if (ec) {
        return std::unexpected(core::error{
            ec == std::errc::no_such_file_or_directory ? core::error_code::not_found
                                                       : core::error_code::io_failed,
            "stat " + path.string() + ": " + ec.message(), "platform.file_stat"});
    }
    FileStat out;
    if (std::filesystem::is_symlink(st)) out.kind = FileKind::symlink;
    else if (std::filesystem::is_regular_file(st)) out.kind = FileKind::regular;
    else if (std::filesystem::is_directory(st)) out.kind = FileKind::directory;
    if (out.kind == FileKind::regular) {
        const auto ft = std::filesystem::last_write_time(path, ec);
        if (!ec) out.modified = std::chrono::clock_cast<sys_clock>(ft);
    }
    return out;
#else
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        return std::unexpected(error_from_errno(errno, "stat " + path.string(), "platform.file_stat"));
    }
    FileStat out;
    if (S_ISLNK(st.st_mode)) out.kind = FileKind::symlink;
    else if (S_ISREG(st.st_mode)) out.kind = FileKind::regular;
    else if (S_ISDIR(st.st_mode)) out.kind = FileKind::directory;
#ifdef __APPLE__
    out.modified = to_time_point(st.st_mtimespec);
    out.accessed = to_time_point(st.st_atimespec);
    out.changed = to_time_point(st.st_ctimespec);
#else
    out.modified = to_time_point(st.st_mtim);
    out.accessed = to_time_point(st.st_atim);
    out.changed = to_time_point(st.st_ctim);
#endif
    return out;
#endif
}

/** \brief Remove a single non-directory entry.
 *
 * A path that is already gone is an error (not_found), unlike
 * std::filesystem::remove which reports it as "nothing removed".
 */
[[nodiscard]] inline auto remove_file(const std::filesystem::path& path)
    -> std::expected<void, core::error> {
#ifdef _WIN32
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(core::error{core::error_code::io_failed, ec.message(), "platform.remove"});
    }
    if (!removed) {
        return std::unexpected(core::error{core::error_code::not_found, "No such file or directory",
                                           "platform.remove"});
    }
    return {};
#else
    if (::unlink(path.c_str()) != 0) {
        const int err = errno;
        return std::unexpected(core::error{
            (err == ENOENT) ? core::error_code::not_found : core::error_code::io_failed,
            std::strerror(err), "platform.remove"});
    }
    return {};
#endif
}

} // namespace exprune::platform
