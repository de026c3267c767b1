// persistency/src/atomic_file.hpp  (private to the persistency library)
#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <presence/core/result.hpp>

#include <unistd.h>   // fsync, close
#include <fcntl.h>    // open

namespace presence::persistency::detail {

inline void fsync_file_by_path(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }
}

// Persists the rename itself
inline void fsync_dir_by_path(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }
}

// tmp -> fsync -> rename -> fsync dir. Readers see the old or the new
// content, never a torn file.
inline core::Result<void> WriteFileAtomically(const std::filesystem::path& file,
                                              std::string_view data) noexcept {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            return core::ErrorCode(core::Errc::kPermissionDenied,
                                   "cannot create " + file.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) return core::ErrorCode(core::Errc::kPermissionDenied, "cannot open " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs) return core::ErrorCode(core::Errc::kUnknown, "short write to " + tmp.string());
    }
    fsync_file_by_path(tmp.string());

    fs::rename(tmp, file, ec);
    if (ec) {
        std::error_code ec2; fs::remove(tmp, ec2);
        return core::ErrorCode(core::Errc::kUnknown, "rename failed: " + ec.message());
    }
    fsync_dir_by_path(file.has_parent_path() ? file.parent_path().string() : std::string("."));
    return {};
}

inline core::Result<std::string> ReadWholeFile(const std::filesystem::path& file) noexcept {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) return core::ErrorCode(core::Errc::kNotFound, file.string());
    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) return core::ErrorCode(core::Errc::kUnknown, "read failed: " + file.string());
    return data;
}

} // namespace presence::persistency::detail
