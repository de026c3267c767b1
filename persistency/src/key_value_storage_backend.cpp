#include <persistency/key_value_storage_backend.hpp>
#include <filesystem>
#include <system_error>
#include "atomic_file.hpp"

namespace fs = std::filesystem;

namespace {

// Keys become file names; reject anything that could leave base_path
inline bool key_is_safe(const std::string& key) {
    return !key.empty()
        && key.find('/') == std::string::npos
        && key.find('\\') == std::string::npos
        && key.find("..") == std::string::npos;
}

} // namespace

namespace presence::persistency {

KeyValueStorageBackend::KeyValueStorageBackend(const std::string& base_path)
    : base_path_(base_path) {
    std::error_code ec;
    fs::create_directories(base_path_, ec);
}

core::Result<void>
KeyValueStorageBackend::SetValue(const std::string& key, const std::string& value) noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!key_is_safe(key)) {
        return core::ErrorCode(core::Errc::kPermissionDenied, key);
    }
    return detail::WriteFileAtomically(fs::path(base_path_) / key, value);
}

core::Result<std::string> KeyValueStorageBackend::GetValue(const std::string& key) const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!key_is_safe(key)) {
        return core::ErrorCode(core::Errc::kPermissionDenied, key);
    }
    return detail::ReadWholeFile(fs::path(base_path_) / key);
}

core::Result<bool> KeyValueStorageBackend::HasKey(const std::string& key) const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!key_is_safe(key)) {
        return core::ErrorCode(core::Errc::kPermissionDenied, key);
    }
    std::error_code ec;
    return fs::exists(fs::path(base_path_) / key, ec);
}

core::Result<void> KeyValueStorageBackend::RemoveKey(const std::string& key) noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!key_is_safe(key)) {
        return core::ErrorCode(core::Errc::kPermissionDenied, key);
    }
    fs::path file = fs::path(base_path_) / key;
    std::error_code ec;
    bool ok = fs::remove(file, ec);
    if (!ok || ec) {
        return core::ErrorCode(core::Errc::kNotFound, key);
    }
    detail::fsync_dir_by_path(base_path_);
    return {};
}

} // namespace presence::persistency
