#include <presence/per/document_storage.hpp>
#include <filesystem>
#include <system_error>
#include "atomic_file.hpp"

namespace fs = std::filesystem;

namespace presence::per {

DocumentStorage::DocumentStorage(std::string path)
    : path_(std::move(path)) {
    // Best effort; Write() retries and reports the failure
    const fs::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }
}

core::Result<std::string> DocumentStorage::Read() const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return core::ErrorCode(core::Errc::kNotFound, path_);
    }
    if (!fs::is_regular_file(path_, ec)) {
        return core::ErrorCode(core::Errc::kCorruption, path_ + " is not a regular file");
    }
    return persistency::detail::ReadWholeFile(path_);
}

core::Result<void> DocumentStorage::Write(const std::string& contents) noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    return persistency::detail::WriteFileAtomically(path_, contents);
}

} // namespace presence::per
