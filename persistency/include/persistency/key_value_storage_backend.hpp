#pragma once
#include <string>
#include <mutex>
#include <presence/core/result.hpp>

namespace presence::persistency {

// One file per key under base_path. Holds small opaque values such as the
// event-source session token.
class KeyValueStorageBackend {
public:
    explicit KeyValueStorageBackend(const std::string& base_path);
    core::Result<void> SetValue(const std::string& key, const std::string& value) noexcept;
    core::Result<std::string> GetValue(const std::string& key) const noexcept;
    core::Result<bool> HasKey(const std::string& key) const noexcept;
    core::Result<void> RemoveKey(const std::string& key) noexcept;

    const std::string& BasePath() const noexcept { return base_path_; }

private:
    std::string base_path_;
    mutable std::mutex mtx_;
};

} // namespace presence::persistency
