#pragma once
#include <mutex>
#include <string>
#include <presence/core/result.hpp>

namespace presence::per {

// One document at a fixed path, read whole and written whole.
class DocumentStorage {
public:
    explicit DocumentStorage(std::string path);

    // kNotFound when the document has never been written.
    core::Result<std::string> Read() const noexcept;
    core::Result<void> Write(const std::string& contents) noexcept;

    const std::string& Path() const noexcept { return path_; }

private:
    std::string path_;
    mutable std::mutex mtx_;
};

} // namespace presence::per
