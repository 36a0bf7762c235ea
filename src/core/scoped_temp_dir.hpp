#pragma once
#include <filesystem>
#include <string>

namespace core {

// Creates a unique directory on construction and removes it (recursively) on destruction.
class ScopedTempDir {
public:
    // root empty -> std::filesystem::temp_directory_path()
    explicit ScopedTempDir(const std::string& prefix, const std::string& root = {});
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    // Creates (if needed) and returns a subdirectory owned by this temp dir.
    std::filesystem::path subdir(const std::string& name) const;

private:
    std::filesystem::path path_;
};

}
