#pragma once
#include <filesystem>
#include <string>

// Creates <root>/<tag>-<pid>-<seq> on construction and removes it with all
// contents on destruction.
class ScopedTempDir {
public:
    ScopedTempDir(const std::string& root, const std::string& tag);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    // Writes content to <dir>/<name> and returns the full path. Throws std::runtime_error.
    std::string write_file(const std::string& name, const std::string& content) const;

    static std::string default_root();
    static std::string sanitize(const std::string& tag);

private:
    std::filesystem::path path_;
};
