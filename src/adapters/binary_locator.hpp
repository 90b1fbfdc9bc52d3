#pragma once
#include <optional>
#include <string>
#include <vector>

// Ordered candidate paths for an external executable. The first existing,
// executable regular file wins.
class BinaryLocator {
public:
    BinaryLocator() = default;
    explicit BinaryLocator(std::vector<std::string> candidates) : candidates_(std::move(candidates)) {}

    void prepend(const std::string& path);
    void append(const std::string& path);
    const std::vector<std::string>& candidates() const { return candidates_; }

    std::optional<std::string> find() const;
    // Throws BinaryNotFoundError listing every path tried.
    std::string resolve() const;

    // Release/debug build trees relative to the working directory and its
    // parents, then the directory of the running executable.
    static std::vector<std::string> default_candidates(const std::string& program, const std::string& exe_dir);

    static bool is_executable(const std::string& path);

private:
    std::vector<std::string> candidates_;
};
