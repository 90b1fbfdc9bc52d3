#include "binary_locator.hpp"
#include "../errors.hpp"
#include <unistd.h>
#include <filesystem>

void BinaryLocator::prepend(const std::string& path) {
    candidates_.insert(candidates_.begin(), path);
}

void BinaryLocator::append(const std::string& path) {
    candidates_.push_back(path);
}

bool BinaryLocator::is_executable(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return false;
    return access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> BinaryLocator::find() const {
    for (const auto& c : candidates_) {
        if (is_executable(c)) return c;
    }
    return std::nullopt;
}

std::string BinaryLocator::resolve() const {
    if (auto found = find()) return *found;
    std::string tried;
    for (const auto& c : candidates_) {
        if (!tried.empty()) tried += ", ";
        tried += c;
    }
    if (tried.empty()) tried = "<no candidates>";
    throw BinaryNotFoundError("no executable found (tried: " + tried + ")");
}

std::vector<std::string> BinaryLocator::default_candidates(const std::string& program, const std::string& exe_dir) {
    std::vector<std::string> out = {
        "build/Release/" + program,
        "build/" + program,
        "build/Debug/" + program,
        "cmake-build-release/" + program,
        "cmake-build-debug/" + program,
        "../build/" + program,
        "../../build/" + program,
        "./" + program,
    };
    if (!exe_dir.empty()) out.push_back((std::filesystem::path(exe_dir) / program).string());
    return out;
}
