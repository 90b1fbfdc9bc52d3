#include "scoped_temp_dir.hpp"
#include <unistd.h>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

static std::atomic<unsigned> g_seq{0};

std::string ScopedTempDir::default_root() {
    const char* tmp = getenv("TMPDIR");
    std::filesystem::path base = (tmp && *tmp) ? tmp : "/tmp";
    return (base / "schemabench").string();
}

std::string ScopedTempDir::sanitize(const std::string& tag) {
    std::string out;
    for (char c : tag) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_' || c == '.';
        out += keep ? c : '_';
    }
    return out.empty() ? "workload" : out;
}

ScopedTempDir::ScopedTempDir(const std::string& root, const std::string& tag) {
    std::filesystem::create_directories(root);
    for (;;) {
        auto candidate = std::filesystem::path(root) /
                         (sanitize(tag) + "-" + std::to_string(getpid()) + "-" + std::to_string(g_seq++));
        // create_directory returns false when the path already exists.
        if (std::filesystem::create_directory(candidate)) {
            path_ = candidate;
            break;
        }
    }
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[ScopedTempDir] Error cleaning up " << path_ << ": " << ec.message() << std::endl;
    }
}

std::string ScopedTempDir::write_file(const std::string& name, const std::string& content) const {
    auto file_path = (path_ / name).string();
    std::ofstream file(file_path, std::ios::binary);
    if (!file) throw std::runtime_error("cannot create " + file_path);
    file << content;
    file.close();
    if (!file) throw std::runtime_error("failed writing " + file_path);
    return file_path;
}
