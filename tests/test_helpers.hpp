#pragma once
#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = tag + "-" + std::to_string(getpid());
        if (info) name += std::string("-") + info->name();
        path_ = std::filesystem::temp_directory_path() / "schemabench-tests" / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    std::string write(const std::string& name, const std::string& content) const {
        auto p = path_ / name;
        std::ofstream(p) << content;
        return p.string();
    }

    // Writes a /bin/sh script and marks it executable.
    std::string script(const std::string& name, const std::string& body) const {
        auto p = write(name, "#!/bin/sh\n" + body + "\n");
        chmod(p.c_str(), 0755);
        return p;
    }

    size_t entry_count(const std::string& sub) const {
        auto dir = path_ / sub;
        if (!std::filesystem::exists(dir)) return 0;
        size_t n = 0;
        for (auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it) ++n;
        return n;
    }

private:
    std::filesystem::path path_;
};
