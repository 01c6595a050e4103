#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

// RAII scratch directory, removed with its contents.
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& tag) {
        static std::atomic<int> seq{0};
        path = std::filesystem::temp_directory_path() /
               ("clipstage_test_" + tag + "_" + std::to_string(getpid()) + "_" + std::to_string(seq++));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};
