#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace usync::test {

// Fresh scratch directory per test, removed on teardown
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::random_device rd;
        test_dir = std::filesystem::temp_directory_path() /
                   (std::string("usync_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(rd()));
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    static void writeTextFile(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    static std::string readTextFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    // Deterministic non-trivial content of the given size
    static std::string patternBytes(size_t size) {
        std::string out(size, '\0');
        for (size_t i = 0; i < size; ++i) out[i] = static_cast<char>((i * 31 + 7) % 251);
        return out;
    }
};

}
