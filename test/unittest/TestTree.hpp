#ifndef TEST_TREE_HPP
#define TEST_TREE_HPP

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <unistd.h>

#include "Logging.hpp"
#include "TierLayout.hpp"

// Scratch directory with an array tree and a cache tree, removed after each test.
// unionRoot stands in for the merged view of a split-volume layout.
class TestTree : public ::testing::Test {
protected:
    std::filesystem::path root;
    std::string arrayRoot;
    std::string cacheRoot;
    std::string unionRoot;
    std::shared_ptr<spdlog::logger> logger = makeNullLogger();

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = std::filesystem::temp_directory_path() /
               ("cachekeeper_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                std::to_string(::getpid()));
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "array");
        std::filesystem::create_directories(root / "cache");
        std::filesystem::create_directories(root / "user");
        arrayRoot = (root / "array").string() + "/";
        cacheRoot = (root / "cache").string() + "/";
        unionRoot = (root / "user").string() + "/";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TierLayout layout() const { return TierLayout(arrayRoot, cacheRoot); }
    // Identity paths under unionRoot, array copies under arrayRoot.
    TierLayout splitLayout() const { return TierLayout(unionRoot, cacheRoot, arrayRoot); }

    std::string onUnion(const std::string& relative) const { return unionRoot + relative; }
    std::string onArray(const std::string& relative) const { return arrayRoot + relative; }
    std::string onCache(const std::string& relative) const { return cacheRoot + relative; }

    static void writeFile(const std::filesystem::path& path, const std::string& content = "data") {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    static bool exists(const std::filesystem::path& path) {
        return std::filesystem::is_regular_file(path);
    }
};

#endif
