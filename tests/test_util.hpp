#pragma once

// ============================================================
// test_util.hpp -- Throw-away project trees for tests
// ============================================================

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

// 32-char lowercase token, distinct per n
inline std::string make_guid(int n) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%032d", n);
    return buf;
}

// One serialized reference as it appears in a project file
inline std::string ref_to(const std::string& guid, long long file_id = 2100000) {
    return "{fileID: " + std::to_string(file_id) + ", guid: " + guid + ", type: 2}";
}

inline std::string read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class ProjectTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                (std::string("unipack_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    // Write a file under the project root
    fs::path write(const std::string& rel, const std::string& content) {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out.write(content.data(), (std::streamsize)content.size());
        return p;
    }

    // Asset plus a .meta carrying guid
    fs::path add_asset(const std::string& rel, const std::string& guid,
                       const std::string& content = "") {
        write(rel + ".meta", "fileFormatVersion: 2\nguid: " + guid + "\n");
        return write(rel, content);
    }

    std::string abs(const std::string& rel) const {
        return (root_ / rel).lexically_normal().string();
    }

    fs::path root_;
};
