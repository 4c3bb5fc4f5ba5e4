// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_all.hpp>
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <filesystem>
#include <fstream>

using namespace weave::util;

TEST_CASE("File utilities", "[files]") {
    // Create a temporary test directory
    auto test_dir = std::filesystem::temp_directory_path() / "weave_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        // Idempotent
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file then read_file_string") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "test.json";

        REQUIRE(atomic_write_file(file_path, "{\"a\": 1}"));
        auto result = read_file_string(file_path);
        REQUIRE(result.has_value());
        REQUIRE(*result == "{\"a\": 1}");
    }

    SECTION("atomic_write_file overwrites existing file") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "test2.json";

        REQUIRE(atomic_write_file(file_path, "first"));
        REQUIRE(atomic_write_file(file_path, "second, longer"));

        REQUIRE(*read_file_string(file_path) == "second, longer");

        // No temporaries left behind
        int entries = 0;
        for (const auto &e : std::filesystem::directory_iterator(test_dir)) {
            (void)e;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("read_file_string on missing file") {
        REQUIRE_FALSE(read_file_string(test_dir / "nonexistent.json").has_value());
    }

    SECTION("read_file_string enforces size limit") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "big.json";
        REQUIRE(atomic_write_file(file_path, std::string(1000, 'x')));
        REQUIRE_FALSE(read_file_string(file_path, 100).has_value());
        REQUIRE(read_file_string(file_path, 1000).has_value());
    }

    SECTION("get_default_datadir returns valid path") {
        auto datadir = get_default_datadir();
        REQUIRE(!datadir.empty());
        REQUIRE(datadir.filename().string() == ".weave");
    }

    // Cleanup
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("DataDirLock - exclusive lock file", "[files][lock]") {
    auto test_dir = std::filesystem::temp_directory_path() / "weave_lock_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(ensure_directory(test_dir));

    SECTION("Acquire creates the lock file") {
        LockResult result = LockResult::ErrorLock;
        auto lock = DataDirLock::Acquire(test_dir, result);
        REQUIRE(result == LockResult::Success);
        REQUIRE(lock != nullptr);
        REQUIRE(std::filesystem::exists(test_dir / ".lock"));
    }

    SECTION("Re-acquire after release") {
        LockResult result = LockResult::ErrorLock;
        {
            auto lock = DataDirLock::Acquire(test_dir, result);
            REQUIRE(lock != nullptr);
        }
        auto again = DataDirLock::Acquire(test_dir, result);
        REQUIRE(result == LockResult::Success);
        REQUIRE(again != nullptr);
    }

    SECTION("Missing directory reports ErrorWrite") {
        LockResult result = LockResult::Success;
        std::string reason;
        auto lock = DataDirLock::Acquire(test_dir / "missing", result, &reason);
        REQUIRE(lock == nullptr);
        REQUIRE(result == LockResult::ErrorWrite);
        REQUIRE_FALSE(reason.empty());
    }

    std::filesystem::remove_all(test_dir);
}
