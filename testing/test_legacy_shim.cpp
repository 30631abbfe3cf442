#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "dbfs_master/legacy_shim.hpp"

namespace fs = std::filesystem;
using namespace dbfs_master;
using dbfs_common::User;
using dbfs_content::FileStream;
using dbfs_content::StreamMode;

// Test utilities
int test_count = 0;
int passed_count = 0;

void assert_test(bool condition, const std::string& test_name) {
    test_count++;
    if (condition) {
        std::cout << "✓ PASS: " << test_name << std::endl;
        passed_count++;
    } else {
        std::cout << "✗ FAIL: " << test_name << std::endl;
    }
}

int main() {
    std::cout << "=== Legacy Shim Test Suite ===" << std::endl << std::endl;

    FsConfig config;
    config.data_dir = "/tmp/dbfs_test_legacy_shim";
    config.sync = false;
    fs::remove_all(config.data_dir);
    auto context = FsContext::Create(config, std::make_unique<MemoryRecordStore>()).value();
    FilesystemFacade facade(context);
    User alice("alice");
    User bob("bob");

    PermissionMap root_grants;
    root_grants["alice"] = Permission(true, true, true);
    root_grants["bob"] = Permission(true, false, false);
    assert_test(legacy::ChangePermissions(facade, "/", root_grants, false, nullptr),
                "Test 1: System grant reads as true");

    auto dir = legacy::CreateDirectory(facade, "/", "docs", &alice);
    assert_test(dir.has_value() && dir->owner == "alice", "Test 2: Directory created");
    assert_test(!legacy::CreateDirectory(facade, "/", "docs", &alice).has_value(),
                "Test 3: Collision reads as empty optional");
    assert_test(!legacy::CreateDirectory(facade, "/docs", "mine", &bob).has_value(),
                "Test 4: Denial reads as empty optional");

    auto stream = facade.CreateFileHandle(StreamMode::kWrite, 0, 0, "legacy bytes");
    auto file = legacy::CreateFile(facade, "/docs", "f.txt", *stream.value(), &alice);
    assert_test(file.has_value() && file->size == 12, "Test 5: File created");

    auto content = legacy::GetContent(facade, "/docs/f.txt", &bob);
    assert_test(content && content->ReadAll() == "legacy bytes", "Test 6: Content readable");
    auto missing = legacy::GetContent(facade, "/docs/none", &bob);
    assert_test(missing == FileStream::Empty(), "Test 7: Missing file gives the Empty stream");

    assert_test(!legacy::Rename(facade, "/docs/f.txt", "g.txt", &bob),
                "Test 8: Denied rename is false");
    assert_test(legacy::Rename(facade, "/docs/f.txt", "g.txt", &alice), "Test 9: Rename true");
    assert_test(legacy::Copy(facade, "/docs/g.txt", "/docs", &alice),
                "Test 10: Copy true");
    assert_test(legacy::ListDirectory(facade, "/docs", &alice).size() == 2,
                "Test 11: Listing has both files");
    assert_test(legacy::ListDirectory(facade, "/nowhere", &alice).empty(),
                "Test 12: Failed listing is empty");

    legacy::CreateDirectory(facade, "/", "archive", &alice);
    assert_test(!legacy::Move(facade, "/docs/g.txt", "/archive", &bob),
                "Test 13: Denied move is false");
    assert_test(legacy::Move(facade, "/docs/g.txt", "/archive", &alice), "Test 14: Move true");
    assert_test(!legacy::Move(facade, "/archive", "/archive", &alice),
                "Test 15: Move into itself is false");

    assert_test(!legacy::ChangeOwnership(facade, "/archive", "bob", &bob),
                "Test 16: Denied chown is false");
    assert_test(legacy::ChangeOwnership(facade, "/archive", "bob", &alice),
                "Test 17: Chown true");
    assert_test(legacy::ExpungeUserOwnership(facade, "bob"), "Test 18: Expunge true");
    assert_test(!legacy::ExpungeUserOwnership(facade, ""), "Test 19: Empty handle is false");

    assert_test(!legacy::Remove(facade, "/", nullptr), "Test 20: Removing the root is false");
    assert_test(legacy::Remove(facade, "/archive", &alice), "Test 21: Remove true");
    assert_test(!legacy::Remove(facade, "/archive", &alice), "Test 22: Second remove is false");

    context.reset();
    fs::remove_all(config.data_dir);

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << passed_count << " / " << test_count << std::endl;

    if (passed_count == test_count) {
        std::cout << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}
