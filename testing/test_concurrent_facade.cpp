#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include "dbfs_master/facade.hpp"

namespace fs = std::filesystem;
using namespace dbfs_master;
using dbfs_common::StatusCode;
using dbfs_common::User;
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

std::shared_ptr<FsContext> make_context(const std::string& name) {
    FsConfig config;
    config.data_dir = "/tmp/dbfs_test_concurrent_facade_" + name;
    config.sync = false;
    fs::remove_all(config.data_dir);
    return FsContext::Create(config, std::make_unique<MemoryRecordStore>()).value();
}

// ============================================================================
// Test 1: Parallel creates get distinct ids and names
// ============================================================================
void test_parallel_creates() {
    std::cout << "\n=== Test 1: Parallel creates ===" << std::endl;
    auto context = make_context("create");
    FilesystemFacade facade(context);
    const int num_threads = 8;
    const int per_thread = 50;

    facade.CreateDirectory("/", "work", nullptr);
    std::vector<std::thread> threads;
    std::vector<std::vector<uint64_t>> ids(num_threads);
    std::atomic<int> failures{0};

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < per_thread; ++i) {
                std::string name = "t" + std::to_string(t) + "_" + std::to_string(i);
                auto stream = facade.CreateFileHandle(StreamMode::kWrite, 0, 0, name);
                auto node = facade.CreateFile("/work", name, *stream.value(), nullptr);
                if (node.ok()) {
                    ids[t].push_back(node.value().id);
                } else {
                    failures++;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::unordered_set<uint64_t> unique;
    for (const auto& list : ids) {
        unique.insert(list.begin(), list.end());
    }
    assert_test(failures == 0, "1.1 Every create succeeded");
    assert_test(unique.size() == num_threads * per_thread, "1.2 Every node id distinct");
    auto listing = facade.ListDirectory("/work", nullptr);
    assert_test(listing.ok() && listing.value().size() == num_threads * per_thread,
                "1.3 Directory holds every file");
    assert_test(facade.GetContent("/work/t3_7", nullptr).ValueOr("") == "t3_7",
                "1.4 Content matches its file");
    fs::remove_all(context->Config().data_dir);
}

// ============================================================================
// Test 2: Racing creates of the same name
// ============================================================================
void test_same_name_race() {
    std::cout << "\n=== Test 2: Same-name race ===" << std::endl;
    auto context = make_context("race");
    FilesystemFacade facade(context);
    std::atomic<int> created{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&]() {
            auto result = facade.CreateDirectory("/", "contested", nullptr);
            if (result.ok()) {
                created++;
            } else if (result.status().code() == StatusCode::kConflict) {
                conflicts++;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    assert_test(created == 1, "2.1 Exactly one create wins");
    assert_test(conflicts == 15, "2.2 Every other create sees Conflict");
    fs::remove_all(context->Config().data_dir);
}

// ============================================================================
// Test 3: Mixed structural operations keep the tree well-formed
// ============================================================================
void test_mixed_operations() {
    std::cout << "\n=== Test 3: Mixed operations ===" << std::endl;
    auto context = make_context("mixed");
    FilesystemFacade facade(context);
    const int num_threads = 6;
    const int ops_per_thread = 150;

    facade.ChangePermissions("/", {{"u0", Permission(true, true, true)},
                                   {"u1", Permission(true, true, true)},
                                   {"u2", Permission(true, true, true)}},
                             false, nullptr);
    for (const char* dir : {"a", "b", "c"}) {
        facade.CreateDirectory("/", dir, nullptr);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            User user("u" + std::to_string(t % 3));
            std::mt19937 rng(1000 + t);
            const std::vector<std::string> dirs = {"/a", "/b", "/c"};
            const std::vector<std::string> names = {"x", "y", "z"};
            for (int i = 0; i < ops_per_thread; ++i) {
                const std::string& dir = dirs[rng() % dirs.size()];
                const std::string& other = dirs[rng() % dirs.size()];
                const std::string& name = names[rng() % names.size()];
                std::string path = dir + "/" + name;
                switch (rng() % 6) {
                    case 0: facade.CreateDirectory(dir, name, &user); break;
                    case 1: {
                        auto stream = facade.CreateFileHandle(StreamMode::kWrite, 0, 0, "d");
                        facade.CreateFile(dir, name, *stream.value(), &user);
                        break;
                    }
                    case 2: facade.Copy(path, other, &user); break;
                    case 3: facade.Move(path, other, &user); break;
                    case 4: facade.Rename(path, names[rng() % names.size()], &user); break;
                    case 5: facade.Remove(path, &user); break;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::lock_guard<std::mutex> lock(context->Mutex());
    Filesystem& tree = context->Tree();
    assert_test(tree.CheckIntegrity().ok(), "3.1 Tree well-formed after concurrent operations");

    std::vector<uint64_t> stored = context->Content().ListObjects();
    std::unordered_set<uint64_t> stored_set(stored.begin(), stored.end());
    assert_test(stored_set == tree.LiveContentIds(), "3.2 No leaked or dangling content");
    assert_test(tree.CollectSubtree(ROOT_NODE_ID).size() == tree.NodeCount(),
                "3.3 Every node reachable from the root");
    fs::remove_all(context->Config().data_dir);
}

int main() {
    std::cout << "=== Concurrent Facade Test Suite ===" << std::endl;

    test_parallel_creates();
    test_same_name_race();
    test_mixed_operations();

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
