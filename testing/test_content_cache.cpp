#include "dbfs_content/content_cache.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace dbfs_content;

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

// Test 1: Basic Put and Get
void test_basic_put_get() {
    ContentCache cache(1024);
    std::string out_data;
    std::string data = "Hello World Object Data";

    bool put_result = cache.Put(1, data);
    assert_test(put_result == true, "Test 1.1: Put should return true");

    bool get_result = cache.Get(1, out_data);
    assert_test(get_result == true, "Test 1.2: Get existing object should return true");
    assert_test(out_data == data, "Test 1.3: Retrieved data should match inserted data");
}

// Test 2: Get non-existent object
void test_get_nonexistent() {
    ContentCache cache(1024);
    std::string out_data;
    assert_test(cache.Get(999, out_data) == false,
                "Test 2: Get non-existent object should return false");
}

// Test 3: Contains / Remove
void test_contains_remove() {
    ContentCache cache(1024);
    cache.Put(100, "payload");
    assert_test(cache.Contains(100), "Test 3.1: Contains should be true after put");
    assert_test(cache.Remove(100), "Test 3.2: Remove should return true");
    assert_test(!cache.Contains(100), "Test 3.3: Object should be gone after remove");
    assert_test(!cache.Remove(100), "Test 3.4: Second remove should return false");
}

// Test 4: Refreshing an object replaces its bytes and its size accounting
void test_put_replaces() {
    ContentCache cache(1024);
    std::string out_data;
    cache.Put(100, std::string(100, 'a'));
    cache.Put(100, std::string(10, 'b'));

    cache.Get(100, out_data);
    assert_test(out_data == std::string(10, 'b'), "Test 4.1: Second put should win");
    assert_test(cache.GetStats().bytes == 10, "Test 4.2: Byte count should follow the new size");
    assert_test(cache.GetStats().entries == 1, "Test 4.3: Still one entry");
}

// Test 5: Eviction is bounded by bytes
void test_byte_bound_eviction() {
    ContentCache cache(8000);
    cache.Put(100, std::string(4000, 'A'));
    cache.Put(101, std::string(4000, 'B'));
    assert_test(cache.Contains(100) && cache.Contains(101),
                "Test 5.1: Two 4000-byte objects fit in 8000 bytes");

    cache.Put(102, std::string(4000, 'C'));
    assert_test(!cache.Contains(100), "Test 5.2: Oldest object evicted");
    assert_test(cache.Contains(101) && cache.Contains(102), "Test 5.3: Newer objects kept");
    assert_test(cache.GetStats().bytes <= cache.GetCapacity(),
                "Test 5.4: Cached bytes never exceed capacity");
}

// Test 6: LRU ordering - recently read objects are kept
void test_lru_ordering() {
    ContentCache cache(8000);
    std::string out_data;
    cache.Put(100, std::string(4000, 'A'));
    cache.Put(101, std::string(4000, 'B'));

    cache.Get(100, out_data);
    cache.Put(102, std::string(4000, 'C'));

    assert_test(cache.Contains(100), "Test 6.1: Recently read object kept");
    assert_test(!cache.Contains(101), "Test 6.2: Least recently used object evicted");
    assert_test(cache.Contains(102), "Test 6.3: New object cached");
}

// Test 7: Objects larger than the cache are refused without evicting others
void test_oversized_object() {
    ContentCache cache(1000);
    cache.Put(1, "small");
    bool put_result = cache.Put(2, std::string(2000, 'X'));
    assert_test(put_result == false, "Test 7.1: Oversized put should return false");
    assert_test(!cache.Contains(2), "Test 7.2: Oversized object not cached");
    assert_test(cache.Contains(1), "Test 7.3: Existing object untouched");
}

// Test 8: Statistics
void test_stats() {
    ContentCache cache(8000);
    std::string out_data;
    cache.Put(1, std::string(4000, 'A'));
    cache.Get(1, out_data);
    cache.Get(1, out_data);
    cache.Get(2, out_data);
    cache.Put(2, std::string(4000, 'B'));
    cache.Put(3, std::string(4000, 'C'));

    auto stats = cache.GetStats();
    assert_test(stats.hits == 2, "Test 8.1: Two hits recorded");
    assert_test(stats.misses == 1, "Test 8.2: One miss recorded");
    assert_test(stats.evictions == 1, "Test 8.3: One eviction recorded");
    assert_test(stats.entries == 2, "Test 8.4: Two entries resident");

    cache.ResetStats();
    stats = cache.GetStats();
    assert_test(stats.hits == 0 && stats.misses == 0 && stats.evictions == 0,
                "Test 8.5: ResetStats clears counters");
    assert_test(stats.entries == 2, "Test 8.6: ResetStats keeps entries");
}

// Test 9: Clear
void test_clear() {
    ContentCache cache(1024);
    cache.Put(1, "a");
    cache.Put(2, "b");
    cache.Clear();
    assert_test(!cache.Contains(1) && !cache.Contains(2), "Test 9.1: Clear drops every entry");
    assert_test(cache.GetStats().bytes == 0, "Test 9.2: Clear resets byte count");
}

// Test 10: Empty payloads are valid objects
void test_empty_object() {
    ContentCache cache(1024);
    std::string out_data = "stale";
    cache.Put(7, "");
    assert_test(cache.Get(7, out_data), "Test 10.1: Empty object is cached");
    assert_test(out_data.empty(), "Test 10.2: Empty object reads back empty");
}

int main() {
    std::cout << "=== Content Cache Test Suite ===" << std::endl << std::endl;

    test_basic_put_get();
    test_get_nonexistent();
    test_contains_remove();
    test_put_replaces();
    test_byte_bound_eviction();
    test_lru_ordering();
    test_oversized_object();
    test_stats();
    test_clear();
    test_empty_object();

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
