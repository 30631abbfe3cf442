#include "dbfs_content/file_stream.hpp"
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <thread>
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

// Test 1: Append writes accumulate in order
void test_append() {
    FileStream stream(StreamMode::kWrite, 64, 0, "");
    assert_test(stream.Write("Hello, ").ok(), "Test 1.1: First write succeeds");
    assert_test(stream.Write("stream").ok(), "Test 1.2: Second write succeeds");
    assert_test(stream.ReadAll() == "Hello, stream", "Test 1.3: Writes appended in order");
    assert_test(stream.Size() == 13, "Test 1.4: Size matches buffered bytes");
}

// Test 2: Offset writes overwrite and zero-fill gaps
void test_write_at() {
    FileStream stream(StreamMode::kWrite, 0, 0, "abcdef");
    stream.WriteAt(2, "XY");
    assert_test(stream.ReadAll() == "abXYef", "Test 2.1: WriteAt overwrites in place");

    stream.WriteAt(8, "Z");
    std::string expected = std::string("abXYef") + std::string(2, '\0') + "Z";
    assert_test(stream.ReadAll() == expected, "Test 2.2: Gap past the end is zero-filled");
}

// Test 2b: Offsets far past the end are rejected without touching the buffer
void test_write_at_out_of_range() {
    FileStream stream(StreamMode::kWrite, 16, 0, "abcdef");

    auto wrapped = stream.WriteAt(UINT64_MAX, "XY");
    assert_test(wrapped.code() == dbfs_common::StatusCode::kInvalid,
                "Test 2b.1: Offset that would wrap is Invalid");
    assert_test(stream.ReadAll() == "abcdef", "Test 2b.2: Buffer unchanged after wrap attempt");

    auto huge = stream.WriteAt(UINT64_MAX / 2, "XY");
    assert_test(huge.code() == dbfs_common::StatusCode::kInvalid,
                "Test 2b.3: Offset beyond the gap limit is Invalid");

    auto past_limit = stream.WriteAt(6 + MAX_RESERVE_BYTES + 1, "Z");
    assert_test(past_limit.code() == dbfs_common::StatusCode::kInvalid,
                "Test 2b.4: Gap one byte over the limit is Invalid");
    assert_test(stream.Size() == 6, "Test 2b.5: Size unchanged after rejected writes");

    assert_test(stream.WriteAt(6 + MAX_RESERVE_BYTES, "Z").ok(),
                "Test 2b.6: Gap exactly at the limit is accepted");
    assert_test(stream.Size() == 6 + MAX_RESERVE_BYTES + 1, "Test 2b.7: Buffer grew to fit");
}

// Test 3: Range reads
void test_range_read() {
    FileStream stream(StreamMode::kRead, 0, 5, "0123456789");
    std::string out;

    stream.Read(0, 0, out);
    assert_test(out == "0123456789", "Test 3.1: length 0 reads everything");
    stream.Read(4, 0, out);
    assert_test(out == "456789", "Test 3.2: offset with length 0 reads to the end");
    stream.Read(2, 3, out);
    assert_test(out == "234", "Test 3.3: bounded range");
    stream.Read(8, 10, out);
    assert_test(out == "89", "Test 3.4: range clipped at the end");
    stream.Read(20, 1, out);
    assert_test(out.empty(), "Test 3.5: offset past the end reads nothing");
}

// Test 4: Read streams reject writes
void test_read_stream_is_read_only() {
    FileStream stream(StreamMode::kRead, 0, 3, "fixed");
    auto st = stream.Write("more");
    assert_test(!st.ok(), "Test 4.1: Write on read stream fails");
    assert_test(st.code() == dbfs_common::StatusCode::kInvalid, "Test 4.2: Failure is Invalid");
    assert_test(!stream.WriteAt(0, "x").ok(), "Test 4.3: WriteAt on read stream fails");
    assert_test(stream.ReadAll() == "fixed", "Test 4.4: Buffer unchanged");
    assert_test(stream.SourceObjectId() == 3, "Test 4.5: Source object id kept");
}

// Test 5: Handles are unique UUIDs
void test_unique_handles() {
    std::set<std::string> handles;
    for (int i = 0; i < 100; ++i) {
        FileStream stream(StreamMode::kWrite, 0, 0, "");
        handles.insert(stream.Handle());
        if (i == 0) {
            assert_test(stream.Handle().size() == 36, "Test 5.1: Handle is a 36-char UUID");
        }
    }
    assert_test(handles.size() == 100, "Test 5.2: 100 streams get 100 distinct handles");
}

// Test 6: Empty sentinel
void test_empty_sentinel() {
    auto empty = FileStream::Empty();
    assert_test(empty != nullptr, "Test 6.1: Empty() returns a stream");
    assert_test(empty->IsEmptySentinel(), "Test 6.2: Sentinel flag set");
    assert_test(empty->Size() == 0 && empty->ReadAll().empty(), "Test 6.3: Sentinel is empty");
    assert_test(empty->Mode() == StreamMode::kRead, "Test 6.4: Sentinel is read-only");
    assert_test(FileStream::Empty() == empty, "Test 6.5: Sentinel is shared");
}

// Test 7: Estimated length is a hint, not a limit
void test_estimate_is_hint() {
    FileStream stream(StreamMode::kWrite, 4, 0, "");
    stream.Write(std::string(100, 'x'));
    assert_test(stream.Size() == 100, "Test 7.1: Stream grows past its estimate");
    assert_test(stream.EstimatedLength() == 4, "Test 7.2: Estimate reported unchanged");
}

// Test 8: Concurrent writers on one stream never lose bytes
void test_concurrent_writes() {
    FileStream stream(StreamMode::kWrite, 0, 0, "");
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&stream]() {
            for (int i = 0; i < 500; ++i) {
                stream.Write("ab");
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    assert_test(stream.Size() == 8 * 500 * 2, "Test 8: All concurrent appends land");
}

int main() {
    std::cout << "=== File Stream Test Suite ===" << std::endl << std::endl;

    test_append();
    test_write_at();
    test_write_at_out_of_range();
    test_range_read();
    test_read_stream_is_read_only();
    test_unique_handles();
    test_empty_sentinel();
    test_estimate_is_hint();
    test_concurrent_writes();

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
