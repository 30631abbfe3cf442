#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "dbfs_master/node.hpp"
#include "dbfs_master/record_store.hpp"

namespace fs = std::filesystem;
using namespace dbfs_master;

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

dbfs_service::NodeRecord make_record(uint64_t id, const std::string& name, uint64_t parent) {
    Node node(id, true);
    node.name = name;
    node.parent_id = parent;
    node.owner = "alice";
    node.permissions["alice"] = Permission(true, true, true);
    return ToRecord(node);
}

dbfs_service::RecordBatch batch_of(std::initializer_list<dbfs_service::NodeRecord> puts,
                                   std::initializer_list<uint64_t> deletes = {}) {
    dbfs_service::RecordBatch batch;
    for (const auto& record : puts) {
        *batch.add_puts() = record;
    }
    for (uint64_t id : deletes) {
        batch.add_deletes(id);
    }
    return batch;
}

std::string fresh_journal(const std::string& name) {
    std::string dir = "/tmp/dbfs_test_record_store_" + name;
    fs::remove_all(dir);
    return dir + "/records.journal";
}

// Test 1: Memory store puts, deletes and failure injection
void test_memory_store() {
    MemoryRecordStore store;
    assert_test(store.Commit(batch_of({make_record(1, "", 0), make_record(2, "a", 1)})),
                "Test 1.1: Commit succeeds");
    assert_test(store.LoadAll().size() == 2, "Test 1.2: Both records stored");

    dbfs_service::NodeRecord out;
    assert_test(store.Get(2, out) && out.name() == "a", "Test 1.3: Get returns the record");

    store.Commit(batch_of({}, {2}));
    assert_test(!store.Get(2, out), "Test 1.4: Delete removes the record");

    store.SetCommitFailure(true);
    assert_test(!store.Commit(batch_of({make_record(3, "b", 1)})),
                "Test 1.5: Injected failure rejects the commit");
    assert_test(!store.Get(3, out), "Test 1.6: Rejected batch left no trace");
    assert_test(store.BatchCount() == 2, "Test 1.7: Only successful batches counted");
    assert_test(store.HighestId() == 2, "Test 1.8: Highest id includes deleted records");
    store.SetCommitFailure(false);
    assert_test(store.Commit(batch_of({make_record(3, "b", 1)})), "Test 1.9: Commits resume");
}

// Test 2: Node <-> record conversion keeps every field
void test_record_conversion() {
    Node node(7, false);
    node.name = "report.txt";
    node.parent_id = 3;
    node.owner = "bob";
    node.content_id = 11;
    node.size = 1234;
    node.upload_time = 1700000000.5;
    node.permissions["bob"] = Permission(true, true, false);
    node.permissions["eve"] = Permission(true, false, false);

    Node back = FromRecord(ToRecord(node));
    assert_test(back.id == 7 && back.name == "report.txt" && back.parent_id == 3,
                "Test 2.1: Identity fields survive");
    assert_test(!back.is_directory && back.content_id == 11 && back.size == 1234,
                "Test 2.2: File fields survive");
    assert_test(back.upload_time == 1700000000.5, "Test 2.3: Upload time survives");
    assert_test(back.permissions == node.permissions, "Test 2.4: Permission map survives");
}

// Test 3: Journal replays committed batches after reopen
void test_journal_replay() {
    std::string path = fresh_journal("replay");
    {
        JournalRecordStore store(path, true, 0);
        store.Commit(batch_of({make_record(1, "", 0)}));
        store.Commit(batch_of({make_record(2, "docs", 1), make_record(3, "tmp", 1)}));
        store.Commit(batch_of({}, {3}));
    }
    {
        JournalRecordStore store(path, true, 0);
        dbfs_service::NodeRecord out;
        assert_test(store.LoadAll().size() == 2, "Test 3.1: Replay yields surviving records");
        assert_test(store.Get(2, out) && out.name() == "docs", "Test 3.2: Put replayed");
        assert_test(!store.Get(3, out), "Test 3.3: Delete replayed");
        assert_test(store.BatchCount() == 3, "Test 3.4: Every batch replayed");
    }
    fs::remove_all(fs::path(path).parent_path());
}

// Test 4: A torn trailing batch is discarded as a whole
void test_journal_torn_tail() {
    std::string path = fresh_journal("torn");
    uint64_t good_bytes = 0;
    {
        JournalRecordStore store(path, false, 0);
        store.Commit(batch_of({make_record(1, "", 0)}));
        good_bytes = store.JournalBytes();
        store.Commit(batch_of({make_record(2, "half-written", 1)}));
    }

    // Chop the last batch in half
    uint64_t full_size = fs::file_size(path);
    fs::resize_file(path, good_bytes + (full_size - good_bytes) / 2);

    {
        JournalRecordStore store(path, false, 0);
        dbfs_service::NodeRecord out;
        assert_test(store.Get(1, out), "Test 4.1: Batch before the tear survives");
        assert_test(!store.Get(2, out), "Test 4.2: Torn batch discarded");
        assert_test(fs::file_size(path) == good_bytes, "Test 4.3: Journal truncated to last good batch");

        assert_test(store.Commit(batch_of({make_record(4, "after", 1)})),
                    "Test 4.4: Appends continue after truncation");
    }
    {
        JournalRecordStore store(path, false, 0);
        dbfs_service::NodeRecord out;
        assert_test(store.Get(4, out) && out.name() == "after",
                    "Test 4.5: Batch appended after truncation replays");
    }
    fs::remove_all(fs::path(path).parent_path());
}

// Test 5: Compaction rewrites the journal as one snapshot
void test_journal_compaction() {
    std::string path = fresh_journal("compact");
    {
        JournalRecordStore store(path, false, 4);
        store.Commit(batch_of({make_record(1, "", 0)}));
        for (uint64_t id = 2; id <= 10; ++id) {
            // Rewrite the same record repeatedly to give compaction something to fold
            store.Commit(batch_of({make_record(2, "v" + std::to_string(id), 1)}));
        }
        store.Commit(batch_of({make_record(11, "gone", 1)}));
        store.Commit(batch_of({}, {11}));
        uint64_t before = store.JournalBytes();
        assert_test(store.Compact(), "Test 5.1: Explicit compaction succeeds");
        assert_test(store.JournalBytes() <= before, "Test 5.2: Journal did not grow");
    }
    {
        JournalRecordStore store(path, false, 4);
        dbfs_service::NodeRecord out;
        assert_test(store.LoadAll().size() == 2, "Test 5.3: Snapshot holds the live records");
        assert_test(store.Get(2, out) && out.name() == "v10", "Test 5.4: Latest version kept");
        assert_test(store.BatchCount() == 1, "Test 5.5: Snapshot is a single batch");
        assert_test(!fs::exists(path + ".compact"), "Test 5.6: No temp file left behind");
        assert_test(store.HighestId() == 11 && !store.Get(11, out),
                    "Test 5.7: Snapshot remembers ids of deleted records");
    }
    fs::remove_all(fs::path(path).parent_path());
}

int main() {
    std::cout << "=== Record Store Test Suite ===" << std::endl << std::endl;

    test_memory_store();
    test_record_conversion();
    test_journal_replay();
    test_journal_torn_tail();
    test_journal_compaction();

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
