#include "dbfs_master/record_store.hpp"
#include "dbfs_common/fsync.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/util/delimited_message_util.h>

namespace fs = std::filesystem;

namespace dbfs_master {

namespace {

uint64_t HighestIdIn(const dbfs_service::RecordBatch& batch) {
    uint64_t highest = batch.highest_id();
    for (const auto& record : batch.puts()) {
        highest = std::max(highest, record.id());
    }
    for (uint64_t id : batch.deletes()) {
        highest = std::max(highest, id);
    }
    return highest;
}

}  // namespace

// ============================================================================
// MemoryRecordStore
// ============================================================================

bool MemoryRecordStore::Commit(const dbfs_service::RecordBatch& batch) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    if (fail_commits_) {
        std::cerr << "MemoryRecordStore: Commit rejected (failure injected)" << std::endl;
        return false;
    }
    for (uint64_t id : batch.deletes()) {
        records_.erase(id);
    }
    for (const auto& record : batch.puts()) {
        records_[record.id()] = record;
    }
    highest_id_ = std::max(highest_id_, HighestIdIn(batch));
    batch_count_++;
    return true;
}

bool MemoryRecordStore::Get(uint64_t id, dbfs_service::NodeRecord& out_record) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    out_record = it->second;
    return true;
}

std::vector<dbfs_service::NodeRecord> MemoryRecordStore::LoadAll() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    std::vector<dbfs_service::NodeRecord> records;
    records.reserve(records_.size());
    for (const auto& pair : records_) {
        records.push_back(pair.second);
    }
    return records;
}

uint64_t MemoryRecordStore::BatchCount() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return batch_count_;
}

uint64_t MemoryRecordStore::HighestId() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return highest_id_;
}

void MemoryRecordStore::SetCommitFailure(bool fail) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    fail_commits_ = fail;
}

// ============================================================================
// JournalRecordStore
// ============================================================================

JournalRecordStore::JournalRecordStore(const std::string& journal_path, bool sync,
                                       uint64_t compact_threshold)
    : journal_path_(journal_path), sync_(sync), compact_threshold_(compact_threshold) {
    fs::path parent = fs::path(journal_path_).parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        fs::create_directories(parent);
    }
    Replay();
}

void JournalRecordStore::Replay() {
    std::lock_guard<std::mutex> lock(records_mutex_);

    std::ifstream file(journal_path_, std::ios::binary);
    if (!file.is_open()) {
        std::cout << "JournalRecordStore: Starting new journal at " << journal_path_
                  << std::endl;
        return;
    }

    uint64_t good_bytes = 0;
    bool torn = false;
    {
        google::protobuf::io::IstreamInputStream input(&file);
        while (true) {
            dbfs_service::RecordBatch batch;
            bool clean_eof = false;
            if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(&batch, &input,
                                                                         &clean_eof)) {
                torn = !clean_eof;
                break;
            }
            ApplyLocked(batch);
            batch_count_++;
            batches_since_compact_++;
            next_sequence_ = std::max(next_sequence_, batch.sequence() + 1);
            good_bytes = static_cast<uint64_t>(input.ByteCount());
        }
    }
    file.close();

    if (torn) {
        std::cerr << "JournalRecordStore: Discarding torn batch after byte " << good_bytes
                  << std::endl;
        std::error_code ec;
        fs::resize_file(journal_path_, good_bytes, ec);
        if (ec) {
            std::cerr << "JournalRecordStore: Failed to truncate journal: " << ec.message()
                      << std::endl;
        }
    }
    journal_bytes_ = good_bytes;

    std::cout << "JournalRecordStore: Replayed " << batch_count_ << " batches, "
              << records_.size() << " records" << std::endl;
}

void JournalRecordStore::ApplyLocked(const dbfs_service::RecordBatch& batch) {
    for (uint64_t id : batch.deletes()) {
        records_.erase(id);
    }
    for (const auto& record : batch.puts()) {
        records_[record.id()] = record;
    }
    highest_id_ = std::max(highest_id_, HighestIdIn(batch));
}

bool JournalRecordStore::AppendLocked(const dbfs_service::RecordBatch& batch) {
    bool ok = false;
    {
        std::ofstream file(journal_path_, std::ios::binary | std::ios::app);
        if (!file.is_open()) {
            std::cerr << "JournalRecordStore: Failed to open journal: " << journal_path_
                      << std::endl;
            return false;
        }
        ok = google::protobuf::util::SerializeDelimitedToOstream(batch, &file);
        file.flush();
        ok = ok && file.good();
    }

    if (ok && sync_) {
        ok = dbfs_common::SyncPath(journal_path_);
    }

    std::error_code ec;
    if (!ok) {
        // Cut the partial batch so later appends stay readable
        fs::resize_file(journal_path_, journal_bytes_, ec);
        if (ec) {
            std::cerr << "JournalRecordStore: Failed to roll back journal tail: "
                      << ec.message() << std::endl;
        }
        return false;
    }

    auto size = fs::file_size(journal_path_, ec);
    journal_bytes_ = ec ? journal_bytes_ : static_cast<uint64_t>(size);
    return true;
}

bool JournalRecordStore::Commit(const dbfs_service::RecordBatch& batch) {
    std::lock_guard<std::mutex> lock(records_mutex_);

    dbfs_service::RecordBatch stamped = batch;
    stamped.set_sequence(next_sequence_);

    if (!AppendLocked(stamped)) {
        std::cerr << "JournalRecordStore: Commit of batch " << next_sequence_ << " failed"
                  << std::endl;
        return false;
    }

    next_sequence_++;
    ApplyLocked(stamped);
    batch_count_++;
    batches_since_compact_++;

    if (compact_threshold_ > 0 && batches_since_compact_ >= compact_threshold_) {
        if (!CompactLocked()) {
            std::cerr << "JournalRecordStore: Compaction failed, keeping journal" << std::endl;
        }
    }
    return true;
}

bool JournalRecordStore::Compact() {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return CompactLocked();
}

bool JournalRecordStore::CompactLocked() {
    dbfs_service::RecordBatch snapshot;
    snapshot.set_sequence(next_sequence_);
    snapshot.set_highest_id(highest_id_);
    for (const auto& pair : records_) {
        *snapshot.add_puts() = pair.second;
    }

    std::string tmp_path = journal_path_ + ".compact";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "JournalRecordStore: Failed to open " << tmp_path << std::endl;
            return false;
        }
        bool ok = google::protobuf::util::SerializeDelimitedToOstream(snapshot, &file);
        file.flush();
        if (!ok || !file.good()) {
            std::cerr << "JournalRecordStore: Failed to write snapshot" << std::endl;
            return false;
        }
    }

    if (sync_ && !dbfs_common::SyncPath(tmp_path)) {
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, journal_path_, ec);
    if (ec) {
        std::cerr << "JournalRecordStore: Failed to install snapshot: " << ec.message()
                  << std::endl;
        return false;
    }

    next_sequence_++;
    batches_since_compact_ = 0;
    auto size = fs::file_size(journal_path_, ec);
    journal_bytes_ = ec ? 0 : static_cast<uint64_t>(size);

    std::cout << "JournalRecordStore: Compacted " << records_.size() << " records into "
              << journal_bytes_ << " bytes" << std::endl;
    return true;
}

bool JournalRecordStore::Get(uint64_t id, dbfs_service::NodeRecord& out_record) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    out_record = it->second;
    return true;
}

std::vector<dbfs_service::NodeRecord> JournalRecordStore::LoadAll() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    std::vector<dbfs_service::NodeRecord> records;
    records.reserve(records_.size());
    for (const auto& pair : records_) {
        records.push_back(pair.second);
    }
    return records;
}

uint64_t JournalRecordStore::BatchCount() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return batch_count_;
}

uint64_t JournalRecordStore::HighestId() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return highest_id_;
}

uint64_t JournalRecordStore::JournalBytes() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return journal_bytes_;
}

}  // namespace dbfs_master
