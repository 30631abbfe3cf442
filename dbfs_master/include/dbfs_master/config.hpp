#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include "dbfs_common/status.hpp"

namespace dbfs_master {

// ============================================================================
// Configuration
// ============================================================================
const std::string DEFAULT_HOST = "0.0.0.0";
const int DEFAULT_PORT = 50060;
const std::string DEFAULT_DATA_DIR = "./dbfs_data";
const uint64_t DEFAULT_CACHE_BYTES = 64ull * 1024 * 1024;
const uint64_t DEFAULT_COMPACT_THRESHOLD = 1024;
const std::string DEFAULT_SYSTEM_OWNER = "public";

enum class RecordBackend {
    kMemory,
    kJournal
};

struct FsConfig {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    std::string data_dir = DEFAULT_DATA_DIR;
    RecordBackend records = RecordBackend::kJournal;
    bool sync = true;
    bool cache_enabled = true;
    uint64_t cache_bytes = DEFAULT_CACHE_BYTES;
    uint64_t compact_threshold = DEFAULT_COMPACT_THRESHOLD;
    std::string system_owner = DEFAULT_SYSTEM_OWNER;
    std::string admin_token;  // empty: system-only RPCs disabled
    bool show_help = false;

    std::string ObjectsDir() const { return data_dir + "/objects"; }
    std::string JournalPath() const { return data_dir + "/records.journal"; }
};

/**
 * Fill config from command-line flags
 *
 * Unknown flags are reported on stderr and skipped. A malformed value
 * (bad number, unknown backend, bad boolean) returns Invalid.
 */
dbfs_common::Status ParseArgs(int argc, char* argv[], FsConfig& config);

void PrintUsage(std::ostream& out);

const char* RecordBackendName(RecordBackend backend);

}  // namespace dbfs_master
