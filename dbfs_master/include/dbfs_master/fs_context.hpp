#pragma once
#include <memory>
#include <mutex>
#include "dbfs_common/status.hpp"
#include "dbfs_content/content_store.hpp"
#include "dbfs_master/config.hpp"
#include "dbfs_master/filesystem.hpp"
#include "dbfs_master/permission_engine.hpp"
#include "dbfs_master/record_store.hpp"

namespace dbfs_master {

/**
 * FsContext: one filesystem instance
 *
 * Owns the record store, content store, tree, permission engine and the
 * lock that serializes every facade call. Built once by Create; several
 * contexts may live side by side (one per test case, for instance).
 *
 * Start-up order:
 *   records -> content -> tree Load -> content garbage collection
 */
class FsContext {
public:
    static dbfs_common::Result<std::shared_ptr<FsContext>> Create(const FsConfig& config);

    // Uses the given record store instead of the one config names.
    static dbfs_common::Result<std::shared_ptr<FsContext>> Create(
        const FsConfig& config, std::unique_ptr<RecordStore> records);

    ~FsContext();

    FsContext(const FsContext&) = delete;
    FsContext& operator=(const FsContext&) = delete;

    const FsConfig& Config() const { return config_; }
    RecordStore& Records() { return *records_; }
    dbfs_content::ContentStore& Content() { return *content_; }
    Filesystem& Tree() { return *tree_; }
    PermissionEngine& Permissions() { return *permissions_; }
    std::mutex& Mutex() { return mutex_; }

private:
    explicit FsContext(const FsConfig& config);

    FsConfig config_;
    std::unique_ptr<RecordStore> records_;
    JournalRecordStore* journal_ = nullptr;  // records_ when it is a journal
    std::unique_ptr<dbfs_content::ContentStore> content_;
    std::unique_ptr<Filesystem> tree_;
    std::unique_ptr<PermissionEngine> permissions_;
    std::mutex mutex_;
};

}  // namespace dbfs_master
