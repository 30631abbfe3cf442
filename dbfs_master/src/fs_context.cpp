#include "dbfs_master/fs_context.hpp"
#include <iostream>

using dbfs_common::Result;
using dbfs_common::Status;

namespace dbfs_master {

FsContext::FsContext(const FsConfig& config) : config_(config) {}

FsContext::~FsContext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (journal_ && !journal_->Compact()) {
        std::cerr << "FsContext: Final journal compaction failed" << std::endl;
    }
}

Result<std::shared_ptr<FsContext>> FsContext::Create(const FsConfig& config) {
    try {
        std::unique_ptr<RecordStore> records;
        if (config.records == RecordBackend::kJournal) {
            records = std::make_unique<JournalRecordStore>(config.JournalPath(), config.sync,
                                                           config.compact_threshold);
        } else {
            records = std::make_unique<MemoryRecordStore>();
        }
        return Create(config, std::move(records));
    } catch (const std::exception& e) {
        std::cerr << "FsContext: Failed to open record store: " << e.what() << std::endl;
        return Status::IoError(std::string("failed to open record store: ") + e.what());
    }
}

Result<std::shared_ptr<FsContext>> FsContext::Create(const FsConfig& config,
                                                     std::unique_ptr<RecordStore> records) {
    if (!records) {
        return Status::Invalid("no record store");
    }
    if (config.system_owner.empty()) {
        return Status::Invalid("system owner handle is empty");
    }

    std::shared_ptr<FsContext> context(new FsContext(config));
    try {
        context->records_ = std::move(records);
        context->journal_ = dynamic_cast<JournalRecordStore*>(context->records_.get());
        context->content_ = std::make_unique<dbfs_content::ContentStore>(
            config.ObjectsDir(), config.cache_enabled, config.cache_bytes, config.sync);
        context->tree_ = std::make_unique<Filesystem>(*context->records_, *context->content_,
                                                      config.system_owner);
        context->permissions_ = std::make_unique<PermissionEngine>(*context->tree_);
    } catch (const std::exception& e) {
        std::cerr << "FsContext: Failed to initialize: " << e.what() << std::endl;
        context->journal_ = nullptr;
        return Status::IoError(std::string("failed to initialize: ") + e.what());
    }

    Status loaded = context->tree_->Load();
    if (!loaded.ok()) {
        context->journal_ = nullptr;
        return loaded;
    }

    // Objects committed just before a crash may never have been linked
    size_t collected = context->content_->CollectGarbage(context->tree_->LiveContentIds());
    if (collected > 0) {
        std::cout << "FsContext: Collected " << collected << " unreferenced objects"
                  << std::endl;
    }

    Status integrity = context->tree_->CheckIntegrity();
    if (!integrity.ok()) {
        std::cerr << "FsContext: Integrity check failed: " << integrity.ToString() << std::endl;
    }
    return context;
}

}  // namespace dbfs_master
