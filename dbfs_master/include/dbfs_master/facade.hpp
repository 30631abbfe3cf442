#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "dbfs_common/status.hpp"
#include "dbfs_common/user.hpp"
#include "dbfs_content/file_stream.hpp"
#include "dbfs_master/filesystem.hpp"
#include "dbfs_master/fs_context.hpp"
#include "dbfs_master/node.hpp"

namespace dbfs_master {

/**
 * FilesystemFacade: the public, path-addressed filesystem API
 *
 * Every call below takes the context lock, runs its permission checks and
 * then the tree operation, and releases the lock on return. Nothing can
 * interleave between the check and the mutation.
 *
 * user == nullptr is the system caller and skips every check.
 *
 * When a path does not resolve and the user cannot read the deepest
 * existing ancestor, calls report PermissionDenied instead of NotFound.
 */
class FilesystemFacade {
public:
    explicit FilesystemFacade(std::shared_ptr<FsContext> context);

    /**
     * Allocate a content stream; never touches the tree
     *
     * The stream may be written without any lock held. It takes effect only
     * when passed to CreateFile or ReplaceContent.
     */
    dbfs_common::Result<std::shared_ptr<dbfs_content::FileStream>> CreateFileHandle(
        dbfs_content::StreamMode mode, uint64_t estimated_length = 0,
        uint64_t object_id = 0, const std::string& initial_data = "");

    // Requires Writable on parent.
    dbfs_common::Result<Node> CreateFile(const std::string& parent, const std::string& name,
                                         dbfs_content::FileStream& stream,
                                         const dbfs_common::User* user = nullptr);
    dbfs_common::Result<Node> CreateDirectory(const std::string& parent,
                                              const std::string& name,
                                              const dbfs_common::User* user = nullptr);

    // Requires Readable on source, Writable on target. The copy is owned by user.
    dbfs_common::Status Copy(const std::string& source, const std::string& target_parent,
                             const dbfs_common::User* user = nullptr);

    // Requires Readable, WritableSelf and WritableAll on source, Writable on
    // target. The moved subtree is handed to user.
    dbfs_common::Status Move(const std::string& source, const std::string& target_parent,
                             const dbfs_common::User* user = nullptr);

    // Requires Readable, WritableSelf and WritableAll.
    dbfs_common::Status Remove(const std::string& path,
                               const dbfs_common::User* user = nullptr);

    // Requires ReadWritable.
    dbfs_common::Status Rename(const std::string& path, const std::string& name,
                               const dbfs_common::User* user = nullptr);

    // Require ReadWritableAll.
    dbfs_common::Status ChangeOwnership(const std::string& path, const std::string& owner,
                                        const dbfs_common::User* user = nullptr);
    dbfs_common::Status ChangePermissions(const std::string& path,
                                          const PermissionMap& permissions,
                                          bool recursive = false,
                                          const dbfs_common::User* user = nullptr);

    // System only; returns the number of nodes reassigned.
    dbfs_common::Result<size_t> ExpungeUserOwnership(const std::string& handle);

    // Unreadable entries are left out; an unreadable directory lists empty.
    dbfs_common::Result<std::vector<DirectoryEntry>> ListDirectory(
        const std::string& path, const dbfs_common::User* user = nullptr);

    dbfs_common::Result<std::string> GetContent(const std::string& path,
                                                const dbfs_common::User* user = nullptr);

    // Read-mode stream over a file's current content.
    dbfs_common::Result<std::shared_ptr<dbfs_content::FileStream>> OpenContentStream(
        const std::string& path, const dbfs_common::User* user = nullptr);

    // Requires ReadWritable on the file.
    dbfs_common::Status ReplaceContent(const std::string& path,
                                       dbfs_content::FileStream& stream,
                                       const dbfs_common::User* user = nullptr);

    dbfs_common::Result<Node> Stat(const std::string& path,
                                   const dbfs_common::User* user = nullptr);

    // ========================================================================
    // Probes: false for unresolvable paths
    // ========================================================================
    bool Readable(const std::string& path, const dbfs_common::User* user = nullptr);
    bool Writable(const std::string& path, const dbfs_common::User* user = nullptr);
    bool WritableSelf(const std::string& path, const dbfs_common::User* user = nullptr);

    // Final path segment; the path need not exist.
    static std::string GetFileName(const std::string& path);

    FsContext& Context() { return *context_; }

private:
    std::shared_ptr<FsContext> context_;

    // Caller holds the context lock.
    dbfs_common::Result<uint64_t> ResolveFor(const std::string& path,
                                             const dbfs_common::User* user) const;
    dbfs_common::Status Deny(const std::string& action, const std::string& path,
                             const dbfs_common::User* user) const;
};

}  // namespace dbfs_master
