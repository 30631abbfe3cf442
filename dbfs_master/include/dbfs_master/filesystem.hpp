#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "dbfs_common/status.hpp"
#include "dbfs_content/content_store.hpp"
#include "dbfs_content/file_stream.hpp"
#include "dbfs_master/node.hpp"
#include "dbfs_master/record_store.hpp"

namespace dbfs_master {

struct DirectoryEntry {
    uint64_t id = 0;
    std::string name;
    uint64_t size = 0;
    bool is_directory = false;
    std::string owner;
    double upload_time = 0.0;
    bool writable = false;
};

/**
 * Filesystem: the node tree and its structural operations
 *
 * Every mutation is validated completely, written to the RecordStore as a
 * single RecordBatch, and only then applied to the in-memory node table.
 * A failed validation or a failed commit leaves the tree untouched.
 *
 * No permission checks happen here; FilesystemFacade checks first and then
 * calls in, holding the context lock for both steps. Nothing in this class
 * locks.
 */
class Filesystem {
public:
    Filesystem(RecordStore& records, dbfs_content::ContentStore& content,
               std::string system_owner);

    /**
     * Rebuild the node table from the record store
     *
     * - Recreates the root when it is missing
     * - Deletes records that cannot reach the root (orphans, cycles,
     *   duplicate sibling names)
     */
    dbfs_common::Status Load();

    // ========================================================================
    // Lookup
    // ========================================================================

    const Node* FindNode(uint64_t id) const;

    dbfs_common::Result<uint64_t> Resolve(const std::string& path) const;

    /**
     * Walk as far as the path resolves
     * @param fully_resolved Set to whether every segment matched
     * @return Id of the deepest existing node (the root at worst)
     */
    dbfs_common::Result<uint64_t> ResolveDeepest(const std::string& path,
                                                 bool& fully_resolved) const;

    // Preorder: the node itself first, parents before children.
    std::vector<uint64_t> CollectSubtree(uint64_t id) const;

    // True when ancestor_id is node_id or one of its ancestors.
    bool IsAncestor(uint64_t ancestor_id, uint64_t node_id) const;

    std::string PathOf(uint64_t id) const;
    std::unordered_set<uint64_t> LiveContentIds() const;
    size_t NodeCount() const { return nodes_.size(); }
    const std::string& SystemOwner() const { return system_owner_; }

    // Single root, resolvable parents, no cycles, unique sibling names,
    // files carry content and directories do not.
    dbfs_common::Status CheckIntegrity() const;

    // ========================================================================
    // Mutations
    // ========================================================================

    dbfs_common::Result<uint64_t> CreateFile(uint64_t parent_id, const std::string& name,
                                             const std::string& owner,
                                             dbfs_content::FileStream& stream);

    dbfs_common::Result<uint64_t> CreateDirectory(uint64_t parent_id, const std::string& name,
                                                  const std::string& owner);

    /**
     * Deep-copy a subtree under target_parent_id
     *
     * Content is always duplicated. A name already taken in the target gets
     * the first free "name (N).ext". When new_owner is set it owns every
     * copied node.
     *
     * @return Id of the copy's top node
     */
    dbfs_common::Result<uint64_t> CopyWithHandle(uint64_t source_id, uint64_t target_parent_id,
                                                 const std::optional<std::string>& new_owner);

    /**
     * Relink a subtree under a new parent
     *
     * When new_owner is set it owns every moved node; the relink and the
     * owner change commit as one batch.
     */
    dbfs_common::Status MoveWithHandle(uint64_t source_id, uint64_t target_parent_id,
                                       const std::optional<std::string>& new_owner);
    dbfs_common::Status Remove(uint64_t node_id);
    dbfs_common::Status Rename(uint64_t node_id, const std::string& new_name);

    // Recursive over the subtree.
    dbfs_common::Status ChangeOwnership(uint64_t node_id, const std::string& new_owner);

    // An all-false triple removes the handle's entry.
    dbfs_common::Status ChangePermissions(uint64_t node_id, const PermissionMap& permissions,
                                          bool recursive);

    /**
     * Hand every node owned by handle to its parent's owner
     * @return Number of nodes reassigned
     */
    dbfs_common::Result<size_t> ExpungeUserOwnership(const std::string& handle);

    // Every child, unfiltered; writable is left false for the caller to fill.
    dbfs_common::Result<std::vector<DirectoryEntry>> ListDirectory(uint64_t node_id) const;

    dbfs_common::Result<std::string> GetContent(uint64_t node_id);

    // Commits stream as a new object, repoints the file, releases the old one.
    dbfs_common::Status ReplaceContent(uint64_t node_id, dbfs_content::FileStream& stream);

private:
    RecordStore& records_;
    dbfs_content::ContentStore& content_;
    std::string system_owner_;

    std::unordered_map<uint64_t, Node> nodes_;
    uint64_t next_node_id_ = ROOT_NODE_ID + 1;

    uint64_t AllocateNodeId() { return next_node_id_++; }

    dbfs_common::Status CommitBatch(const std::vector<Node>& puts,
                                    const std::vector<uint64_t>& deletes);
    void ApplyBatch(const std::vector<Node>& puts, const std::vector<uint64_t>& deletes);

    // Parent exists and is a directory, name is valid and free.
    dbfs_common::Status ValidateNewChild(uint64_t parent_id, const std::string& name) const;
    dbfs_common::Result<std::string> UniqueChildName(uint64_t parent_id,
                                                     const std::string& name) const;
    PermissionMap InheritPermissions(const Node& parent, const std::string& owner) const;
    Node MakeRoot() const;
    void ReleaseContent(uint64_t content_id);
};

}  // namespace dbfs_master
