#pragma once
#include <cstdint>
#include "dbfs_common/status.hpp"
#include "dbfs_common/user.hpp"
#include "dbfs_master/filesystem.hpp"

namespace dbfs_master {

/**
 * PermissionEngine: evaluates per-user grants against the live tree
 *
 * A null user is the system caller and passes every check. A user with no
 * entry on a node is denied there. Unknown node ids are denied.
 *
 * Probes:
 * - Readable: read on the node and every ancestor up to the root
 * - WritableSelf: write on the node, propagate on its parent
 * - Writable: write and propagate on the node (may add or drop children)
 * - WritableAll: WritableSelf on the node and every descendant
 * - ReadWritable: Readable and WritableSelf
 * - ReadWritableAll: Readable, read on every descendant, WritableAll
 */
class PermissionEngine {
public:
    explicit PermissionEngine(Filesystem& fs);

    bool Readable(uint64_t node_id, const dbfs_common::User* user) const;
    bool WritableSelf(uint64_t node_id, const dbfs_common::User* user) const;
    bool Writable(uint64_t node_id, const dbfs_common::User* user) const;
    bool WritableAll(uint64_t node_id, const dbfs_common::User* user) const;
    bool ReadWritable(uint64_t node_id, const dbfs_common::User* user) const;
    bool ReadWritableAll(uint64_t node_id, const dbfs_common::User* user) const;

    /**
     * Hand the whole subtree at node_id to the acting user
     * No-op for the system caller.
     */
    dbfs_common::Status CopyReown(uint64_t node_id, const dbfs_common::User* user);

private:
    Filesystem& fs_;

    const Permission* GrantOn(uint64_t node_id, const std::string& handle) const;
};

}  // namespace dbfs_master
