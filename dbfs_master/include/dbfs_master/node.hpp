#pragma once
#include <cstdint>
#include <map>
#include <string>
#include "dbfs_service/records.pb.h"

namespace dbfs_master {

constexpr uint64_t NO_PARENT = 0;
constexpr uint64_t ROOT_NODE_ID = 1;
constexpr uint64_t NO_CONTENT = 0;

struct Permission {
    bool read = false;
    bool write = false;
    bool propagate = false;  // write grant extends to children created beneath

    Permission() = default;
    Permission(bool r, bool w, bool p) : read(r), write(w), propagate(p) {}

    bool IsEmpty() const { return !read && !write && !propagate; }
    bool operator==(const Permission& other) const {
        return read == other.read && write == other.write && propagate == other.propagate;
    }
    bool operator!=(const Permission& other) const { return !(*this == other); }
};

// Keyed by user handle
using PermissionMap = std::map<std::string, Permission>;

struct Node {
    uint64_t id;
    std::string name;
    uint64_t parent_id;
    bool is_directory;
    std::string owner;
    uint64_t content_id;
    uint64_t size;
    double upload_time;
    PermissionMap permissions;
    std::map<std::string, uint64_t> children;  // derived from parent_id, not persisted

    Node(uint64_t id = 0, bool is_dir = true);

    const Permission* PermissionFor(const std::string& handle) const;
};

dbfs_service::NodeRecord ToRecord(const Node& node);
Node FromRecord(const dbfs_service::NodeRecord& record);

// Seconds since epoch
double CurrentUploadTime();

}  // namespace dbfs_master
