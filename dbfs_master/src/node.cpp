#include "dbfs_master/node.hpp"
#include <chrono>

namespace dbfs_master {

Node::Node(uint64_t id, bool is_dir)
    : id(id),
      parent_id(NO_PARENT),
      is_directory(is_dir),
      content_id(NO_CONTENT),
      size(0),
      upload_time(0.0) {}

const Permission* Node::PermissionFor(const std::string& handle) const {
    auto it = permissions.find(handle);
    if (it == permissions.end()) {
        return nullptr;
    }
    return &it->second;
}

dbfs_service::NodeRecord ToRecord(const Node& node) {
    dbfs_service::NodeRecord record;
    record.set_id(node.id);
    record.set_name(node.name);
    record.set_parent_id(node.parent_id);
    record.set_is_directory(node.is_directory);
    record.set_owner(node.owner);
    record.set_content_id(node.content_id);
    record.set_size(node.size);
    record.set_upload_time(node.upload_time);
    for (const auto& [handle, perm] : node.permissions) {
        auto* entry = record.add_permissions();
        entry->set_handle(handle);
        entry->set_read(perm.read);
        entry->set_write(perm.write);
        entry->set_propagate(perm.propagate);
    }
    return record;
}

Node FromRecord(const dbfs_service::NodeRecord& record) {
    Node node(record.id(), record.is_directory());
    node.name = record.name();
    node.parent_id = record.parent_id();
    node.owner = record.owner();
    node.content_id = record.content_id();
    node.size = record.size();
    node.upload_time = record.upload_time();
    for (const auto& entry : record.permissions()) {
        node.permissions[entry.handle()] =
            Permission(entry.read(), entry.write(), entry.propagate());
    }
    return node;
}

double CurrentUploadTime() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

}  // namespace dbfs_master
