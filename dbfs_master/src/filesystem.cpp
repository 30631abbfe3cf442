#include "dbfs_master/filesystem.hpp"
#include <algorithm>
#include <iostream>
#include "dbfs_master/path.hpp"

using dbfs_common::Result;
using dbfs_common::Status;

namespace dbfs_master {

Filesystem::Filesystem(RecordStore& records, dbfs_content::ContentStore& content,
                       std::string system_owner)
    : records_(records), content_(content), system_owner_(std::move(system_owner)) {}

// ============================================================================
// Loading
// ============================================================================

Node Filesystem::MakeRoot() const {
    Node root(ROOT_NODE_ID, true);
    root.parent_id = NO_PARENT;
    root.owner = system_owner_;
    root.upload_time = CurrentUploadTime();
    return root;
}

Status Filesystem::Load() {
    nodes_.clear();
    next_node_id_ = std::max(ROOT_NODE_ID + 1, records_.HighestId() + 1);

    for (const auto& record : records_.LoadAll()) {
        Node node = FromRecord(record);
        next_node_id_ = std::max(next_node_id_, node.id + 1);
        nodes_[node.id] = std::move(node);
    }

    std::vector<Node> puts;
    std::vector<uint64_t> deletes;

    auto root_it = nodes_.find(ROOT_NODE_ID);
    if (root_it == nodes_.end()) {
        Node root = MakeRoot();
        nodes_[root.id] = root;
        puts.push_back(root);
    } else if (root_it->second.parent_id != NO_PARENT || !root_it->second.is_directory ||
               !root_it->second.name.empty()) {
        Node& root = root_it->second;
        root.parent_id = NO_PARENT;
        root.is_directory = true;
        root.name.clear();
        root.content_id = NO_CONTENT;
        root.size = 0;
        puts.push_back(root);
    }

    // Link in id order so the older of two same-named siblings wins
    std::vector<uint64_t> ids;
    ids.reserve(nodes_.size());
    for (const auto& pair : nodes_) {
        ids.push_back(pair.first);
    }
    std::sort(ids.begin(), ids.end());
    for (uint64_t id : ids) {
        if (id == ROOT_NODE_ID) {
            continue;
        }
        const Node& node = nodes_.at(id);
        auto parent = nodes_.find(node.parent_id);
        if (parent == nodes_.end() || parent->first == id || !parent->second.is_directory) {
            continue;
        }
        parent->second.children.emplace(node.name, id);
    }

    std::vector<uint64_t> reachable_ids = CollectSubtree(ROOT_NODE_ID);
    std::unordered_set<uint64_t> reachable(reachable_ids.begin(), reachable_ids.end());
    for (uint64_t id : ids) {
        if (reachable.count(id) == 0) {
            deletes.push_back(id);
        }
    }
    for (uint64_t id : deletes) {
        nodes_.erase(id);
    }

    if (!puts.empty() || !deletes.empty()) {
        dbfs_service::RecordBatch batch;
        for (const Node& node : puts) {
            *batch.add_puts() = ToRecord(node);
        }
        for (uint64_t id : deletes) {
            batch.add_deletes(id);
        }
        if (!records_.Commit(batch)) {
            return Status::IoError("failed to commit repaired node table");
        }
    }

    for (const auto& pair : nodes_) {
        const Node& node = pair.second;
        if (!node.is_directory && !content_.Exists(node.content_id)) {
            std::cerr << "Filesystem: " << PathOf(node.id) << " references missing content "
                      << node.content_id << std::endl;
        }
    }

    std::cout << "Filesystem: Loaded " << nodes_.size() << " nodes from "
              << records_.Name() << " record store";
    if (!deletes.empty()) {
        std::cout << " (dropped " << deletes.size() << " unreachable)";
    }
    std::cout << std::endl;
    return Status::OK();
}

// ============================================================================
// Lookup
// ============================================================================

const Node* Filesystem::FindNode(uint64_t id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return nullptr;
    }
    return &it->second;
}

Result<uint64_t> Filesystem::Resolve(const std::string& path) const {
    bool fully_resolved = false;
    Result<uint64_t> deepest = ResolveDeepest(path, fully_resolved);
    if (!deepest.ok()) {
        return deepest.status();
    }
    if (!fully_resolved) {
        return Status::NotFound("no such path: " + path);
    }
    return deepest.value();
}

Result<uint64_t> Filesystem::ResolveDeepest(const std::string& path,
                                            bool& fully_resolved) const {
    fully_resolved = false;
    Result<std::vector<std::string>> components = SplitPath(path);
    if (!components.ok()) {
        return components.status();
    }

    uint64_t current = ROOT_NODE_ID;
    for (const auto& component : components.value()) {
        const Node& node = nodes_.at(current);
        auto child = node.children.find(component);
        if (child == node.children.end()) {
            return current;
        }
        current = child->second;
    }
    fully_resolved = true;
    return current;
}

std::vector<uint64_t> Filesystem::CollectSubtree(uint64_t id) const {
    std::vector<uint64_t> result;
    if (nodes_.count(id) == 0) {
        return result;
    }

    std::vector<uint64_t> stack{id};
    while (!stack.empty()) {
        uint64_t current = stack.back();
        stack.pop_back();
        result.push_back(current);

        const Node& node = nodes_.at(current);
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back(it->second);
        }
    }
    return result;
}

bool Filesystem::IsAncestor(uint64_t ancestor_id, uint64_t node_id) const {
    uint64_t current = node_id;
    // Bounded walk; a corrupt parent chain must not loop forever
    for (size_t steps = 0; steps <= nodes_.size(); ++steps) {
        if (current == ancestor_id) {
            return true;
        }
        auto it = nodes_.find(current);
        if (it == nodes_.end() || it->second.parent_id == NO_PARENT) {
            return false;
        }
        current = it->second.parent_id;
    }
    return false;
}

std::string Filesystem::PathOf(uint64_t id) const {
    std::vector<const std::string*> names;
    uint64_t current = id;
    for (size_t steps = 0; steps <= nodes_.size(); ++steps) {
        auto it = nodes_.find(current);
        if (it == nodes_.end() || it->second.parent_id == NO_PARENT) {
            break;
        }
        names.push_back(&it->second.name);
        current = it->second.parent_id;
    }
    if (names.empty()) {
        return "/";
    }

    std::string path;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        path += "/" + **it;
    }
    return path;
}

std::unordered_set<uint64_t> Filesystem::LiveContentIds() const {
    std::unordered_set<uint64_t> live;
    for (const auto& pair : nodes_) {
        if (!pair.second.is_directory && pair.second.content_id != NO_CONTENT) {
            live.insert(pair.second.content_id);
        }
    }
    return live;
}

Status Filesystem::CheckIntegrity() const {
    const Node* root = FindNode(ROOT_NODE_ID);
    if (!root || root->parent_id != NO_PARENT || !root->is_directory) {
        return Status::Invalid("root missing or malformed");
    }

    for (const auto& pair : nodes_) {
        const Node& node = pair.second;
        if (node.id != pair.first) {
            return Status::Invalid("node keyed under wrong id " + std::to_string(pair.first));
        }

        if (node.id != ROOT_NODE_ID) {
            const Node* parent = FindNode(node.parent_id);
            if (!parent || !parent->is_directory) {
                return Status::Invalid("node " + std::to_string(node.id) +
                                       " has no directory parent");
            }
            auto link = parent->children.find(node.name);
            if (link == parent->children.end() || link->second != node.id) {
                return Status::Invalid("node " + std::to_string(node.id) +
                                       " is not linked under its parent");
            }
            if (!IsAncestor(ROOT_NODE_ID, node.id)) {
                return Status::Invalid("node " + std::to_string(node.id) +
                                       " does not reach the root");
            }
        }

        for (const auto& child : node.children) {
            const Node* linked = FindNode(child.second);
            if (!linked || linked->parent_id != node.id || linked->name != child.first) {
                return Status::Invalid("stale child link '" + child.first + "' under node " +
                                       std::to_string(node.id));
            }
        }

        if (node.is_directory && node.content_id != NO_CONTENT) {
            return Status::Invalid("directory " + std::to_string(node.id) + " has content");
        }
        if (!node.is_directory &&
            (node.content_id == NO_CONTENT || !content_.Exists(node.content_id))) {
            return Status::Invalid("file " + std::to_string(node.id) + " has no content");
        }
    }
    return Status::OK();
}

// ============================================================================
// Batch plumbing
// ============================================================================

Status Filesystem::CommitBatch(const std::vector<Node>& puts,
                               const std::vector<uint64_t>& deletes) {
    dbfs_service::RecordBatch batch;
    for (const Node& node : puts) {
        *batch.add_puts() = ToRecord(node);
    }
    for (uint64_t id : deletes) {
        batch.add_deletes(id);
    }

    if (!records_.Commit(batch)) {
        std::cerr << "Filesystem: Record store rejected batch (" << puts.size() << " puts, "
                  << deletes.size() << " deletes)" << std::endl;
        return Status::IoError("record store commit failed");
    }

    ApplyBatch(puts, deletes);
    return Status::OK();
}

void Filesystem::ApplyBatch(const std::vector<Node>& puts,
                            const std::vector<uint64_t>& deletes) {
    for (uint64_t id : deletes) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            continue;
        }
        auto parent = nodes_.find(it->second.parent_id);
        if (parent != nodes_.end()) {
            auto link = parent->second.children.find(it->second.name);
            if (link != parent->second.children.end() && link->second == id) {
                parent->second.children.erase(link);
            }
        }
        nodes_.erase(it);
    }

    for (const Node& node : puts) {
        Node updated = node;
        auto existing = nodes_.find(node.id);
        if (existing != nodes_.end()) {
            const Node& old = existing->second;
            if (old.parent_id != node.parent_id || old.name != node.name) {
                auto old_parent = nodes_.find(old.parent_id);
                if (old_parent != nodes_.end()) {
                    auto link = old_parent->second.children.find(old.name);
                    if (link != old_parent->second.children.end() && link->second == node.id) {
                        old_parent->second.children.erase(link);
                    }
                }
            }
            updated.children = old.children;
        }
        nodes_[node.id] = std::move(updated);

        if (node.parent_id != NO_PARENT) {
            auto parent = nodes_.find(node.parent_id);
            if (parent != nodes_.end()) {
                parent->second.children[node.name] = node.id;
            }
        }
    }
}

Status Filesystem::ValidateNewChild(uint64_t parent_id, const std::string& name) const {
    const Node* parent = FindNode(parent_id);
    if (!parent) {
        return Status::NotFound("parent node " + std::to_string(parent_id) + " not found");
    }
    if (!parent->is_directory) {
        return Status::Invalid(PathOf(parent_id) + " is not a directory");
    }
    Status valid = ValidateName(name);
    if (!valid.ok()) {
        return valid;
    }
    if (parent->children.count(name) > 0) {
        return Status::Conflict(JoinPath(PathOf(parent_id), name) + " already exists");
    }
    return Status::OK();
}

Result<std::string> Filesystem::UniqueChildName(uint64_t parent_id,
                                                const std::string& name) const {
    Status valid = ValidateName(name);
    if (!valid.ok()) {
        return valid;
    }
    const Node& parent = nodes_.at(parent_id);
    if (parent.children.count(name) == 0) {
        return name;
    }
    for (int n = 1;; ++n) {
        std::string candidate = NumberedName(name, n);
        if (candidate.size() > MAX_NAME_LENGTH) {
            return Status::Conflict("no free name for '" + name + "' in " + PathOf(parent_id));
        }
        if (parent.children.count(candidate) == 0) {
            return candidate;
        }
    }
}

PermissionMap Filesystem::InheritPermissions(const Node& parent, const std::string& owner) const {
    PermissionMap inherited;
    for (const auto& [handle, perm] : parent.permissions) {
        // Write only carries over where the parent propagates it
        inherited[handle] = Permission(perm.read, perm.write && perm.propagate, perm.propagate);
    }
    inherited[owner] = Permission(true, true, true);
    return inherited;
}

void Filesystem::ReleaseContent(uint64_t content_id) {
    if (content_id == NO_CONTENT) {
        return;
    }
    Status released = content_.Release(content_id);
    if (!released.ok()) {
        std::cerr << "Filesystem: Failed to release content " << content_id << ": "
                  << released.ToString() << std::endl;
    }
}

// ============================================================================
// Creation
// ============================================================================

Result<uint64_t> Filesystem::CreateDirectory(uint64_t parent_id, const std::string& name,
                                             const std::string& owner) {
    Status valid = ValidateNewChild(parent_id, name);
    if (!valid.ok()) {
        return valid;
    }
    if (owner.empty()) {
        return Status::Invalid("owner handle is empty");
    }

    Node node(AllocateNodeId(), true);
    node.name = name;
    node.parent_id = parent_id;
    node.owner = owner;
    node.upload_time = CurrentUploadTime();
    node.permissions = InheritPermissions(nodes_.at(parent_id), owner);

    Status committed = CommitBatch({node}, {});
    if (!committed.ok()) {
        return committed;
    }
    std::cout << "Filesystem: Created directory " << PathOf(node.id) << " (node " << node.id
              << ")" << std::endl;
    return node.id;
}

Result<uint64_t> Filesystem::CreateFile(uint64_t parent_id, const std::string& name,
                                        const std::string& owner,
                                        dbfs_content::FileStream& stream) {
    Status valid = ValidateNewChild(parent_id, name);
    if (!valid.ok()) {
        return valid;
    }
    if (owner.empty()) {
        return Status::Invalid("owner handle is empty");
    }

    Result<uint64_t> content_id = content_.Commit(stream);
    if (!content_id.ok()) {
        return content_id.status();
    }

    Node node(AllocateNodeId(), false);
    node.name = name;
    node.parent_id = parent_id;
    node.owner = owner;
    node.content_id = content_id.value();
    node.size = content_.SizeOf(content_id.value());
    node.upload_time = CurrentUploadTime();
    node.permissions = InheritPermissions(nodes_.at(parent_id), owner);

    Status committed = CommitBatch({node}, {});
    if (!committed.ok()) {
        ReleaseContent(node.content_id);
        return committed;
    }
    std::cout << "Filesystem: Created file " << PathOf(node.id) << " (" << node.size
              << " bytes, content " << node.content_id << ")" << std::endl;
    return node.id;
}

// ============================================================================
// Structural operations
// ============================================================================

Result<uint64_t> Filesystem::CopyWithHandle(uint64_t source_id, uint64_t target_parent_id,
                                            const std::optional<std::string>& new_owner) {
    const Node* source = FindNode(source_id);
    if (!source) {
        return Status::NotFound("source node " + std::to_string(source_id) + " not found");
    }
    const Node* target = FindNode(target_parent_id);
    if (!target) {
        return Status::NotFound("target node " + std::to_string(target_parent_id) +
                                " not found");
    }
    if (!target->is_directory) {
        return Status::Invalid(PathOf(target_parent_id) + " is not a directory");
    }
    if (IsAncestor(source_id, target_parent_id)) {
        return Status::Conflict("cannot copy " + PathOf(source_id) + " into itself");
    }
    if (new_owner && new_owner->empty()) {
        return Status::Invalid("owner handle is empty");
    }

    Result<std::string> name = UniqueChildName(target_parent_id, source->name);
    if (!name.ok()) {
        return name.status();
    }

    std::vector<uint64_t> subtree = CollectSubtree(source_id);
    std::unordered_map<uint64_t, uint64_t> remap;
    std::vector<Node> puts;
    std::vector<uint64_t> duplicated;
    double now = CurrentUploadTime();

    for (uint64_t id : subtree) {
        const Node& original = nodes_.at(id);
        Node copy = original;
        copy.children.clear();
        copy.id = AllocateNodeId();
        remap[id] = copy.id;

        if (id == source_id) {
            copy.name = name.value();
            copy.parent_id = target_parent_id;
        } else {
            copy.parent_id = remap.at(original.parent_id);
        }
        if (new_owner) {
            copy.owner = *new_owner;
        }
        copy.upload_time = now;

        if (!copy.is_directory) {
            Result<uint64_t> dup = content_.Duplicate(original.content_id);
            if (!dup.ok()) {
                for (uint64_t content_id : duplicated) {
                    ReleaseContent(content_id);
                }
                return dup.status();
            }
            copy.content_id = dup.value();
            duplicated.push_back(copy.content_id);
        }
        puts.push_back(std::move(copy));
    }

    Status committed = CommitBatch(puts, {});
    if (!committed.ok()) {
        for (uint64_t content_id : duplicated) {
            ReleaseContent(content_id);
        }
        return committed;
    }

    uint64_t copy_id = remap.at(source_id);
    std::cout << "Filesystem: Copied " << PathOf(source_id) << " to " << PathOf(copy_id)
              << " (" << puts.size() << " nodes)" << std::endl;
    return copy_id;
}

Status Filesystem::MoveWithHandle(uint64_t source_id, uint64_t target_parent_id,
                                  const std::optional<std::string>& new_owner) {
    const Node* source = FindNode(source_id);
    if (!source) {
        return Status::NotFound("source node " + std::to_string(source_id) + " not found");
    }
    if (source_id == ROOT_NODE_ID) {
        return Status::Invalid("cannot move the root");
    }
    const Node* target = FindNode(target_parent_id);
    if (!target) {
        return Status::NotFound("target node " + std::to_string(target_parent_id) +
                                " not found");
    }
    if (!target->is_directory) {
        return Status::Invalid(PathOf(target_parent_id) + " is not a directory");
    }
    if (IsAncestor(source_id, target_parent_id)) {
        return Status::Conflict("cannot move " + PathOf(source_id) + " into itself");
    }
    if (source->parent_id == target_parent_id) {
        return Status::Invalid(PathOf(source_id) + " is already in " +
                               PathOf(target_parent_id));
    }
    if (target->children.count(source->name) > 0) {
        return Status::Conflict(JoinPath(PathOf(target_parent_id), source->name) +
                                " already exists");
    }
    if (new_owner && new_owner->empty()) {
        return Status::Invalid("owner handle is empty");
    }

    std::string old_path = PathOf(source_id);
    Node moved = *source;
    moved.parent_id = target_parent_id;
    if (new_owner) {
        moved.owner = *new_owner;
    }

    // Relink and reown land in the same batch
    std::vector<Node> puts;
    puts.push_back(std::move(moved));
    if (new_owner) {
        for (uint64_t id : CollectSubtree(source_id)) {
            const Node& node = nodes_.at(id);
            if (id != source_id && node.owner != *new_owner) {
                Node updated = node;
                updated.owner = *new_owner;
                puts.push_back(std::move(updated));
            }
        }
    }

    Status committed = CommitBatch(puts, {});
    if (committed.ok()) {
        std::cout << "Filesystem: Moved " << old_path << " to " << PathOf(source_id)
                  << std::endl;
    }
    return committed;
}

Status Filesystem::Remove(uint64_t node_id) {
    if (!FindNode(node_id)) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    if (node_id == ROOT_NODE_ID) {
        return Status::Invalid("cannot remove the root");
    }

    std::string path = PathOf(node_id);
    std::vector<uint64_t> subtree = CollectSubtree(node_id);
    std::vector<uint64_t> released;
    for (uint64_t id : subtree) {
        const Node& node = nodes_.at(id);
        if (!node.is_directory) {
            released.push_back(node.content_id);
        }
    }
    // Children before parents
    std::vector<uint64_t> deletes(subtree.rbegin(), subtree.rend());

    Status committed = CommitBatch({}, deletes);
    if (!committed.ok()) {
        return committed;
    }
    for (uint64_t content_id : released) {
        ReleaseContent(content_id);
    }
    std::cout << "Filesystem: Removed " << path << " (" << deletes.size() << " nodes)"
              << std::endl;
    return Status::OK();
}

Status Filesystem::Rename(uint64_t node_id, const std::string& new_name) {
    const Node* node = FindNode(node_id);
    if (!node) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    if (node_id == ROOT_NODE_ID) {
        return Status::Invalid("cannot rename the root");
    }
    Status valid = ValidateName(new_name);
    if (!valid.ok()) {
        return valid;
    }
    if (node->name == new_name) {
        return Status::OK();
    }
    const Node& parent = nodes_.at(node->parent_id);
    if (parent.children.count(new_name) > 0) {
        return Status::Conflict(JoinPath(PathOf(parent.id), new_name) + " already exists");
    }

    Node renamed = *node;
    renamed.name = new_name;
    return CommitBatch({renamed}, {});
}

Status Filesystem::ChangeOwnership(uint64_t node_id, const std::string& new_owner) {
    if (!FindNode(node_id)) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    if (new_owner.empty()) {
        return Status::Invalid("owner handle is empty");
    }

    std::vector<Node> puts;
    for (uint64_t id : CollectSubtree(node_id)) {
        const Node& node = nodes_.at(id);
        if (node.owner != new_owner) {
            Node updated = node;
            updated.owner = new_owner;
            puts.push_back(std::move(updated));
        }
    }
    if (puts.empty()) {
        return Status::OK();
    }
    return CommitBatch(puts, {});
}

Status Filesystem::ChangePermissions(uint64_t node_id, const PermissionMap& permissions,
                                     bool recursive) {
    if (!FindNode(node_id)) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    for (const auto& entry : permissions) {
        if (entry.first.empty()) {
            return Status::Invalid("permission entry with empty handle");
        }
    }

    std::vector<uint64_t> targets;
    if (recursive) {
        targets = CollectSubtree(node_id);
    } else {
        targets.push_back(node_id);
    }

    std::vector<Node> puts;
    for (uint64_t id : targets) {
        const Node& node = nodes_.at(id);
        Node updated = node;
        for (const auto& [handle, perm] : permissions) {
            if (perm.IsEmpty()) {
                updated.permissions.erase(handle);
            } else {
                updated.permissions[handle] = perm;
            }
        }
        if (updated.permissions != node.permissions) {
            puts.push_back(std::move(updated));
        }
    }
    if (puts.empty()) {
        return Status::OK();
    }
    return CommitBatch(puts, {});
}

Result<size_t> Filesystem::ExpungeUserOwnership(const std::string& handle) {
    if (handle.empty()) {
        return Status::Invalid("handle is empty");
    }
    if (handle == system_owner_) {
        return Status::Invalid("cannot expunge the system owner");
    }

    // Top-down, so a node whose parent was also owned by handle inherits
    // the parent's new owner
    std::unordered_map<uint64_t, std::string> heirs;
    std::vector<Node> puts;
    for (uint64_t id : CollectSubtree(ROOT_NODE_ID)) {
        const Node& node = nodes_.at(id);
        if (node.owner != handle) {
            continue;
        }

        std::string heir = system_owner_;
        if (id != ROOT_NODE_ID) {
            auto parent_heir = heirs.find(node.parent_id);
            heir = parent_heir != heirs.end() ? parent_heir->second
                                              : nodes_.at(node.parent_id).owner;
        }
        heirs[id] = heir;

        Node updated = node;
        updated.owner = heir;
        puts.push_back(std::move(updated));
    }

    if (!puts.empty()) {
        Status committed = CommitBatch(puts, {});
        if (!committed.ok()) {
            return committed;
        }
    }
    std::cout << "Filesystem: Expunged " << handle << " from " << puts.size() << " nodes"
              << std::endl;
    return puts.size();
}

// ============================================================================
// Reads
// ============================================================================

Result<std::vector<DirectoryEntry>> Filesystem::ListDirectory(uint64_t node_id) const {
    const Node* node = FindNode(node_id);
    if (!node) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    if (!node->is_directory) {
        return Status::Invalid(PathOf(node_id) + " is not a directory");
    }

    std::vector<DirectoryEntry> entries;
    entries.reserve(node->children.size());
    for (const auto& child : node->children) {
        const Node& entry_node = nodes_.at(child.second);
        DirectoryEntry entry;
        entry.id = entry_node.id;
        entry.name = entry_node.name;
        entry.size = entry_node.size;
        entry.is_directory = entry_node.is_directory;
        entry.owner = entry_node.owner;
        entry.upload_time = entry_node.upload_time;
        entries.push_back(std::move(entry));
    }
    return entries;
}

Result<std::string> Filesystem::GetContent(uint64_t node_id) {
    const Node* node = FindNode(node_id);
    if (!node) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    if (node->is_directory) {
        return Status::Invalid(PathOf(node_id) + " is a directory");
    }
    return content_.Read(node->content_id);
}

Status Filesystem::ReplaceContent(uint64_t node_id, dbfs_content::FileStream& stream) {
    const Node* node = FindNode(node_id);
    if (!node) {
        return Status::NotFound("node " + std::to_string(node_id) + " not found");
    }
    if (node->is_directory) {
        return Status::Invalid(PathOf(node_id) + " is a directory");
    }

    Result<uint64_t> content_id = content_.Commit(stream);
    if (!content_id.ok()) {
        return content_id.status();
    }

    uint64_t old_content = node->content_id;
    Node updated = *node;
    updated.content_id = content_id.value();
    updated.size = content_.SizeOf(content_id.value());
    updated.upload_time = CurrentUploadTime();

    Status committed = CommitBatch({updated}, {});
    if (!committed.ok()) {
        ReleaseContent(updated.content_id);
        return committed;
    }
    ReleaseContent(old_content);
    return Status::OK();
}

}  // namespace dbfs_master
