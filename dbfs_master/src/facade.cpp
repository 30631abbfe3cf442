#include "dbfs_master/facade.hpp"
#include <optional>
#include "dbfs_master/path.hpp"

using dbfs_common::Result;
using dbfs_common::Status;
using dbfs_common::User;
using dbfs_content::FileStream;
using dbfs_content::StreamMode;

namespace dbfs_master {

FilesystemFacade::FilesystemFacade(std::shared_ptr<FsContext> context)
    : context_(std::move(context)) {}

Result<uint64_t> FilesystemFacade::ResolveFor(const std::string& path, const User* user) const {
    Filesystem& tree = context_->Tree();
    bool fully_resolved = false;
    Result<uint64_t> deepest = tree.ResolveDeepest(path, fully_resolved);
    if (!deepest.ok()) {
        return deepest.status();
    }
    if (fully_resolved) {
        return deepest.value();
    }
    // Hidden directories must not reveal what they hold
    if (!context_->Permissions().Readable(deepest.value(), user)) {
        return Deny("resolve", path, user);
    }
    return Status::NotFound("no such path: " + path);
}

Status FilesystemFacade::Deny(const std::string& action, const std::string& path,
                              const User* user) const {
    std::string who = user ? user->handle : "system";
    return Status::PermissionDenied(who + " may not " + action + " " + path);
}

std::string FilesystemFacade::GetFileName(const std::string& path) {
    return dbfs_master::GetFileName(path);
}

// ============================================================================
// Streams
// ============================================================================

Result<std::shared_ptr<FileStream>> FilesystemFacade::CreateFileHandle(
    StreamMode mode, uint64_t estimated_length, uint64_t object_id,
    const std::string& initial_data) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    return context_->Content().Open(mode, estimated_length, object_id, initial_data);
}

Result<std::shared_ptr<FileStream>> FilesystemFacade::OpenContentStream(const std::string& path,
                                                                        const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().Readable(id.value(), user)) {
        return Deny("read", path, user);
    }
    const Node* node = context_->Tree().FindNode(id.value());
    if (node->is_directory) {
        return Status::Invalid(path + " is a directory");
    }
    return context_->Content().Open(StreamMode::kRead, node->size, node->content_id);
}

// ============================================================================
// Creation
// ============================================================================

Result<Node> FilesystemFacade::CreateFile(const std::string& parent, const std::string& name,
                                          FileStream& stream, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> parent_id = ResolveFor(parent, user);
    if (!parent_id.ok()) {
        return parent_id.status();
    }
    if (!context_->Permissions().Writable(parent_id.value(), user)) {
        return Deny("create files in", parent, user);
    }

    Filesystem& tree = context_->Tree();
    std::string owner = user ? user->handle : tree.SystemOwner();
    Result<uint64_t> created = tree.CreateFile(parent_id.value(), name, owner, stream);
    if (!created.ok()) {
        return created.status();
    }
    return *tree.FindNode(created.value());
}

Result<Node> FilesystemFacade::CreateDirectory(const std::string& parent,
                                               const std::string& name, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> parent_id = ResolveFor(parent, user);
    if (!parent_id.ok()) {
        return parent_id.status();
    }
    if (!context_->Permissions().Writable(parent_id.value(), user)) {
        return Deny("create directories in", parent, user);
    }

    Filesystem& tree = context_->Tree();
    std::string owner = user ? user->handle : tree.SystemOwner();
    Result<uint64_t> created = tree.CreateDirectory(parent_id.value(), name, owner);
    if (!created.ok()) {
        return created.status();
    }
    return *tree.FindNode(created.value());
}

// ============================================================================
// Structural operations
// ============================================================================

Status FilesystemFacade::Copy(const std::string& source, const std::string& target_parent,
                              const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> source_id = ResolveFor(source, user);
    if (!source_id.ok()) {
        return source_id.status();
    }
    Result<uint64_t> target_id = ResolveFor(target_parent, user);
    if (!target_id.ok()) {
        return target_id.status();
    }

    PermissionEngine& permissions = context_->Permissions();
    if (!permissions.Readable(source_id.value(), user)) {
        return Deny("read", source, user);
    }
    if (!permissions.Writable(target_id.value(), user)) {
        return Deny("copy into", target_parent, user);
    }

    std::optional<std::string> new_owner;
    if (user) {
        new_owner = user->handle;
    }
    Result<uint64_t> copied =
        context_->Tree().CopyWithHandle(source_id.value(), target_id.value(), new_owner);
    return copied.status();
}

Status FilesystemFacade::Move(const std::string& source, const std::string& target_parent,
                              const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> source_id = ResolveFor(source, user);
    if (!source_id.ok()) {
        return source_id.status();
    }
    Result<uint64_t> target_id = ResolveFor(target_parent, user);
    if (!target_id.ok()) {
        return target_id.status();
    }

    PermissionEngine& permissions = context_->Permissions();
    if (!permissions.Readable(source_id.value(), user)) {
        return Deny("read", source, user);
    }
    if (!permissions.WritableSelf(source_id.value(), user) ||
        !permissions.WritableAll(source_id.value(), user)) {
        return Deny("move", source, user);
    }
    if (!permissions.Writable(target_id.value(), user)) {
        return Deny("move into", target_parent, user);
    }

    std::optional<std::string> new_owner;
    if (user) {
        new_owner = user->handle;
    }
    return context_->Tree().MoveWithHandle(source_id.value(), target_id.value(), new_owner);
}

Status FilesystemFacade::Remove(const std::string& path, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }

    PermissionEngine& permissions = context_->Permissions();
    if (!permissions.Readable(id.value(), user)) {
        return Deny("read", path, user);
    }
    if (!permissions.WritableSelf(id.value(), user) ||
        !permissions.WritableAll(id.value(), user)) {
        return Deny("remove", path, user);
    }
    return context_->Tree().Remove(id.value());
}

Status FilesystemFacade::Rename(const std::string& path, const std::string& name,
                                const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().ReadWritable(id.value(), user)) {
        return Deny("rename", path, user);
    }
    return context_->Tree().Rename(id.value(), name);
}

Status FilesystemFacade::ChangeOwnership(const std::string& path, const std::string& owner,
                                         const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().ReadWritableAll(id.value(), user)) {
        return Deny("change ownership of", path, user);
    }
    return context_->Tree().ChangeOwnership(id.value(), owner);
}

Status FilesystemFacade::ChangePermissions(const std::string& path,
                                           const PermissionMap& permissions, bool recursive,
                                           const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().ReadWritableAll(id.value(), user)) {
        return Deny("change permissions of", path, user);
    }
    return context_->Tree().ChangePermissions(id.value(), permissions, recursive);
}

Result<size_t> FilesystemFacade::ExpungeUserOwnership(const std::string& handle) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    return context_->Tree().ExpungeUserOwnership(handle);
}

// ============================================================================
// Reads
// ============================================================================

Result<std::vector<DirectoryEntry>> FilesystemFacade::ListDirectory(const std::string& path,
                                                                    const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }

    Result<std::vector<DirectoryEntry>> listed = context_->Tree().ListDirectory(id.value());
    if (!listed.ok()) {
        return listed.status();
    }

    PermissionEngine& permissions = context_->Permissions();
    std::vector<DirectoryEntry> visible;
    if (!permissions.Readable(id.value(), user)) {
        return visible;
    }
    for (auto& entry : listed.value()) {
        if (!permissions.Readable(entry.id, user)) {
            continue;
        }
        entry.writable = permissions.WritableSelf(entry.id, user);
        visible.push_back(std::move(entry));
    }
    return visible;
}

Result<std::string> FilesystemFacade::GetContent(const std::string& path, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().Readable(id.value(), user)) {
        return Deny("read", path, user);
    }
    return context_->Tree().GetContent(id.value());
}

Status FilesystemFacade::ReplaceContent(const std::string& path, FileStream& stream,
                                        const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().ReadWritable(id.value(), user)) {
        return Deny("write", path, user);
    }
    return context_->Tree().ReplaceContent(id.value(), stream);
}

Result<Node> FilesystemFacade::Stat(const std::string& path, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = ResolveFor(path, user);
    if (!id.ok()) {
        return id.status();
    }
    if (!context_->Permissions().Readable(id.value(), user)) {
        return Deny("stat", path, user);
    }
    return *context_->Tree().FindNode(id.value());
}

// ============================================================================
// Probes
// ============================================================================

bool FilesystemFacade::Readable(const std::string& path, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = context_->Tree().Resolve(path);
    return id.ok() && context_->Permissions().Readable(id.value(), user);
}

bool FilesystemFacade::Writable(const std::string& path, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = context_->Tree().Resolve(path);
    return id.ok() && context_->Permissions().Writable(id.value(), user);
}

bool FilesystemFacade::WritableSelf(const std::string& path, const User* user) {
    std::lock_guard<std::mutex> lock(context_->Mutex());
    Result<uint64_t> id = context_->Tree().Resolve(path);
    return id.ok() && context_->Permissions().WritableSelf(id.value(), user);
}

}  // namespace dbfs_master
