#include "dbfs_master/legacy_shim.hpp"
#include <iostream>

using dbfs_common::Result;
using dbfs_common::Status;
using dbfs_common::User;
using dbfs_content::FileStream;

namespace dbfs_master {
namespace legacy {

namespace {

bool Collapse(const char* operation, const Status& status) {
    if (!status.ok()) {
        std::cerr << "legacy::" << operation << ": " << status.ToString() << std::endl;
    }
    return status.ok();
}

}  // namespace

std::optional<Node> CreateFile(FilesystemFacade& facade, const std::string& parent,
                               const std::string& name, FileStream& stream, const User* user) {
    Result<Node> created = facade.CreateFile(parent, name, stream, user);
    if (!Collapse("CreateFile", created.status())) {
        return std::nullopt;
    }
    return created.value();
}

std::optional<Node> CreateDirectory(FilesystemFacade& facade, const std::string& parent,
                                    const std::string& name, const User* user) {
    Result<Node> created = facade.CreateDirectory(parent, name, user);
    if (!Collapse("CreateDirectory", created.status())) {
        return std::nullopt;
    }
    return created.value();
}

bool Copy(FilesystemFacade& facade, const std::string& source, const std::string& target_parent,
          const User* user) {
    return Collapse("Copy", facade.Copy(source, target_parent, user));
}

bool Move(FilesystemFacade& facade, const std::string& source, const std::string& target_parent,
          const User* user) {
    return Collapse("Move", facade.Move(source, target_parent, user));
}

bool Remove(FilesystemFacade& facade, const std::string& path, const User* user) {
    return Collapse("Remove", facade.Remove(path, user));
}

bool Rename(FilesystemFacade& facade, const std::string& path, const std::string& name,
            const User* user) {
    return Collapse("Rename", facade.Rename(path, name, user));
}

bool ChangeOwnership(FilesystemFacade& facade, const std::string& path,
                     const std::string& owner, const User* user) {
    return Collapse("ChangeOwnership", facade.ChangeOwnership(path, owner, user));
}

bool ChangePermissions(FilesystemFacade& facade, const std::string& path,
                       const PermissionMap& permissions, bool recursive, const User* user) {
    return Collapse("ChangePermissions",
                    facade.ChangePermissions(path, permissions, recursive, user));
}

bool ExpungeUserOwnership(FilesystemFacade& facade, const std::string& handle) {
    return Collapse("ExpungeUserOwnership", facade.ExpungeUserOwnership(handle).status());
}

std::vector<DirectoryEntry> ListDirectory(FilesystemFacade& facade, const std::string& path,
                                          const User* user) {
    Result<std::vector<DirectoryEntry>> listed = facade.ListDirectory(path, user);
    if (!Collapse("ListDirectory", listed.status())) {
        return {};
    }
    return listed.value();
}

std::shared_ptr<const FileStream> GetContent(FilesystemFacade& facade, const std::string& path,
                                             const User* user) {
    Result<std::shared_ptr<FileStream>> stream = facade.OpenContentStream(path, user);
    if (!Collapse("GetContent", stream.status())) {
        return FileStream::Empty();
    }
    return stream.value();
}

}  // namespace legacy
}  // namespace dbfs_master
