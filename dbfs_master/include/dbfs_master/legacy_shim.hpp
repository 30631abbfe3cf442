#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dbfs_common/user.hpp"
#include "dbfs_content/file_stream.hpp"
#include "dbfs_master/facade.hpp"

namespace dbfs_master {
namespace legacy {

// Boolean-collapsed wrappers over FilesystemFacade for callers written
// against the old contract: any failure (denied, missing, collision, I/O)
// reads as false, an empty optional, an empty list or the Empty() stream.
// Failures are still logged to stderr with their typed status.

std::optional<Node> CreateFile(FilesystemFacade& facade, const std::string& parent,
                               const std::string& name, dbfs_content::FileStream& stream,
                               const dbfs_common::User* user = nullptr);
std::optional<Node> CreateDirectory(FilesystemFacade& facade, const std::string& parent,
                                    const std::string& name,
                                    const dbfs_common::User* user = nullptr);

bool Copy(FilesystemFacade& facade, const std::string& source, const std::string& target_parent,
          const dbfs_common::User* user = nullptr);
bool Move(FilesystemFacade& facade, const std::string& source, const std::string& target_parent,
          const dbfs_common::User* user = nullptr);
bool Remove(FilesystemFacade& facade, const std::string& path,
            const dbfs_common::User* user = nullptr);
bool Rename(FilesystemFacade& facade, const std::string& path, const std::string& name,
            const dbfs_common::User* user = nullptr);
bool ChangeOwnership(FilesystemFacade& facade, const std::string& path,
                     const std::string& owner, const dbfs_common::User* user = nullptr);
bool ChangePermissions(FilesystemFacade& facade, const std::string& path,
                       const PermissionMap& permissions, bool recursive = false,
                       const dbfs_common::User* user = nullptr);
bool ExpungeUserOwnership(FilesystemFacade& facade, const std::string& handle);

std::vector<DirectoryEntry> ListDirectory(FilesystemFacade& facade, const std::string& path,
                                          const dbfs_common::User* user = nullptr);

// FileStream::Empty() when the file cannot be read for any reason.
std::shared_ptr<const dbfs_content::FileStream> GetContent(
    FilesystemFacade& facade, const std::string& path, const dbfs_common::User* user = nullptr);

}  // namespace legacy
}  // namespace dbfs_master
