#pragma once
#include <memory>
#include <string>
#include "dbfs_common/status.hpp"
#include "dbfs_master/facade.hpp"
#include "dbfs_service/dbfs.grpc.pb.h"

namespace dbfs_master {

// PermissionDenied -> PERMISSION_DENIED, NotFound -> NOT_FOUND,
// Conflict -> ALREADY_EXISTS, Invalid -> INVALID_ARGUMENT, IoError -> INTERNAL
grpc::Status ToGrpcStatus(const dbfs_common::Status& status);

/**
 * DbfsServiceImpl: gRPC front end over FilesystemFacade
 *
 * Every request names its caller in user_handle; an empty handle is
 * rejected, so the network never acts as the system user. Expunge and
 * admin-scoped permission changes need the configured admin token.
 */
class DbfsServiceImpl final : public dbfs_service::DbfsService::Service {
public:
    DbfsServiceImpl(std::shared_ptr<FilesystemFacade> facade, std::string admin_token);

    grpc::Status CreateDirectory(grpc::ServerContext*, const dbfs_service::CreateDirectoryRequest*,
                                 dbfs_service::NodeResponse*) override;
    grpc::Status CreateFile(grpc::ServerContext*, const dbfs_service::CreateFileRequest*,
                            dbfs_service::NodeResponse*) override;
    grpc::Status ReplaceContent(grpc::ServerContext*, const dbfs_service::ReplaceContentRequest*,
                                dbfs_service::NodeResponse*) override;
    grpc::Status Copy(grpc::ServerContext*, const dbfs_service::CopyRequest*,
                      dbfs_service::StatusResponse*) override;
    grpc::Status Move(grpc::ServerContext*, const dbfs_service::MoveRequest*,
                      dbfs_service::StatusResponse*) override;
    grpc::Status Remove(grpc::ServerContext*, const dbfs_service::RemoveRequest*,
                        dbfs_service::StatusResponse*) override;
    grpc::Status Rename(grpc::ServerContext*, const dbfs_service::RenameRequest*,
                        dbfs_service::StatusResponse*) override;
    grpc::Status ChangeOwnership(grpc::ServerContext*,
                                 const dbfs_service::ChangeOwnershipRequest*,
                                 dbfs_service::StatusResponse*) override;
    grpc::Status ChangePermissions(grpc::ServerContext*,
                                   const dbfs_service::ChangePermissionsRequest*,
                                   dbfs_service::StatusResponse*) override;
    grpc::Status ExpungeUserOwnership(grpc::ServerContext*,
                                      const dbfs_service::ExpungeUserOwnershipRequest*,
                                      dbfs_service::ExpungeUserOwnershipResponse*) override;
    grpc::Status ListDirectory(grpc::ServerContext*, const dbfs_service::ListDirectoryRequest*,
                               dbfs_service::ListDirectoryResponse*) override;
    grpc::Status GetContent(grpc::ServerContext*, const dbfs_service::GetContentRequest*,
                            dbfs_service::GetContentResponse*) override;
    grpc::Status Stat(grpc::ServerContext*, const dbfs_service::StatRequest*,
                      dbfs_service::NodeResponse*) override;
    grpc::Status Probe(grpc::ServerContext*, const dbfs_service::ProbeRequest*,
                       dbfs_service::ProbeResponse*) override;

private:
    std::shared_ptr<FilesystemFacade> facade_;
    std::string admin_token_;

    bool AdminTokenMatches(const std::string& token) const;
};

}  // namespace dbfs_master
