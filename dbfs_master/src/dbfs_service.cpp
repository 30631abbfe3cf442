#include "dbfs_master/dbfs_service.hpp"
#include <iostream>

using dbfs_common::Result;
using dbfs_common::Status;
using dbfs_common::StatusCode;
using dbfs_common::User;

namespace dbfs_master {

namespace {

dbfs_service::ErrorCode ErrorCodeFor(StatusCode code) {
    switch (code) {
        case StatusCode::kOk: return dbfs_service::OK;
        case StatusCode::kPermissionDenied: return dbfs_service::PERMISSION_DENIED;
        case StatusCode::kNotFound: return dbfs_service::NOT_FOUND;
        case StatusCode::kConflict: return dbfs_service::CONFLICT;
        case StatusCode::kInvalid: return dbfs_service::INVALID;
        case StatusCode::kIoError: return dbfs_service::IO_ERROR;
    }
    return dbfs_service::IO_ERROR;
}

void FillStatus(dbfs_service::StatusResponse* response, const Status& status) {
    response->set_success(status.ok());
    response->set_code(ErrorCodeFor(status.code()));
    response->set_error(status.message());
}

void FillNode(dbfs_service::NodeInfo* info, const Node& node) {
    info->set_id(node.id);
    info->set_name(node.name);
    info->set_parent_id(node.parent_id);
    info->set_is_directory(node.is_directory);
    info->set_owner(node.owner);
    info->set_size(node.size);
    info->set_upload_time(node.upload_time);
    for (const auto& [handle, perm] : node.permissions) {
        auto* entry = info->add_permissions();
        entry->set_handle(handle);
        entry->set_read(perm.read);
        entry->set_write(perm.write);
        entry->set_propagate(perm.propagate);
    }
}

grpc::Status AnonymousCaller() {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "user_handle is required");
}

// Finish a call that answers with a StatusResponse
grpc::Status Reply(dbfs_service::StatusResponse* response, const Status& status) {
    FillStatus(response, status);
    return ToGrpcStatus(status);
}

grpc::Status ReplyNode(dbfs_service::NodeResponse* response, const Result<Node>& node) {
    FillStatus(response->mutable_status(), node.status());
    if (node.ok()) {
        FillNode(response->mutable_node(), node.value());
    }
    return ToGrpcStatus(node.status());
}

}  // namespace

grpc::Status ToGrpcStatus(const Status& status) {
    switch (status.code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kPermissionDenied:
            return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, status.message());
        case StatusCode::kNotFound:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, status.message());
        case StatusCode::kConflict:
            return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, status.message());
        case StatusCode::kInvalid:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, status.message());
        case StatusCode::kIoError:
            return grpc::Status(grpc::StatusCode::INTERNAL, status.message());
    }
    return grpc::Status(grpc::StatusCode::UNKNOWN, status.message());
}

DbfsServiceImpl::DbfsServiceImpl(std::shared_ptr<FilesystemFacade> facade,
                                 std::string admin_token)
    : facade_(std::move(facade)), admin_token_(std::move(admin_token)) {
    std::cout << "DbfsServiceImpl initialized (admin RPCs "
              << (admin_token_.empty() ? "disabled" : "enabled") << ")" << std::endl;
}

bool DbfsServiceImpl::AdminTokenMatches(const std::string& token) const {
    return !admin_token_.empty() && token == admin_token_;
}

// ============================================================================
// Creation
// ============================================================================

grpc::Status DbfsServiceImpl::CreateDirectory(grpc::ServerContext* context,
                                              const dbfs_service::CreateDirectoryRequest* request,
                                              dbfs_service::NodeResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return ReplyNode(response, facade_->CreateDirectory(request->parent(), request->name(), &user));
}

grpc::Status DbfsServiceImpl::CreateFile(grpc::ServerContext* context,
                                         const dbfs_service::CreateFileRequest* request,
                                         dbfs_service::NodeResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());

    // Stage the upload before the filesystem lock is needed
    auto stream = facade_->CreateFileHandle(dbfs_content::StreamMode::kWrite,
                                            request->data().size(), 0, request->data());
    if (!stream.ok()) {
        return ReplyNode(response, stream.status());
    }
    return ReplyNode(response, facade_->CreateFile(request->parent(), request->name(),
                                                   *stream.value(), &user));
}

grpc::Status DbfsServiceImpl::ReplaceContent(grpc::ServerContext* context,
                                             const dbfs_service::ReplaceContentRequest* request,
                                             dbfs_service::NodeResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());

    auto stream = facade_->CreateFileHandle(dbfs_content::StreamMode::kWrite,
                                            request->data().size(), 0, request->data());
    if (!stream.ok()) {
        return ReplyNode(response, stream.status());
    }
    Status replaced = facade_->ReplaceContent(request->path(), *stream.value(), &user);
    if (!replaced.ok()) {
        return ReplyNode(response, replaced);
    }
    return ReplyNode(response, facade_->Stat(request->path(), &user));
}

// ============================================================================
// Structural operations
// ============================================================================

grpc::Status DbfsServiceImpl::Copy(grpc::ServerContext* context,
                                   const dbfs_service::CopyRequest* request,
                                   dbfs_service::StatusResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return Reply(response, facade_->Copy(request->source(), request->target_parent(), &user));
}

grpc::Status DbfsServiceImpl::Move(grpc::ServerContext* context,
                                   const dbfs_service::MoveRequest* request,
                                   dbfs_service::StatusResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return Reply(response, facade_->Move(request->source(), request->target_parent(), &user));
}

grpc::Status DbfsServiceImpl::Remove(grpc::ServerContext* context,
                                     const dbfs_service::RemoveRequest* request,
                                     dbfs_service::StatusResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return Reply(response, facade_->Remove(request->path(), &user));
}

grpc::Status DbfsServiceImpl::Rename(grpc::ServerContext* context,
                                     const dbfs_service::RenameRequest* request,
                                     dbfs_service::StatusResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return Reply(response, facade_->Rename(request->path(), request->name(), &user));
}

grpc::Status DbfsServiceImpl::ChangeOwnership(grpc::ServerContext* context,
                                              const dbfs_service::ChangeOwnershipRequest* request,
                                              dbfs_service::StatusResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return Reply(response, facade_->ChangeOwnership(request->path(), request->owner(), &user));
}

grpc::Status DbfsServiceImpl::ChangePermissions(
    grpc::ServerContext* context, const dbfs_service::ChangePermissionsRequest* request,
    dbfs_service::StatusResponse* response) {
    PermissionMap permissions;
    for (const auto& entry : request->permissions()) {
        permissions[entry.handle()] = Permission(entry.read(), entry.write(), entry.propagate());
    }

    // Admin-scoped: runs as the system user
    if (!request->admin_token().empty()) {
        if (!AdminTokenMatches(request->admin_token())) {
            return Reply(response, Status::PermissionDenied("admin token rejected"));
        }
        return Reply(response, facade_->ChangePermissions(request->path(), permissions,
                                                          request->recursive(), nullptr));
    }

    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return Reply(response, facade_->ChangePermissions(request->path(), permissions,
                                                      request->recursive(), &user));
}

grpc::Status DbfsServiceImpl::ExpungeUserOwnership(
    grpc::ServerContext* context, const dbfs_service::ExpungeUserOwnershipRequest* request,
    dbfs_service::ExpungeUserOwnershipResponse* response) {
    if (!AdminTokenMatches(request->admin_token())) {
        Status denied = Status::PermissionDenied("admin token rejected");
        FillStatus(response->mutable_status(), denied);
        return ToGrpcStatus(denied);
    }

    Result<size_t> expunged = facade_->ExpungeUserOwnership(request->handle());
    FillStatus(response->mutable_status(), expunged.status());
    if (expunged.ok()) {
        response->set_reassigned(expunged.value());
    }
    return ToGrpcStatus(expunged.status());
}

// ============================================================================
// Reads
// ============================================================================

grpc::Status DbfsServiceImpl::ListDirectory(grpc::ServerContext* context,
                                            const dbfs_service::ListDirectoryRequest* request,
                                            dbfs_service::ListDirectoryResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());

    auto listed = facade_->ListDirectory(request->path(), &user);
    FillStatus(response->mutable_status(), listed.status());
    if (listed.ok()) {
        for (const auto& entry : listed.value()) {
            auto* out = response->add_entries();
            out->set_name(entry.name);
            out->set_size(entry.size);
            out->set_is_directory(entry.is_directory);
            out->set_owner(entry.owner);
            out->set_upload_time(entry.upload_time);
            out->set_writable(entry.writable);
        }
    }
    return ToGrpcStatus(listed.status());
}

grpc::Status DbfsServiceImpl::GetContent(grpc::ServerContext* context,
                                         const dbfs_service::GetContentRequest* request,
                                         dbfs_service::GetContentResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());

    Result<std::string> content = facade_->GetContent(request->path(), &user);
    FillStatus(response->mutable_status(), content.status());
    if (content.ok()) {
        response->set_data(content.value());
    }
    return ToGrpcStatus(content.status());
}

grpc::Status DbfsServiceImpl::Stat(grpc::ServerContext* context,
                                   const dbfs_service::StatRequest* request,
                                   dbfs_service::NodeResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());
    return ReplyNode(response, facade_->Stat(request->path(), &user));
}

grpc::Status DbfsServiceImpl::Probe(grpc::ServerContext* context,
                                    const dbfs_service::ProbeRequest* request,
                                    dbfs_service::ProbeResponse* response) {
    if (request->user_handle().empty()) {
        return AnonymousCaller();
    }
    User user(request->user_handle());

    bool allowed = false;
    switch (request->kind()) {
        case dbfs_service::READABLE:
            allowed = facade_->Readable(request->path(), &user);
            break;
        case dbfs_service::WRITABLE:
            allowed = facade_->Writable(request->path(), &user);
            break;
        case dbfs_service::WRITABLE_SELF:
            allowed = facade_->WritableSelf(request->path(), &user);
            break;
        default:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "unknown probe kind");
    }
    response->set_allowed(allowed);
    return grpc::Status::OK;
}

}  // namespace dbfs_master
