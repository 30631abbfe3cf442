#pragma once

#include <optional>
#include <string>
#include <utility>

namespace dbfs_common {

enum class StatusCode {
    kOk,
    kPermissionDenied,  // caller lacks a required grant
    kNotFound,          // path or content id does not resolve
    kConflict,          // sibling collision, move/copy into own subtree
    kInvalid,           // malformed path or name, operation on the root
    kIoError            // record store or content store failure
};

inline const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::kOk: return "OK";
        case StatusCode::kPermissionDenied: return "PERMISSION_DENIED";
        case StatusCode::kNotFound: return "NOT_FOUND";
        case StatusCode::kConflict: return "CONFLICT";
        case StatusCode::kInvalid: return "INVALID";
        case StatusCode::kIoError: return "IO_ERROR";
    }
    return "UNKNOWN";
}

/**
 * Status: outcome of a filesystem operation
 *
 * Replaces the old "false on any failure" contract so callers can tell a
 * denial from a missing path from a collision.
 */
class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }
    static Status PermissionDenied(std::string msg) {
        return Status(StatusCode::kPermissionDenied, std::move(msg));
    }
    static Status NotFound(std::string msg) {
        return Status(StatusCode::kNotFound, std::move(msg));
    }
    static Status Conflict(std::string msg) {
        return Status(StatusCode::kConflict, std::move(msg));
    }
    static Status Invalid(std::string msg) {
        return Status(StatusCode::kInvalid, std::move(msg));
    }
    static Status IoError(std::string msg) {
        return Status(StatusCode::kIoError, std::move(msg));
    }

    bool ok() const { return code_ == StatusCode::kOk; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        return std::string(StatusCodeName(code_)) + ": " + message_;
    }

private:
    StatusCode code_;
    std::string message_;
};

/**
 * Result<T>: a Status plus, when ok, a value
 *
 * Usage:
 *   Result<uint64_t> r = store.Commit(stream);
 *   if (!r.ok()) return r.status();
 *   uint64_t id = r.value();
 */
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {}

    bool ok() const { return status_.ok() && value_.has_value(); }
    const Status& status() const { return status_; }

    T& value() { return *value_; }
    const T& value() const { return *value_; }

    T ValueOr(T fallback) const { return ok() ? *value_ : std::move(fallback); }

private:
    Status status_;
    std::optional<T> value_;
};

}  // namespace dbfs_common
