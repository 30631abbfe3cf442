#include "dbfs_content/file_stream.hpp"
#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <uuid/uuid.h>

using dbfs_common::Status;

namespace dbfs_content {

std::string GenerateHandle() {
    uuid_t uuid;
    uuid_generate(uuid);
    char text[37];
    uuid_unparse_lower(uuid, text);
    return std::string(text);
}

FileStream::FileStream(StreamMode mode, uint64_t estimated_length,
                       uint64_t source_object_id, std::string initial_data)
    : handle_(GenerateHandle()),
      mode_(mode),
      estimated_length_(estimated_length),
      source_object_id_(source_object_id),
      buffer_(std::move(initial_data)) {
    if (mode_ == StreamMode::kWrite) {
        buffer_.reserve(static_cast<size_t>(
            std::min<uint64_t>(estimated_length_, MAX_RESERVE_BYTES)));
    }
}

FileStream::FileStream(SentinelTag)
    : handle_("empty"),
      mode_(StreamMode::kRead),
      estimated_length_(0),
      source_object_id_(0),
      empty_sentinel_(true) {}

std::shared_ptr<const FileStream> FileStream::Empty() {
    static const std::shared_ptr<const FileStream> sentinel(new FileStream(SentinelTag{}));
    return sentinel;
}

Status FileStream::CheckWritableLocked() const {
    if (mode_ != StreamMode::kWrite) {
        return Status::Invalid("stream " + handle_ + " was opened for reading");
    }
    if (committed_) {
        return Status::Invalid("stream " + handle_ + " is already committed");
    }
    return Status::OK();
}

Status FileStream::Write(const std::string& data) {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    Status st = CheckWritableLocked();
    if (!st.ok()) return st;
    buffer_.append(data);
    return Status::OK();
}

Status FileStream::WriteAt(uint64_t offset, const std::string& data) {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    Status st = CheckWritableLocked();
    if (!st.ok()) return st;

    // A write may leave a zero-filled gap of at most MAX_RESERVE_BYTES past the end
    if (offset > buffer_.size() + MAX_RESERVE_BYTES ||
        data.size() > buffer_.max_size() - static_cast<size_t>(offset)) {
        return Status::Invalid("stream " + handle_ + ": write offset " +
                               std::to_string(offset) + " is out of range");
    }

    size_t required_size = static_cast<size_t>(offset) + data.size();
    if (buffer_.size() < required_size) {
        buffer_.resize(required_size, '\0');
    }
    std::copy(data.begin(), data.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return Status::OK();
}

void FileStream::Read(uint64_t offset, uint64_t length, std::string& out_data) const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (offset >= buffer_.size()) {
        out_data.clear();
        return;
    }
    uint64_t available = buffer_.size() - offset;
    uint64_t actual_length = (length == 0) ? available : std::min(length, available);
    out_data = buffer_.substr(static_cast<size_t>(offset), static_cast<size_t>(actual_length));
}

std::string FileStream::ReadAll() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return buffer_;
}

uint64_t FileStream::Size() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return buffer_.size();
}

bool FileStream::Committed() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return committed_;
}

uint64_t FileStream::CommittedObjectId() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return committed_object_id_;
}

Status FileStream::BeginCommit(std::string& out_data) {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (empty_sentinel_) {
        return Status::Invalid("the empty stream cannot be committed");
    }
    Status st = CheckWritableLocked();
    if (!st.ok()) return st;
    committed_ = true;
    out_data = buffer_;
    return Status::OK();
}

void FileStream::FinishCommit(uint64_t object_id) {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    committed_object_id_ = object_id;
}

void FileStream::AbortCommit() {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    committed_ = false;
    committed_object_id_ = 0;
}

}  // namespace dbfs_content
