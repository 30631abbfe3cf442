#include "dbfs_content/disk.hpp"
#include "dbfs_common/fsync.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace dbfs_content {

ObjectDisk::ObjectDisk(const std::string& objects_dir)
    : objects_dir_(objects_dir) {
    if (!fs::exists(objects_dir_)) {
        fs::create_directories(objects_dir_);
        std::cout << "ObjectDisk: Created directory: " << objects_dir_ << std::endl;
    }
}

std::string ObjectDisk::GetObjectPath(uint64_t object_id) const {
    std::stringstream ss;
    ss << objects_dir_ << "/obj_" << object_id << ".dat";
    return ss.str();
}

std::string ObjectDisk::GetChecksumPath(uint64_t object_id) const {
    std::stringstream ss;
    ss << objects_dir_ << "/obj_" << object_id << ".sha256";
    return ss.str();
}

bool ObjectDisk::WriteFileAtomically(const std::string& path, const std::string& data,
                                     bool sync) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "ObjectDisk: Failed to open for writing: " << tmp_path << std::endl;
            return false;
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file.good()) {
            std::cerr << "ObjectDisk: Write failed for: " << tmp_path << std::endl;
            return false;
        }
    }

    if (sync && !dbfs_common::SyncPath(tmp_path)) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::cerr << "ObjectDisk: Rename failed for: " << path << ": "
                  << ec.message() << std::endl;
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

bool ObjectDisk::WriteObject(uint64_t object_id, const std::string& data, bool sync) {
    try {
        if (!WriteFileAtomically(GetObjectPath(object_id), data, sync)) {
            return false;
        }

        stats_.total_writes++;
        stats_.total_bytes_written += data.size();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ObjectDisk: Exception writing object " << object_id << ": "
                  << e.what() << std::endl;
        return false;
    }
}

bool ObjectDisk::ReadObject(uint64_t object_id, std::string& out_data) {
    try {
        std::string object_path = GetObjectPath(object_id);
        std::ifstream file(object_path, std::ios::binary);
        if (!file.is_open()) {
            return false;
        }

        out_data.assign(std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>());
        if (file.bad()) {
            std::cerr << "ObjectDisk: Read failed for: " << object_path << std::endl;
            return false;
        }

        stats_.total_reads++;
        stats_.total_bytes_read += out_data.size();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ObjectDisk: Exception reading object " << object_id << ": "
                  << e.what() << std::endl;
        return false;
    }
}

bool ObjectDisk::WriteChecksum(uint64_t object_id, const std::string& checksum, bool sync) {
    try {
        return WriteFileAtomically(GetChecksumPath(object_id), checksum, sync);
    } catch (const std::exception& e) {
        std::cerr << "ObjectDisk: Exception writing checksum " << object_id << ": "
                  << e.what() << std::endl;
        return false;
    }
}

bool ObjectDisk::ReadChecksum(uint64_t object_id, std::string& out_checksum) {
    std::ifstream file(GetChecksumPath(object_id));
    if (!file.is_open()) {
        return false;
    }
    std::getline(file, out_checksum);
    return !out_checksum.empty();
}

bool ObjectDisk::DeleteObject(uint64_t object_id) {
    try {
        std::error_code ec;
        fs::remove(GetChecksumPath(object_id), ec);
        if (!fs::remove(GetObjectPath(object_id), ec)) {
            if (ec) {
                std::cerr << "ObjectDisk: Failed to delete object " << object_id
                          << ": " << ec.message() << std::endl;
            }
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ObjectDisk: Exception deleting object " << object_id << ": "
                  << e.what() << std::endl;
        return false;
    }
}

bool ObjectDisk::ObjectExists(uint64_t object_id) const {
    std::error_code ec;
    return fs::exists(GetObjectPath(object_id), ec);
}

uint64_t ObjectDisk::GetObjectSize(uint64_t object_id) const {
    std::error_code ec;
    auto size = fs::file_size(GetObjectPath(object_id), ec);
    if (ec) {
        return 0;
    }
    return static_cast<uint64_t>(size);
}

std::vector<uint64_t> ObjectDisk::ListObjectIds() const {
    std::vector<uint64_t> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(objects_dir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".dat") {
            continue;
        }
        // obj_<id>.dat
        std::string stem = entry.path().stem().string();
        if (stem.rfind("obj_", 0) != 0) {
            continue;
        }
        try {
            ids.push_back(std::stoull(stem.substr(4)));
        } catch (const std::exception&) {
            std::cerr << "ObjectDisk: Skipping unrecognized file: "
                      << entry.path().string() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "ObjectDisk: Failed to scan " << objects_dir_ << ": "
                  << ec.message() << std::endl;
    }
    return ids;
}

ObjectDisk::AccessStats ObjectDisk::GetAccessStats() const {
    return stats_;
}

void ObjectDisk::ResetAccessStats() {
    stats_ = AccessStats();
}

}  // namespace dbfs_content
