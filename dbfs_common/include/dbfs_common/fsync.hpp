#pragma once

#include <cerrno>
#include <iostream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

namespace dbfs_common {

// fsync a file by path; std::ofstream exposes no descriptor
inline bool SyncPath(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        std::cerr << "SyncPath: open failed: " << path << " (errno: " << errno << ")"
                  << std::endl;
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    if (!ok) {
        std::cerr << "SyncPath: fsync failed for: " << path << " (errno: " << errno << ")"
                  << std::endl;
    }
    ::close(fd);
    return ok;
}

}  // namespace dbfs_common
