#include "dbfs_master/path.hpp"

using dbfs_common::Result;
using dbfs_common::Status;

namespace dbfs_master {

Result<std::vector<std::string>> SplitPath(const std::string& path) {
    std::vector<std::string> components;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string segment = path.substr(start, end - start);
        if (segment == "." || segment == "..") {
            return Status::Invalid("relative segment in path: " + path);
        }
        if (!segment.empty()) {
            components.push_back(segment);
        }
        start = end + 1;
    }
    return components;
}

Status ValidateName(const std::string& name) {
    if (name.empty()) {
        return Status::Invalid("empty name");
    }
    if (name.size() > MAX_NAME_LENGTH) {
        return Status::Invalid("name longer than " + std::to_string(MAX_NAME_LENGTH) + " bytes");
    }
    if (name.find('/') != std::string::npos) {
        return Status::Invalid("name contains '/': " + name);
    }
    if (name == "." || name == "..") {
        return Status::Invalid("reserved name: " + name);
    }
    return Status::OK();
}

std::string GetFileName(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return "";
    }
    size_t start = path.rfind('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

std::string JoinPath(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent.back() != '/') {
        return parent + "/" + name;
    }
    return parent + name;
}

std::string NumberedName(const std::string& name, int n) {
    std::string suffix = " (" + std::to_string(n) + ")";
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return name + suffix;
    }
    return name.substr(0, dot) + suffix + name.substr(dot);
}

}  // namespace dbfs_master
