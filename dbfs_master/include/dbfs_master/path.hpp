#pragma once
#include <string>
#include <vector>
#include "dbfs_common/status.hpp"

namespace dbfs_master {

constexpr size_t MAX_NAME_LENGTH = 255;

// Splits "/a//b/" into {"a", "b"}. "." and ".." are rejected; "/" and "" give
// an empty list (the root).
dbfs_common::Result<std::vector<std::string>> SplitPath(const std::string& path);

// Non-empty, no '/', not "." or "..", at most MAX_NAME_LENGTH bytes.
dbfs_common::Status ValidateName(const std::string& name);

// Final segment of a path, without checking that it exists.
std::string GetFileName(const std::string& path);

std::string JoinPath(const std::string& parent, const std::string& name);

// "report.txt", 2 -> "report (2).txt"; dotfiles keep the suffix at the end.
std::string NumberedName(const std::string& name, int n);

}  // namespace dbfs_master
