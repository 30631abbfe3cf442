#pragma once

#include <string>
#include <utility>

namespace dbfs_common {

// Caller identity. Entry points take `const User*`; nullptr is the system
// caller and skips every permission check.
struct User {
    std::string handle;

    explicit User(std::string h) : handle(std::move(h)) {}
};

}  // namespace dbfs_common
