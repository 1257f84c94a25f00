#pragma once

#include <optional>
#include <string>

struct UserInfo {
    std::string id;
    std::string email;
};

// Authentication collaborator; consulted once per editor mount.
class AuthProvider {
public:
    virtual ~AuthProvider() = default;
    virtual std::optional<UserInfo> currentUser() = 0;
};
