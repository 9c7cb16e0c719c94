#pragma once

#include <string>

enum class GroupStatus {
    Member,       // current user belongs to the group
    NotMember,    // group missing from the user's memberships
    Unsupported,  // no group database on this platform / no passwd entry
    Error         // enumeration failed
};

struct GroupCheck {
    GroupStatus status = GroupStatus::Unsupported;
    std::string user;
    std::string detail;
};

/// Check whether the current (effective) user is a member of `group`,
/// counting both the primary and the supplementary groups.
GroupCheck check_group_membership(const std::string& group);

/// Login name of the current user: $LOGNAME, $USER, then the passwd entry
std::string current_user_name();
