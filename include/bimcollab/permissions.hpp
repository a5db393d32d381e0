/// @file permissions.hpp
/// @brief The fixed role to capability table.

#pragma once

#include <bimcollab/types.hpp>

#include <cstdint>
#include <set>
#include <string_view>

namespace bimcollab {

/// A capability a session member may hold.
enum class Permission : std::uint8_t {
    read,    ///< Query changes, conflicts, versions and exports.
    write,   ///< Submit changes, create versions and branches, merge.
    admin,   ///< Administer the session.
    del,     ///< Delete model content.
    review,  ///< Review proposed changes.
};

constexpr auto to_string_view(Permission permission) noexcept -> std::string_view {
    switch (permission) {
        case Permission::read:   return "read";
        case Permission::write:  return "write";
        case Permission::admin:  return "admin";
        case Permission::del:    return "delete";
        case Permission::review: return "review";
    }
    return "unknown";
}

using PermissionSet = std::set<Permission>;

/// The capability set a role grants.
///
/// owner, admin -> {read, write, admin, delete}
/// editor       -> {read, write}
/// reviewer     -> {read, write, review}
/// viewer       -> {read}
auto permissions_for_role(Role role) -> PermissionSet;

/// Check whether `set` contains `permission`.
inline auto has_permission(const PermissionSet& set, Permission permission) -> bool {
    return set.contains(permission);
}

}  // namespace bimcollab
