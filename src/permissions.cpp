#include <bimcollab/permissions.hpp>

namespace bimcollab {

auto permissions_for_role(Role role) -> PermissionSet {
    auto permissions = PermissionSet{Permission::read};

    switch (role) {
        case Role::owner:
        case Role::admin:
            permissions.insert({Permission::write, Permission::admin, Permission::del});
            break;
        case Role::editor:
            permissions.insert(Permission::write);
            break;
        case Role::reviewer:
            permissions.insert({Permission::write, Permission::review});
            break;
        case Role::viewer:
            break;
    }
    return permissions;
}

}  // namespace bimcollab
