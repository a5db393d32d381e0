#include <bimcollab/session.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>

namespace bimcollab {

auto Session::find_conflict(std::string_view conflict_id) -> Conflict* {
    auto it = std::ranges::find_if(conflicts, [&](const Conflict& c) {
        return c.conflict_id == conflict_id;
    });
    return it == conflicts.end() ? nullptr : &*it;
}

auto Session::has_conflict_between(std::string_view a, std::string_view b) const -> bool {
    return std::ranges::any_of(conflicts, [&](const Conflict& c) { return c.involves(a, b); });
}

auto Session::unresolved_conflict_count() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(conflicts, [](const Conflict& c) {
        return !c.is_resolved();
    }));
}

auto Session::allows(std::string_view user_id, Permission permission) const -> bool {
    auto it = permissions.find(user_id);
    if (it == permissions.end()) return false;
    return has_permission(it->second, permission);
}

auto make_status(const Session& session) -> SessionStatus {
    auto status = SessionStatus{
        .session_id = session.session_id,
        .model_id = session.model_id,
        .user_count = session.users.size(),
        .active_change_count = session.journal.size(),
        .conflict_count = session.conflicts.size(),
        .unresolved_conflict_count = session.unresolved_conflict_count(),
        .version_count = session.versions.size(),
        .created_at = session.created_at,
        .last_activity = session.last_activity,
        .users = {},
    };
    status.users.reserve(session.users.size());
    for (const auto& [id, user] : session.users) {
        status.users.push_back(UserActivity{
            .user_id = user.user_id,
            .username = user.username,
            .role = user.role,
            .last_active = user.last_active,
        });
    }
    return status;
}

// -- Session manager ----------------------------------------------------------

auto make_user(std::string user_id, std::string username, std::string email,
               Role role, Timestamp now) -> User {
    return User{
        .user_id = std::move(user_id),
        .username = std::move(username),
        .email = std::move(email),
        .role = role,
        .permissions = permissions_for_role(role),
        .last_active = now,
    };
}

void add_member(Session& session, User user) {
    auto id = user.user_id;
    session.permissions.insert_or_assign(id, user.permissions);
    session.users.insert_or_assign(std::move(id), std::move(user));
}

auto remove_member(Session& session, std::string_view user_id) -> bool {
    auto it = session.users.find(user_id);
    if (it == session.users.end()) return false;
    session.users.erase(it);
    if (auto p = session.permissions.find(user_id); p != session.permissions.end()) {
        session.permissions.erase(p);
    }
    return true;
}

// -- Version manager ----------------------------------------------------------

auto fold_journal(Session& session, std::string version_id, std::string user_id,
                  std::string description, std::vector<std::string> tags,
                  Timestamp now) -> const Version& {
    auto parent = std::optional<std::string>{};
    auto number = std::uint64_t{1};
    if (!session.versions.empty()) {
        parent = session.versions.back().version_id;
        number = session.versions.back().version_number + 1;
    }

    session.versions.push_back(Version{
        .version_id = std::move(version_id),
        .version_number = number,
        .timestamp = now,
        .user_id = std::move(user_id),
        .description = std::move(description),
        .changes = session.journal.take_settled(),
        .parent_version = std::move(parent),
        .tags = std::move(tags),
    });
    session.last_activity = now;
    return session.versions.back();
}

auto branch_session(const Session& parent, std::string branch_id,
                    std::string name, std::string description,
                    Timestamp now) -> Session {
    auto branch = Session{};
    branch.session_id = std::move(branch_id);
    branch.model_id = parent.model_id;
    branch.users = parent.users;
    branch.permissions = parent.permissions;
    branch.versions = parent.versions;
    branch.created_at = now;
    branch.last_activity = now;
    branch.parent_session = parent.session_id;
    branch.name = std::move(name);
    branch.description = std::move(description);
    return branch;
}

}  // namespace bimcollab
