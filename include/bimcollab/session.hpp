/// @file session.hpp
/// @brief Session: one collaborative editing context for a single model.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/conflict.hpp>
#include <bimcollab/journal.hpp>
#include <bimcollab/permissions.hpp>
#include <bimcollab/types.hpp>
#include <bimcollab/version.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bimcollab {

/// A participant in a session.
struct User {
    std::string user_id;
    std::string username;
    std::string email;
    Role role{Role::viewer};
    PermissionSet permissions;   ///< Always permissions_for_role(role).
    Timestamp last_active{};

    auto operator==(const User&) const -> bool = default;
};

/// The unit of collaboration. Owns users, the active journal,
/// conflicts and the version history.
///
/// A branch is a full Session seeded from another one; it remembers
/// where it came from in `parent_session`.
struct Session {
    std::string session_id;
    std::string model_id;
    std::map<std::string, User, std::less<>> users;
    std::map<std::string, PermissionSet, std::less<>> permissions;
    ChangeJournal journal;
    std::vector<Conflict> conflicts;
    std::vector<Version> versions;
    Timestamp created_at{};
    Timestamp last_activity{};

    std::optional<std::string> parent_session;  ///< Set on branches.
    std::string name;                           ///< Branch name, empty for roots.
    std::string description;

    auto operator==(const Session&) const -> bool = default;

    /// Find a conflict by id, or nullptr.
    auto find_conflict(std::string_view conflict_id) -> Conflict*;

    /// True if a conflict between the two changes was already recorded.
    auto has_conflict_between(std::string_view a, std::string_view b) const -> bool;

    /// Number of conflicts without a resolution.
    auto unresolved_conflict_count() const -> std::size_t;

    /// Check a user's capability. False for users not in the session.
    auto allows(std::string_view user_id, Permission permission) const -> bool;
};

/// Per-user activity row in a SessionStatus.
struct UserActivity {
    std::string user_id;
    std::string username;
    Role role{Role::viewer};
    Timestamp last_active{};

    auto operator==(const UserActivity&) const -> bool = default;
};

/// Read-only summary of a session.
struct SessionStatus {
    std::string session_id;
    std::string model_id;
    std::size_t user_count{0};
    std::size_t active_change_count{0};
    std::size_t conflict_count{0};             ///< All conflicts, resolved included.
    std::size_t unresolved_conflict_count{0};
    std::size_t version_count{0};
    Timestamp created_at{};
    Timestamp last_activity{};
    std::vector<UserActivity> users;

    auto operator==(const SessionStatus&) const -> bool = default;
};

/// Summarise a session.
auto make_status(const Session& session) -> SessionStatus;

// -- Session manager ----------------------------------------------------------

/// Create a user entry with the role's permission set.
auto make_user(std::string user_id, std::string username, std::string email,
               Role role, Timestamp now) -> User;

/// Insert or overwrite a member and its permission entry.
void add_member(Session& session, User user);

/// Remove a member and its permission entry. Returns false if absent.
auto remove_member(Session& session, std::string_view user_id) -> bool;

// -- Version manager ----------------------------------------------------------

/// Fold the settled (applied or conflicted) journal entries into a new
/// Version. Entries still `pending` stay in the journal.
///
/// The version number is the previous version's plus one; the parent is
/// the previous version's id.
auto fold_journal(Session& session, std::string version_id, std::string user_id,
                  std::string description, std::vector<std::string> tags,
                  Timestamp now) -> const Version&;

/// Seed a branch from `parent`: users, permissions and version history
/// are copied verbatim, the journal and conflict list start empty.
auto branch_session(const Session& parent, std::string branch_id,
                    std::string name, std::string description,
                    Timestamp now) -> Session;

}  // namespace bimcollab
