/// @file engine.hpp
/// @brief The Engine class -- the primary API for bimcollab.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/config.hpp>
#include <bimcollab/conflict.hpp>
#include <bimcollab/journal.hpp>
#include <bimcollab/session.hpp>
#include <bimcollab/session_store.hpp>
#include <bimcollab/types.hpp>
#include <bimcollab/value.hpp>
#include <bimcollab/version.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bimcollab {

namespace detail {
class ChangeProcessor;
struct QueuedChange;
}  // namespace detail

/// Coordinates concurrent editing of shared building models.
///
/// The engine owns one background worker that drains a FIFO queue of
/// submitted changes across all sessions. make_change() only records the
/// change and enqueues it; conflict detection, application and automatic
/// versioning happen on the worker. Clients observe the outcome by
/// polling get_changes() and get_conflicts().
///
/// All session state lives in a SessionStore guarded by one re-entrant
/// lock shared by callers and the worker. Every failing operation throws
/// CollabError.
///
/// @code
/// auto engine = Engine{};
/// auto sid = engine.create_session("model-1", "alice", "Alice", "alice@example.com");
/// engine.join_session(sid, "bob", "Bob", "bob@example.com", Role::editor);
/// engine.make_change(sid, "bob", ChangeType::resize, "wall_1", "wall",
///                    PropertyMap{{"height", std::int64_t{10}}});
/// engine.wait_until_idle();
/// auto changes = engine.get_changes(sid, "bob");
/// @endcode
class Engine {
public:
    /// Construct with a private store and default configuration.
    Engine();

    /// Construct with a private store.
    /// @throws CollabError{invalid_config}
    explicit Engine(EngineConfig config);

    /// Construct over a shared store.
    /// @throws CollabError{invalid_config}
    Engine(std::shared_ptr<SessionStore> store, EngineConfig config);

    /// Drains the queue and joins the worker.
    ~Engine();

    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;
    Engine(Engine&&) = delete;
    auto operator=(Engine&&) -> Engine& = delete;

    // -- Session lifecycle ----------------------------------------------------

    /// Create a session. The owner joins with Role::owner.
    /// @return The new session id.
    auto create_session(std::string model_id, std::string owner_id,
                        std::string owner_username, std::string owner_email)
        -> std::string;

    /// Add a user to a session, or overwrite an existing member's entry.
    /// @throws CollabError{session_not_found}
    auto join_session(const std::string& session_id, std::string user_id,
                      std::string username, std::string email,
                      Role role = Role::viewer) -> bool;

    /// Remove a user from a session.
    /// @throws CollabError{session_not_found, user_not_in_session}
    auto leave_session(const std::string& session_id, const std::string& user_id) -> bool;

    /// Summarise a session.
    /// @throws CollabError{session_not_found}
    auto get_session_status(const std::string& session_id) const -> SessionStatus;

    // -- Changes --------------------------------------------------------------

    /// Record a change and hand it to the background worker.
    ///
    /// Returns as soon as the change is in the journal and queued; it never
    /// waits for conflict detection.
    /// @return The new change id.
    /// @throws CollabError{session_not_found, permission_denied, engine_stopped}
    auto make_change(const std::string& session_id, const std::string& user_id,
                     ChangeType change_type, std::string element_id,
                     std::string element_type, PropertyMap new_value,
                     std::optional<PropertyMap> old_value = std::nullopt,
                     std::string description = {}, PropertyMap metadata = {})
        -> std::string;

    /// Active journal entries, optionally only those at or after `since`.
    /// @throws CollabError{session_not_found, user_not_in_session, permission_denied}
    auto get_changes(const std::string& session_id, const std::string& user_id,
                     std::optional<Timestamp> since = std::nullopt) const
        -> std::vector<JournalEntry>;

    // -- Conflicts ------------------------------------------------------------

    /// Unresolved conflicts of a session.
    /// @throws CollabError{session_not_found, user_not_in_session, permission_denied}
    auto get_conflicts(const std::string& session_id, const std::string& user_id) const
        -> std::vector<Conflict>;

    /// Every conflict of a session, resolved ones included.
    /// @throws CollabError{session_not_found, user_not_in_session, permission_denied}
    auto get_conflict_log(const std::string& session_id, const std::string& user_id) const
        -> std::vector<Conflict>;

    /// Settle an unresolved conflict with `strategy`.
    /// @throws CollabError{session_not_found, conflict_not_found}
    auto resolve_conflict(const std::string& session_id, const std::string& conflict_id,
                          Resolution strategy, const std::string& resolved_by) -> bool;

    // -- Versions, branches and merges ----------------------------------------

    /// Fold the active journal into a new version.
    /// @return The new version id.
    /// @throws CollabError{session_not_found, permission_denied}
    auto create_version(const std::string& session_id, const std::string& user_id,
                        std::string description, std::vector<std::string> tags = {})
        -> std::string;

    /// Version history ordered by version number.
    /// @throws CollabError{session_not_found, user_not_in_session, permission_denied}
    auto get_versions(const std::string& session_id, const std::string& user_id) const
        -> std::vector<Version>;

    /// Start a branch session seeded from `session_id`.
    /// @return The branch session id.
    /// @throws CollabError{session_not_found, permission_denied}
    auto create_branch(const std::string& session_id, const std::string& user_id,
                       std::string name, std::string description) -> std::string;

    /// Merge the active changes of `source_id` into `target_id`, then
    /// version the target.
    /// @throws CollabError{session_not_found, permission_denied}
    auto merge_branch(const std::string& target_id, const std::string& source_id,
                      const std::string& user_id, Resolution strategy) -> bool;

    // -- Inspection -----------------------------------------------------------

    /// Copy of a whole session, for export.
    /// @throws CollabError{session_not_found, user_not_in_session, permission_denied}
    auto snapshot(const std::string& session_id, const std::string& user_id) const -> Session;

    /// Block until every queued change has been processed.
    void wait_until_idle();

    /// Number of changes queued or being processed.
    auto queued_changes() const -> std::size_t;

    /// Stop accepting changes, drain the queue and join the worker.
    void shutdown();

    auto store() const -> std::shared_ptr<SessionStore> { return store_; }
    auto config() const -> const EngineConfig& { return config_; }

private:
    /// Worker entry point: detect, apply or record conflicts, auto-version.
    void process_change(const detail::QueuedChange& item);

    /// Fold an "Auto-save" version once `version_interval` changes have
    /// been applied since the last one. Caller holds the store lock.
    void maybe_auto_version(Session& session, std::string author);

    /// Membership then capability check; throws on failure.
    void require_member(const Session& session, const std::string& user_id,
                        Permission permission) const;

    auto now() const -> Timestamp { return config_.clock(); }

    std::shared_ptr<SessionStore> store_;
    EngineConfig config_;
    std::unique_ptr<detail::ChangeProcessor> processor_;
};

}  // namespace bimcollab
