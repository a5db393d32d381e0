#include <bimcollab/engine.hpp>
#include <bimcollab/error.hpp>

#include "change_processor.hpp"
#include "executor.hpp"
#include "id.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>
#include <utility>

namespace bimcollab {

namespace {

// Settle one incoming branch change against the target changes it
// collides with, according to the merge strategy.
void merge_conflicting(Session& target, const Change& incoming,
                       const std::vector<Change>& rivals, Resolution strategy,
                       const std::string& user_id, double severity, Timestamp now) {
    auto record = [&](const Change& rival, std::optional<Resolution> resolution) {
        auto conflict = make_conflict(detail::make_uuid(), rival, incoming, severity);
        if (resolution) mark_resolved(conflict, *resolution, user_id, now);
        PLOGW << "Merge conflict " << conflict.conflict_id << " on element "
              << incoming.element_id << " (" << to_string_view(strategy) << ")";
        target.conflicts.push_back(std::move(conflict));
    };

    switch (strategy) {
        case Resolution::manual:
            for (const auto& rival : rivals) record(rival, std::nullopt);
            target.journal.append(incoming, ChangeStatus::conflicted);
            break;

        case Resolution::last_writer_wins:
        case Resolution::automatic: {
            auto incoming_wins = std::ranges::all_of(rivals, [&](const Change& rival) {
                return &later_of(rival, incoming) == &incoming;
            });
            for (const auto& rival : rivals) record(rival, strategy);
            if (incoming_wins) {
                for (const auto& rival : rivals) target.journal.erase(rival.change_id);
                target.journal.append(incoming, ChangeStatus::applied);
            }
            break;
        }

        case Resolution::merge: {
            auto parts = rivals;
            parts.push_back(incoming);
            for (const auto& rival : rivals) {
                record(rival, strategy);
                target.journal.erase(rival.change_id);
            }
            target.journal.append(merge_change_set(std::move(parts), detail::make_uuid(), now),
                                  ChangeStatus::applied);
            break;
        }

        case Resolution::reject:
            for (const auto& rival : rivals) {
                record(rival, strategy);
                target.journal.erase(rival.change_id);
            }
            break;
    }
}

}  // namespace

Engine::Engine()
    : Engine{std::make_shared<SessionStore>(), EngineConfig{}} {}

Engine::Engine(EngineConfig config)
    : Engine{std::make_shared<SessionStore>(), std::move(config)} {}

Engine::Engine(std::shared_ptr<SessionStore> store, EngineConfig config)
    : store_{store ? std::move(store) : std::make_shared<SessionStore>()},
      config_{std::move(config)} {
    validate(config_);
    processor_ = std::make_unique<detail::ChangeProcessor>(
        [this](const detail::QueuedChange& item) { process_change(item); });
}

Engine::~Engine() {
    shutdown();
}

// -- Session lifecycle --------------------------------------------------------

auto Engine::create_session(std::string model_id, std::string owner_id,
                            std::string owner_username, std::string owner_email)
    -> std::string {
    const auto now = this->now();

    auto session = Session{};
    session.session_id = detail::make_uuid();
    session.model_id = std::move(model_id);
    session.created_at = now;
    session.last_activity = now;
    add_member(session, make_user(std::move(owner_id), std::move(owner_username),
                                  std::move(owner_email), Role::owner, now));

    auto session_id = session.session_id;
    PLOGI << "Created collaboration session " << session_id
          << " for model " << session.model_id;
    store_->insert(std::move(session));
    return session_id;
}

auto Engine::join_session(const std::string& session_id, std::string user_id,
                          std::string username, std::string email, Role role) -> bool {
    auto lock = store_->lock();
    auto& session = store_->get(session_id);
    const auto now = this->now();

    PLOGI << "User " << user_id << " joined session " << session_id
          << " as " << to_string_view(role);
    add_member(session, make_user(std::move(user_id), std::move(username),
                                  std::move(email), role, now));
    session.last_activity = now;
    return true;
}

auto Engine::leave_session(const std::string& session_id, const std::string& user_id) -> bool {
    auto lock = store_->lock();
    auto& session = store_->get(session_id);

    if (!remove_member(session, user_id)) {
        throw CollabError{ErrorKind::user_not_in_session,
                          "User " + user_id + " not in session " + session_id};
    }
    session.last_activity = now();

    PLOGI << "User " << user_id << " left session " << session_id;
    return true;
}

auto Engine::get_session_status(const std::string& session_id) const -> SessionStatus {
    auto lock = store_->lock();
    return make_status(store_->get(session_id));
}

// -- Changes ------------------------------------------------------------------

auto Engine::make_change(const std::string& session_id, const std::string& user_id,
                         ChangeType change_type, std::string element_id,
                         std::string element_type, PropertyMap new_value,
                         std::optional<PropertyMap> old_value,
                         std::string description, PropertyMap metadata) -> std::string {
    if (processor_->stopped()) {
        throw CollabError{ErrorKind::engine_stopped, "Engine is shut down"};
    }

    auto lock = store_->lock();
    auto& session = store_->get(session_id);

    if (!session.allows(user_id, Permission::write)) {
        throw CollabError{ErrorKind::permission_denied,
                          "User " + user_id + " does not have write permission"};
    }

    auto change = Change{
        .change_id = detail::make_uuid(),
        .user_id = user_id,
        .timestamp = now(),
        .change_type = change_type,
        .element_id = std::move(element_id),
        .element_type = std::move(element_type),
        .old_value = std::move(old_value),
        .new_value = std::move(new_value),
        .description = std::move(description),
        .metadata = std::move(metadata),
    };
    auto change_id = change.change_id;

    session.journal.append(change);
    session.last_activity = change.timestamp;
    if (auto it = session.users.find(user_id); it != session.users.end()) {
        it->second.last_active = change.timestamp;
    }

    // Enqueue while still holding the store lock so queue order matches
    // journal order.
    if (!processor_->enqueue(detail::QueuedChange{session_id, std::move(change)})) {
        session.journal.erase(change_id);
        throw CollabError{ErrorKind::engine_stopped, "Engine is shut down"};
    }

    PLOGI << "Change " << change_id << " queued for processing";
    return change_id;
}

void Engine::process_change(const detail::QueuedChange& item) {
    auto lock = store_->lock();

    auto* session = store_->find(item.session_id);
    if (!session) {
        PLOGW << "Dropping change " << item.change.change_id
              << ": session " << item.session_id << " no longer exists";
        return;
    }

    // Resolved away or applied by a resolution before the worker got to it.
    auto* entry = session->journal.find(item.change.change_id);
    if (!entry || entry->status != ChangeStatus::pending) {
        PLOGD << "Change " << item.change.change_id << " already settled, skipping";
        return;
    }

    const auto& change = entry->change;
    auto rivals = detect_conflicts(session->journal, change, config_.conflict_window);

    if (!rivals.empty()) {
        entry->status = ChangeStatus::conflicted;
        for (const auto* rival : rivals) {
            if (session->has_conflict_between(rival->change_id, change.change_id)) continue;
            auto conflict = make_conflict(detail::make_uuid(), *rival, change,
                                          config_.conflict_severity);
            PLOGW << "Conflict detected: " << conflict.conflict_id << " on element "
                  << change.element_id << " between " << rival->user_id
                  << " and " << change.user_id;
            session->conflicts.push_back(std::move(conflict));
        }
        return;
    }

    entry->status = ChangeStatus::applied;
    PLOGI << "Applied change " << change.change_id << " to element " << change.element_id;

    auto author = change.user_id;
    maybe_auto_version(*session, std::move(author));
}

void Engine::maybe_auto_version(Session& session, std::string author) {
    // Every fold removes the applied entries, so the journal's applied
    // count is the number applied since the last version.
    if (session.journal.applied_count() < config_.version_interval) return;

    const auto& version = fold_journal(session, detail::make_uuid(), std::move(author),
                                       "Auto-save", {}, now());
    PLOGI << "Created version " << version.version_id
          << " (v" << version.version_number << ")";
}

auto Engine::get_changes(const std::string& session_id, const std::string& user_id,
                         std::optional<Timestamp> since) const -> std::vector<JournalEntry> {
    auto lock = store_->lock();
    const auto& session = store_->get(session_id);
    require_member(session, user_id, Permission::read);

    auto result = std::vector<JournalEntry>{};
    for (const auto& entry : session.journal.entries()) {
        if (!since || entry.change.timestamp >= *since) {
            result.push_back(entry);
        }
    }
    return result;
}

// -- Conflicts ----------------------------------------------------------------

auto Engine::get_conflicts(const std::string& session_id, const std::string& user_id) const
    -> std::vector<Conflict> {
    auto lock = store_->lock();
    const auto& session = store_->get(session_id);
    require_member(session, user_id, Permission::read);

    auto result = std::vector<Conflict>{};
    std::ranges::copy_if(session.conflicts, std::back_inserter(result),
                         [](const Conflict& c) { return !c.is_resolved(); });
    return result;
}

auto Engine::get_conflict_log(const std::string& session_id, const std::string& user_id) const
    -> std::vector<Conflict> {
    auto lock = store_->lock();
    const auto& session = store_->get(session_id);
    require_member(session, user_id, Permission::read);
    return session.conflicts;
}

auto Engine::resolve_conflict(const std::string& session_id, const std::string& conflict_id,
                              Resolution strategy, const std::string& resolved_by) -> bool {
    auto lock = store_->lock();
    auto& session = store_->get(session_id);

    auto* conflict = session.find_conflict(conflict_id);
    if (!conflict || conflict->is_resolved()) {
        throw CollabError{ErrorKind::conflict_not_found,
                          "Conflict " + conflict_id + " not found"};
    }

    const auto now = this->now();
    apply_outcome(session.journal, resolve_pair(*conflict, strategy, detail::make_uuid(), now));
    mark_resolved(*conflict, strategy, resolved_by, now);
    session.last_activity = now;

    PLOGI << "Resolved conflict " << conflict_id << " with " << to_string_view(strategy);
    maybe_auto_version(session, resolved_by);
    return true;
}

// -- Versions, branches and merges --------------------------------------------

auto Engine::create_version(const std::string& session_id, const std::string& user_id,
                            std::string description, std::vector<std::string> tags)
    -> std::string {
    auto lock = store_->lock();
    auto& session = store_->get(session_id);

    if (!session.allows(user_id, Permission::write)) {
        throw CollabError{ErrorKind::permission_denied,
                          "User " + user_id + " does not have write permission"};
    }

    const auto& version = fold_journal(session, detail::make_uuid(), user_id,
                                       std::move(description), std::move(tags), now());
    PLOGI << "Created version " << version.version_id << " (v" << version.version_number << ")";
    return version.version_id;
}

auto Engine::get_versions(const std::string& session_id, const std::string& user_id) const
    -> std::vector<Version> {
    auto lock = store_->lock();
    const auto& session = store_->get(session_id);
    require_member(session, user_id, Permission::read);
    return session.versions;
}

auto Engine::create_branch(const std::string& session_id, const std::string& user_id,
                           std::string name, std::string description) -> std::string {
    auto lock = store_->lock();
    const auto& parent = store_->get(session_id);

    if (!parent.allows(user_id, Permission::write)) {
        throw CollabError{ErrorKind::permission_denied,
                          "User " + user_id + " does not have write permission"};
    }

    const auto& branch = store_->insert(branch_session(parent, detail::make_uuid(),
                                                       std::move(name), std::move(description),
                                                       now()));
    PLOGI << "Created branch " << branch.session_id << " (" << branch.name
          << ") from session " << session_id;
    return branch.session_id;
}

auto Engine::merge_branch(const std::string& target_id, const std::string& source_id,
                          const std::string& user_id, Resolution strategy) -> bool {
    auto lock = store_->lock();
    auto& target = store_->get(target_id);
    const auto& source = store_->get(source_id);

    if (!target.allows(user_id, Permission::write)) {
        throw CollabError{ErrorKind::permission_denied,
                          "User " + user_id + " does not have write permission"};
    }

    const auto now = this->now();
    auto incoming = source.journal.changes();

    // Every incoming change is checked against the target journal as it
    // stood before the merge began.
    const auto baseline = target.journal;
    auto rivals = std::vector<std::vector<Change>>(incoming.size());
    auto detect = [&](std::size_t i) {
        for (const auto* hit : detect_conflicts(baseline, incoming[i], config_.conflict_window)) {
            rivals[i].push_back(*hit);
        }
    };
    if (incoming.size() >= config_.parallel_merge_threshold) {
        detail::parallel_for(incoming.size(), detect);
    } else {
        for (std::size_t i = 0; i < incoming.size(); ++i) detect(i);
    }

    for (std::size_t i = 0; i < incoming.size(); ++i) {
        const auto& change = incoming[i];
        if (target.journal.contains(change.change_id)) continue;
        // An earlier incoming change may already have consumed a rival.
        std::erase_if(rivals[i], [&](const Change& rival) {
            return !target.journal.contains(rival.change_id);
        });
        if (rivals[i].empty()) {
            target.journal.append(change, ChangeStatus::applied);
            continue;
        }
        merge_conflicting(target, change, rivals[i], strategy, user_id,
                          config_.conflict_severity, now);
    }

    const auto& version = fold_journal(target, detail::make_uuid(), user_id,
                                       "Merged from " + source_id, {}, now);
    PLOGI << "Merged session " << source_id << " into " << target_id << " ("
          << incoming.size() << " changes, v" << version.version_number << ")";
    return true;
}

// -- Inspection ---------------------------------------------------------------

auto Engine::snapshot(const std::string& session_id, const std::string& user_id) const
    -> Session {
    auto lock = store_->lock();
    const auto& session = store_->get(session_id);
    require_member(session, user_id, Permission::read);
    return session;
}

void Engine::wait_until_idle() {
    processor_->wait_idle();
}

auto Engine::queued_changes() const -> std::size_t {
    return processor_->outstanding();
}

void Engine::shutdown() {
    if (processor_) processor_->stop();
}

void Engine::require_member(const Session& session, const std::string& user_id,
                            Permission permission) const {
    if (!session.users.contains(user_id)) {
        throw CollabError{ErrorKind::user_not_in_session,
                          "User " + user_id + " not in session " + session.session_id};
    }
    if (!session.allows(user_id, permission)) {
        throw CollabError{ErrorKind::permission_denied,
                          "User " + user_id + " does not have " +
                              std::string{to_string_view(permission)} + " permission"};
    }
}

}  // namespace bimcollab
