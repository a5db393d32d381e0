/// @file session_store.hpp
/// @brief SessionStore: the session map and the lock that guards it.

#pragma once

#include <bimcollab/session.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace bimcollab {

/// Owns every session of one or more engines together with the single
/// re-entrant lock that protects all session state.
///
/// Every read or mutation of a Session reached through the store must
/// happen while holding lock(). The store is injected into an Engine at
/// construction, so independent engines (and tests) never share state
/// unless they are handed the same store.
///
/// @code
/// auto store = std::make_shared<SessionStore>();
/// auto engine = Engine{store, EngineConfig{}};
/// auto lock = store->lock();
/// auto& session = store->get(id);
/// @endcode
class SessionStore {
public:
    using Lock = std::unique_lock<std::recursive_mutex>;

    SessionStore() = default;

    SessionStore(const SessionStore&) = delete;
    auto operator=(const SessionStore&) -> SessionStore& = delete;

    /// Acquire the store lock. Re-entrant on the same thread.
    auto lock() const -> Lock { return Lock{mutex_}; }

    /// Find a session, or nullptr. Caller holds lock().
    auto find(std::string_view session_id) -> Session*;
    auto find(std::string_view session_id) const -> const Session*;

    /// Get a session or throw CollabError{session_not_found}.
    /// Caller holds lock().
    auto get(std::string_view session_id) -> Session&;
    auto get(std::string_view session_id) const -> const Session&;

    /// Insert a session keyed by its id, replacing any previous one.
    /// Takes the lock itself.
    auto insert(Session session) -> Session&;

    auto contains(std::string_view session_id) const -> bool;
    auto size() const -> std::size_t;
    auto session_ids() const -> std::vector<std::string>;

private:
    std::map<std::string, Session, std::less<>> sessions_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace bimcollab
