#include <bimcollab/session_store.hpp>

#include <bimcollab/error.hpp>

#include <utility>

namespace bimcollab {

auto SessionStore::find(std::string_view session_id) -> Session* {
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : &it->second;
}

auto SessionStore::find(std::string_view session_id) const -> const Session* {
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : &it->second;
}

auto SessionStore::get(std::string_view session_id) -> Session& {
    auto* session = find(session_id);
    if (!session) {
        throw CollabError{ErrorKind::session_not_found,
                          "Session " + std::string{session_id} + " not found"};
    }
    return *session;
}

auto SessionStore::get(std::string_view session_id) const -> const Session& {
    const auto* session = find(session_id);
    if (!session) {
        throw CollabError{ErrorKind::session_not_found,
                          "Session " + std::string{session_id} + " not found"};
    }
    return *session;
}

auto SessionStore::insert(Session session) -> Session& {
    auto lock = this->lock();
    auto id = session.session_id;
    auto result = sessions_.insert_or_assign(std::move(id), std::move(session));
    return result.first->second;
}

auto SessionStore::contains(std::string_view session_id) const -> bool {
    auto lock = this->lock();
    return find(session_id) != nullptr;
}

auto SessionStore::size() const -> std::size_t {
    auto lock = this->lock();
    return sessions_.size();
}

auto SessionStore::session_ids() const -> std::vector<std::string> {
    auto lock = this->lock();
    auto ids = std::vector<std::string>{};
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace bimcollab
