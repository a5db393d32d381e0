/// @file journal.hpp
/// @brief ChangeJournal: the active, not-yet-versioned changes of a session.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/types.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace bimcollab {

/// A change together with its processing state.
struct JournalEntry {
    Change change;
    ChangeStatus status{ChangeStatus::pending};

    auto operator==(const JournalEntry&) const -> bool = default;
};

/// Append-only record of the changes made since the last Version.
///
/// Entries keep submission order. The journal is bounded in practice by
/// the versioning cadence, so lookups are linear scans.
class ChangeJournal {
public:
    /// Append a change. Its status starts as `status`.
    void append(Change change, ChangeStatus status = ChangeStatus::pending);

    /// Find an entry by change id, or nullptr.
    auto find(std::string_view change_id) -> JournalEntry*;
    auto find(std::string_view change_id) const -> const JournalEntry*;

    auto contains(std::string_view change_id) const -> bool {
        return find(change_id) != nullptr;
    }

    /// Remove an entry. Returns false if the id is not in the journal.
    auto erase(std::string_view change_id) -> bool;

    /// Update the status of an entry. Returns false if the id is unknown.
    auto set_status(std::string_view change_id, ChangeStatus status) -> bool;

    /// Number of entries in the `applied` state.
    auto applied_count() const -> std::size_t;

    /// Copy out the changes in submission order.
    auto changes() const -> std::vector<Change>;

    /// Remove and return every change that is no longer `pending`, in
    /// submission order. Pending entries stay for the worker to check.
    auto take_settled() -> std::vector<Change>;

    auto entries() const -> const std::vector<JournalEntry>& { return entries_; }
    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    void clear() { entries_.clear(); }

    auto operator==(const ChangeJournal&) const -> bool = default;

private:
    std::vector<JournalEntry> entries_;
};

}  // namespace bimcollab
