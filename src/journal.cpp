#include <bimcollab/journal.hpp>

#include <algorithm>
#include <utility>

namespace bimcollab {

void ChangeJournal::append(Change change, ChangeStatus status) {
    entries_.push_back(JournalEntry{.change = std::move(change), .status = status});
}

auto ChangeJournal::find(std::string_view change_id) -> JournalEntry* {
    auto it = std::ranges::find_if(entries_, [&](const JournalEntry& e) {
        return e.change.change_id == change_id;
    });
    return it == entries_.end() ? nullptr : &*it;
}

auto ChangeJournal::find(std::string_view change_id) const -> const JournalEntry* {
    auto it = std::ranges::find_if(entries_, [&](const JournalEntry& e) {
        return e.change.change_id == change_id;
    });
    return it == entries_.end() ? nullptr : &*it;
}

auto ChangeJournal::erase(std::string_view change_id) -> bool {
    return std::erase_if(entries_, [&](const JournalEntry& e) {
        return e.change.change_id == change_id;
    }) > 0;
}

auto ChangeJournal::set_status(std::string_view change_id, ChangeStatus status) -> bool {
    auto* entry = find(change_id);
    if (!entry) return false;
    entry->status = status;
    return true;
}

auto ChangeJournal::applied_count() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(entries_, [](const JournalEntry& e) {
        return e.status == ChangeStatus::applied;
    }));
}

auto ChangeJournal::changes() const -> std::vector<Change> {
    auto result = std::vector<Change>{};
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.change);
    }
    return result;
}

auto ChangeJournal::take_settled() -> std::vector<Change> {
    auto result = std::vector<Change>{};
    auto kept = std::vector<JournalEntry>{};
    for (auto& entry : entries_) {
        if (entry.status == ChangeStatus::pending) {
            kept.push_back(std::move(entry));
        } else {
            result.push_back(std::move(entry.change));
        }
    }
    entries_ = std::move(kept);
    return result;
}

}  // namespace bimcollab
