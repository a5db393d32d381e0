#include <bimcollab/conflict.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace bimcollab {

// -- Detection ----------------------------------------------------------------

auto changes_conflict(const Change& a, const Change& b, std::chrono::seconds window) -> bool {
    if (a.element_id != b.element_id) return false;
    if (a.user_id == b.user_id) return false;
    auto delta = a.timestamp > b.timestamp ? a.timestamp - b.timestamp
                                           : b.timestamp - a.timestamp;
    return delta < window;
}

auto detect_conflicts(const ChangeJournal& journal, const Change& change,
                      std::chrono::seconds window) -> std::vector<const Change*> {
    auto found = std::vector<const Change*>{};
    for (const auto& entry : journal.entries()) {
        if (entry.change.change_id == change.change_id) continue;
        if (changes_conflict(entry.change, change, window)) {
            found.push_back(&entry.change);
        }
    }
    return found;
}

auto make_conflict(std::string conflict_id, const Change& existing,
                   const Change& incoming, double severity) -> Conflict {
    return Conflict{
        .conflict_id = std::move(conflict_id),
        .element_id = incoming.element_id,
        .user_id_1 = existing.user_id,
        .user_id_2 = incoming.user_id,
        .change_1 = existing,
        .change_2 = incoming,
        .conflict_type = "element_modification",
        .severity = severity,
        .resolution = std::nullopt,
        .resolved_by = std::nullopt,
        .resolved_at = std::nullopt,
    };
}

// -- Resolution ---------------------------------------------------------------

auto later_of(const Change& first, const Change& second) -> const Change& {
    return first.timestamp > second.timestamp ? first : second;
}

auto merge_changes(const Change& a, const Change& b,
                   std::string merged_id, Timestamp now) -> Change {
    return merge_change_set({a, b}, std::move(merged_id), now);
}

auto merge_change_set(std::vector<Change> changes,
                      std::string merged_id, Timestamp now) -> Change {
    std::ranges::stable_sort(changes, {}, &Change::timestamp);

    const auto& earliest = changes.front();
    auto merged = Change{
        .change_id = std::move(merged_id),
        .user_id = earliest.user_id,
        .timestamp = now,
        .change_type = earliest.change_type,
        .element_id = earliest.element_id,
        .element_type = earliest.element_type,
        .old_value = earliest.old_value,
        .new_value = earliest.new_value,
        .description = "Merged changes from " + earliest.user_id,
        .metadata = {},
    };
    for (std::size_t i = 1; i < changes.size(); ++i) {
        merged.user_id += "+" + changes[i].user_id;
        merged.description += " and " + changes[i].user_id;
        merged.new_value = shallow_merge(std::move(merged.new_value), changes[i].new_value);
    }
    return merged;
}

auto resolve_pair(const Conflict& conflict, Resolution strategy,
                  std::string merged_id, Timestamp now) -> ResolutionOutcome {
    const auto& a = conflict.change_1;
    const auto& b = conflict.change_2;

    switch (strategy) {
        case Resolution::last_writer_wins:
        case Resolution::automatic: {
            const auto& winner = later_of(a, b);
            const auto& loser = (&winner == &a) ? b : a;
            return ResolutionOutcome{.applied = winner, .discarded = {loser.change_id}};
        }
        case Resolution::merge:
            return ResolutionOutcome{
                .applied = merge_changes(a, b, std::move(merged_id), now),
                .discarded = {a.change_id, b.change_id},
                .synthesized = true,
            };
        case Resolution::reject:
            return ResolutionOutcome{.applied = std::nullopt,
                                     .discarded = {a.change_id, b.change_id}};
        case Resolution::manual:
            break;
    }
    return ResolutionOutcome{};
}

void apply_outcome(ChangeJournal& journal, const ResolutionOutcome& outcome) {
    for (const auto& id : outcome.discarded) {
        journal.erase(id);
    }
    if (!outcome.applied) return;

    // A winner already folded into a version is no longer in the journal;
    // there is nothing left to mark.
    if (auto* entry = journal.find(outcome.applied->change_id)) {
        entry->status = ChangeStatus::applied;
    } else if (outcome.synthesized) {
        journal.append(*outcome.applied, ChangeStatus::applied);
    }
}

void mark_resolved(Conflict& conflict, Resolution strategy,
                   std::string resolved_by, Timestamp now) {
    conflict.resolution = strategy;
    conflict.resolved_by = std::move(resolved_by);
    conflict.resolved_at = now;
}

}  // namespace bimcollab
