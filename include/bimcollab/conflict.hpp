/// @file conflict.hpp
/// @brief Conflict records, the conflict detector and the resolver.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/journal.hpp>
#include <bimcollab/types.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bimcollab {

/// Default width of the window in which two edits are considered concurrent.
inline constexpr auto default_conflict_window = std::chrono::seconds{300};

/// Two changes by different users that touch the same element within
/// the conflict window.
///
/// A conflict is terminal once `resolution` is set. Resolved conflicts
/// stay in the session for audit but drop out of the unresolved list.
struct Conflict {
    std::string conflict_id;
    std::string element_id;
    std::string user_id_1;                 ///< Author of change_1.
    std::string user_id_2;                 ///< Author of change_2.
    Change change_1;                       ///< The change already in the journal.
    Change change_2;                       ///< The change being checked.
    std::string conflict_type{"element_modification"};
    double severity{0.8};                  ///< 0.0 to 1.0.
    std::optional<Resolution> resolution;
    std::optional<std::string> resolved_by;
    std::optional<Timestamp> resolved_at;

    auto is_resolved() const -> bool { return resolution.has_value(); }

    /// True if this conflict is between the two given changes, in either order.
    auto involves(std::string_view a, std::string_view b) const -> bool {
        return (change_1.change_id == a && change_2.change_id == b) ||
               (change_1.change_id == b && change_2.change_id == a);
    }

    auto operator==(const Conflict&) const -> bool = default;
};

// -- Detection ----------------------------------------------------------------

/// The conflict predicate: same element, different authors, and
/// |a.timestamp - b.timestamp| strictly below `window`.
auto changes_conflict(const Change& a, const Change& b,
                      std::chrono::seconds window = default_conflict_window) -> bool;

/// Every change in `journal` (other than `change` itself) that conflicts
/// with `change`, in journal order.
auto detect_conflicts(const ChangeJournal& journal, const Change& change,
                      std::chrono::seconds window = default_conflict_window)
    -> std::vector<const Change*>;

/// Build an unresolved conflict record for a detected pair.
auto make_conflict(std::string conflict_id, const Change& existing,
                   const Change& incoming, double severity) -> Conflict;

// -- Resolution ---------------------------------------------------------------

/// Of two changes, the one that wins last-writer-wins. Ties go to `second`.
auto later_of(const Change& first, const Change& second) -> const Change&;

/// Shallow-merge two changes into one synthetic change.
///
/// The chronologically earlier change supplies element, type and
/// old value; the later change's keys win on collision. The author is
/// "{earlier}+{later}".
auto merge_changes(const Change& a, const Change& b,
                   std::string merged_id, Timestamp now) -> Change;

/// merge_changes() generalised to any number of changes to one element.
/// Changes are folded oldest first; equal timestamps keep input order.
/// `changes` must not be empty.
auto merge_change_set(std::vector<Change> changes,
                      std::string merged_id, Timestamp now) -> Change;

/// What a resolution strategy does to a pair of changes.
struct ResolutionOutcome {
    std::optional<Change> applied;         ///< The change to apply, if any.
    std::vector<std::string> discarded;    ///< Change ids to drop from the journal.
    bool synthesized{false};               ///< `applied` is a new merged change.
};

/// Decide the outcome of settling `conflict` with `strategy`.
/// Pure: the session is not touched. `merged_id` and `now` are only used
/// by Resolution::merge.
auto resolve_pair(const Conflict& conflict, Resolution strategy,
                  std::string merged_id, Timestamp now) -> ResolutionOutcome;

/// Apply an outcome to a journal: drop the discarded changes and mark
/// (or append) the applied change as applied.
void apply_outcome(ChangeJournal& journal, const ResolutionOutcome& outcome);

/// Stamp `conflict` as settled.
void mark_resolved(Conflict& conflict, Resolution strategy,
                   std::string resolved_by, Timestamp now);

}  // namespace bimcollab
