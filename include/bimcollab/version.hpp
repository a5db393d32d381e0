/// @file version.hpp
/// @brief Immutable version snapshots of a session's journal.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bimcollab {

/// A numbered snapshot of every change that was in the active journal
/// when it was taken.
///
/// Version numbers are 1-based, strictly increasing and gapless within a
/// session. Each version points at its predecessor through
/// `parent_version`; the first version has none.
struct Version {
    std::string version_id;
    std::uint64_t version_number{0};
    Timestamp timestamp{};
    std::string user_id;                       ///< Author that triggered the snapshot.
    std::string description;
    std::vector<Change> changes;               ///< Folded changes, in journal order.
    std::optional<std::string> parent_version; ///< Previous version id.
    std::vector<std::string> tags;

    auto operator==(const Version&) const -> bool = default;
};

}  // namespace bimcollab
