/// @file change.hpp
/// @brief Change type: one proposed mutation to one model element.

#pragma once

#include <bimcollab/types.hpp>
#include <bimcollab/value.hpp>

#include <optional>
#include <string>

namespace bimcollab {

/// A single proposed mutation authored by one user.
///
/// Changes are immutable once created. They live in a session's active
/// journal until they are folded into a Version or discarded by a
/// conflict resolution. Two changes conflict when they target the same
/// element, come from different users and lie within the conflict window
/// of each other (see changes_conflict()).
struct Change {
    std::string change_id;                  ///< Unique change identifier.
    std::string user_id;                    ///< Author. Merged changes use "a+b".
    Timestamp timestamp{};                  ///< When the change was made.
    ChangeType change_type{ChangeType::update};
    std::string element_id;                 ///< Target element, e.g. "wall_1".
    std::string element_type;               ///< Element kind, e.g. "wall".
    std::optional<PropertyMap> old_value;   ///< Prior state, when known.
    PropertyMap new_value;                  ///< Proposed state.
    std::string description;                ///< Free-text summary.
    PropertyMap metadata;                   ///< Opaque client annotations.

    auto operator==(const Change&) const -> bool = default;
};

}  // namespace bimcollab
