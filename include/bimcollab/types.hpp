/// @file types.hpp
/// @brief Core enumerations and time types shared across the engine.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace bimcollab {

/// Wall clock used for change, conflict and version timestamps.
using Clock = std::chrono::system_clock;

/// A point in time as recorded by the engine.
using Timestamp = Clock::time_point;

/// Source of the current time. Injectable so tests can control the
/// conflict window.
using ClockFn = std::function<Timestamp()>;

/// The role a user holds within a session. Determines the user's
/// capability set, see permissions_for_role().
enum class Role : std::uint8_t {
    owner,
    admin,
    editor,
    viewer,
    reviewer,
};

constexpr auto to_string_view(Role role) noexcept -> std::string_view {
    switch (role) {
        case Role::owner:    return "owner";
        case Role::admin:    return "admin";
        case Role::editor:   return "editor";
        case Role::viewer:   return "viewer";
        case Role::reviewer: return "reviewer";
    }
    return "unknown";
}

/// Parse a role name as produced by to_string_view(Role).
constexpr auto parse_role(std::string_view name) noexcept -> std::optional<Role> {
    if (name == "owner")    return Role::owner;
    if (name == "admin")    return Role::admin;
    if (name == "editor")   return Role::editor;
    if (name == "viewer")   return Role::viewer;
    if (name == "reviewer") return Role::reviewer;
    return std::nullopt;
}

/// The kind of mutation a change proposes for an element.
enum class ChangeType : std::uint8_t {
    create,           ///< A new element is added to the model.
    update,           ///< An element is replaced wholesale.
    del,              ///< An element is removed.
    move,             ///< An element is relocated.
    resize,           ///< An element's extents change.
    property_change,  ///< One or more element properties change.
};

constexpr auto to_string_view(ChangeType type) noexcept -> std::string_view {
    switch (type) {
        case ChangeType::create:          return "create";
        case ChangeType::update:          return "update";
        case ChangeType::del:             return "delete";
        case ChangeType::move:            return "move";
        case ChangeType::resize:          return "resize";
        case ChangeType::property_change: return "property_change";
    }
    return "unknown";
}

/// Strategy used to settle a conflict between two changes.
enum class Resolution : std::uint8_t {
    manual,            ///< Mark settled; the final value is supplied out-of-band.
    automatic,         ///< Currently behaves like last_writer_wins.
    last_writer_wins,  ///< Keep the change with the later timestamp.
    merge,             ///< Shallow-merge both new values into one change.
    reject,            ///< Apply neither change.
};

constexpr auto to_string_view(Resolution resolution) noexcept -> std::string_view {
    switch (resolution) {
        case Resolution::manual:           return "manual";
        case Resolution::automatic:        return "automatic";
        case Resolution::last_writer_wins: return "last_writer_wins";
        case Resolution::merge:            return "merge";
        case Resolution::reject:           return "reject";
    }
    return "unknown";
}

/// Processing state of a change held in the active journal.
enum class ChangeStatus : std::uint8_t {
    pending,     ///< Enqueued, not yet seen by the change processor.
    applied,     ///< Processed without conflict, or won a resolution.
    conflicted,  ///< Waiting on the resolution of at least one conflict.
};

constexpr auto to_string_view(ChangeStatus status) noexcept -> std::string_view {
    switch (status) {
        case ChangeStatus::pending:    return "pending";
        case ChangeStatus::applied:    return "applied";
        case ChangeStatus::conflicted: return "conflicted";
    }
    return "unknown";
}

}  // namespace bimcollab
