/// @file json.hpp
/// @brief nlohmann/json interoperability for bimcollab.
///
/// Provides ADL serialization (to_json/from_json) for the engine's value
/// types and session export, plain or DEFLATE-compressed.

#pragma once

#include <bimcollab/change.hpp>
#include <bimcollab/conflict.hpp>
#include <bimcollab/engine.hpp>
#include <bimcollab/journal.hpp>
#include <bimcollab/session.hpp>
#include <bimcollab/types.hpp>
#include <bimcollab/value.hpp>
#include <bimcollab/version.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bimcollab {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const PropertyValue& value);

/// @throws std::runtime_error for arrays and objects, which are not
///   valid property values.
void from_json(const nlohmann::json& j, PropertyValue& value);

/// Property maps are plain JSON objects.
auto properties_to_json(const PropertyMap& props) -> nlohmann::json;

/// @throws std::runtime_error if `j` is not an object of scalars.
auto properties_from_json(const nlohmann::json& j) -> PropertyMap;

/// ISO-8601 UTC with milliseconds, e.g. "2024-02-15T12:30:00.250Z".
auto format_timestamp(Timestamp t) -> std::string;

void to_json(nlohmann::json& j, const Change& change);
void to_json(nlohmann::json& j, const JournalEntry& entry);
void to_json(nlohmann::json& j, const Conflict& conflict);
void to_json(nlohmann::json& j, const Version& version);
void to_json(nlohmann::json& j, const User& user);
void to_json(nlohmann::json& j, const SessionStatus& status);
void to_json(nlohmann::json& j, const Session& session);

// =============================================================================
// Session export
// =============================================================================

/// Export a session's users, active changes, conflicts and versions.
/// @throws CollabError{session_not_found, user_not_in_session, permission_denied}
auto export_session(const Engine& engine, const std::string& session_id,
                    const std::string& user_id) -> nlohmann::json;

/// export_session() serialized and compressed with raw DEFLATE.
/// @throws CollabError as export_session()
auto export_archive(const Engine& engine, const std::string& session_id,
                    const std::string& user_id) -> std::vector<std::byte>;

/// Decompress and parse an archive produced by export_archive().
/// @return The exported document, or nullopt if the data is corrupt.
auto read_archive(std::span<const std::byte> archive) -> std::optional<nlohmann::json>;

}  // namespace bimcollab
