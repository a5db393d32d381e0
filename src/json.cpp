#include <bimcollab/json.hpp>

#include "compression.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace bimcollab {

namespace {

template <typename T>
auto optional_to_json(const std::optional<T>& value) -> nlohmann::json {
    if (!value) return nullptr;
    return nlohmann::json(*value);
}

auto as_bytes(std::string_view text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const PropertyValue& value) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
    }, value);
}

void from_json(const nlohmann::json& j, PropertyValue& value) {
    if (j.is_null()) {
        value = Null{};
    } else if (j.is_boolean()) {
        value = j.get<bool>();
    } else if (j.is_number_integer()) {
        // Unsigned values beyond int64 range fall through to double.
        if (j.is_number_unsigned() &&
            j.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
            value = j.get<double>();
        } else {
            value = j.get<std::int64_t>();
        }
    } else if (j.is_number_float()) {
        value = j.get<double>();
    } else if (j.is_string()) {
        value = j.get<std::string>();
    } else {
        throw std::runtime_error{"cannot convert JSON to PropertyValue"};
    }
}

auto properties_to_json(const PropertyMap& props) -> nlohmann::json {
    auto j = nlohmann::json::object();
    for (const auto& [key, value] : props) {
        j[key] = value;
    }
    return j;
}

auto properties_from_json(const nlohmann::json& j) -> PropertyMap {
    if (!j.is_object()) {
        throw std::runtime_error{"property map must be a JSON object"};
    }
    auto props = PropertyMap{};
    for (const auto& [key, value] : j.items()) {
        props.emplace(key, value.get<PropertyValue>());
    }
    return props;
}

auto format_timestamp(Timestamp t) -> std::string {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch());
    auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto millis = (since_epoch - seconds).count();

    const auto raw = static_cast<std::time_t>(seconds.count());
    auto utc = std::tm{};
    ::gmtime_r(&raw, &utc);

    char buffer[32];
    const auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char full[40];
    std::snprintf(full, sizeof(full), "%.*s.%03lldZ", static_cast<int>(len), buffer,
                  static_cast<long long>(millis));
    return full;
}

void to_json(nlohmann::json& j, const Change& change) {
    j = nlohmann::json{
        {"change_id", change.change_id},
        {"user_id", change.user_id},
        {"timestamp", format_timestamp(change.timestamp)},
        {"change_type", to_string_view(change.change_type)},
        {"element_id", change.element_id},
        {"element_type", change.element_type},
        {"old_value", change.old_value ? properties_to_json(*change.old_value)
                                       : nlohmann::json(nullptr)},
        {"new_value", properties_to_json(change.new_value)},
        {"description", change.description},
        {"metadata", properties_to_json(change.metadata)},
    };
}

void to_json(nlohmann::json& j, const JournalEntry& entry) {
    to_json(j, entry.change);
    j["status"] = to_string_view(entry.status);
}

void to_json(nlohmann::json& j, const Conflict& conflict) {
    j = nlohmann::json{
        {"conflict_id", conflict.conflict_id},
        {"element_id", conflict.element_id},
        {"user_id_1", conflict.user_id_1},
        {"user_id_2", conflict.user_id_2},
        {"conflict_type", conflict.conflict_type},
        {"severity", conflict.severity},
        {"change_1", conflict.change_1},
        {"change_2", conflict.change_2},
        {"resolution", conflict.resolution
                           ? nlohmann::json(to_string_view(*conflict.resolution))
                           : nlohmann::json(nullptr)},
        {"resolved_by", optional_to_json(conflict.resolved_by)},
        {"resolved_at", conflict.resolved_at
                            ? nlohmann::json(format_timestamp(*conflict.resolved_at))
                            : nlohmann::json(nullptr)},
    };
}

void to_json(nlohmann::json& j, const Version& version) {
    j = nlohmann::json{
        {"version_id", version.version_id},
        {"version_number", version.version_number},
        {"timestamp", format_timestamp(version.timestamp)},
        {"user_id", version.user_id},
        {"description", version.description},
        {"change_count", version.changes.size()},
        {"changes", version.changes},
        {"parent_version", optional_to_json(version.parent_version)},
        {"tags", version.tags},
    };
}

void to_json(nlohmann::json& j, const User& user) {
    auto permissions = nlohmann::json::array();
    for (auto p : user.permissions) {
        permissions.push_back(std::string{to_string_view(p)});
    }
    j = nlohmann::json{
        {"user_id", user.user_id},
        {"username", user.username},
        {"email", user.email},
        {"role", to_string_view(user.role)},
        {"permissions", std::move(permissions)},
        {"last_active", format_timestamp(user.last_active)},
    };
}

void to_json(nlohmann::json& j, const SessionStatus& status) {
    auto users = nlohmann::json::array();
    for (const auto& u : status.users) {
        users.push_back({
            {"user_id", u.user_id},
            {"username", u.username},
            {"role", to_string_view(u.role)},
            {"last_active", format_timestamp(u.last_active)},
        });
    }
    j = nlohmann::json{
        {"session_id", status.session_id},
        {"model_id", status.model_id},
        {"user_count", status.user_count},
        {"active_changes", status.active_change_count},
        {"conflicts", status.conflict_count},
        {"unresolved_conflicts", status.unresolved_conflict_count},
        {"versions", status.version_count},
        {"created_at", format_timestamp(status.created_at)},
        {"last_activity", format_timestamp(status.last_activity)},
        {"users", std::move(users)},
    };
}

void to_json(nlohmann::json& j, const Session& session) {
    auto users = nlohmann::json::array();
    for (const auto& [id, user] : session.users) {
        users.push_back(nlohmann::json(user));
    }
    j = nlohmann::json{
        {"session_id", session.session_id},
        {"model_id", session.model_id},
        {"created_at", format_timestamp(session.created_at)},
        {"last_activity", format_timestamp(session.last_activity)},
        {"parent_session", optional_to_json(session.parent_session)},
        {"name", session.name},
        {"description", session.description},
        {"users", std::move(users)},
        {"changes", session.journal.entries()},
        {"conflicts", session.conflicts},
        {"versions", session.versions},
    };
}

// =============================================================================
// Session export
// =============================================================================

auto export_session(const Engine& engine, const std::string& session_id,
                    const std::string& user_id) -> nlohmann::json {
    return nlohmann::json(engine.snapshot(session_id, user_id));
}

auto export_archive(const Engine& engine, const std::string& session_id,
                    const std::string& user_id) -> std::vector<std::byte> {
    const auto text = export_session(engine, session_id, user_id).dump();
    auto compressed = detail::deflate_compress(as_bytes(text));
    if (!compressed) {
        throw std::runtime_error{"failed to compress session archive"};
    }
    return std::move(*compressed);
}

auto read_archive(std::span<const std::byte> archive) -> std::optional<nlohmann::json> {
    auto raw = detail::deflate_decompress(archive);
    if (!raw) return std::nullopt;

    const auto text = std::string_view{reinterpret_cast<const char*>(raw->data()), raw->size()};
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return std::nullopt;
    return j;
}

}  // namespace bimcollab
