/// @file config.hpp
/// @brief Engine configuration and its JSON loader.

#pragma once

#include <bimcollab/conflict.hpp>
#include <bimcollab/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace bimcollab {

/// Tunables of an Engine.
///
/// @code
/// auto config = EngineConfig{};
/// config.version_interval = 25;
/// auto engine = Engine{config};
/// @endcode
struct EngineConfig {
    /// Two edits closer than this are concurrent.
    std::chrono::seconds conflict_window{default_conflict_window};

    /// Auto-save a version once this many changes have been applied
    /// since the last version. Must be > 0.
    std::size_t version_interval{10};

    /// Severity recorded on detected conflicts, within [0, 1].
    double conflict_severity{0.8};

    /// Merges with at least this many source changes detect conflicts in
    /// parallel on the shared executor.
    std::size_t parallel_merge_threshold{64};

    /// Time source. Defaults to the system clock.
    ClockFn clock{[] { return Clock::now(); }};
};

/// Build a config from a JSON object.
///
/// Recognised keys: "conflict_window_seconds", "version_interval",
/// "conflict_severity", "parallel_merge_threshold". Missing keys keep
/// their defaults; unknown keys are ignored.
/// @throws CollabError{invalid_config} on a wrong type or out-of-range value.
auto load_config(const nlohmann::json& j) -> EngineConfig;

/// Read and parse a JSON config file.
/// @throws CollabError{invalid_config} if the file cannot be read or parsed.
auto load_config_file(const std::filesystem::path& path) -> EngineConfig;

/// Check a config for out-of-range values.
/// @throws CollabError{invalid_config}
void validate(const EngineConfig& config);

}  // namespace bimcollab
