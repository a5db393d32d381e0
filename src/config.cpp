#include <bimcollab/config.hpp>

#include <bimcollab/error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace bimcollab {

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw CollabError{ErrorKind::invalid_config, message};
}

auto read_count(const nlohmann::json& j, const char* key) -> std::size_t {
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<std::int64_t>() < 0) {
        invalid(std::string{key} + " must be a non-negative integer");
    }
    return v.get<std::size_t>();
}

}  // namespace

void validate(const EngineConfig& config) {
    if (config.conflict_window.count() <= 0) {
        invalid("conflict_window_seconds must be positive");
    }
    // Windows are compared at clock resolution.
    if (config.conflict_window > std::chrono::duration_cast<std::chrono::seconds>(
                                     Clock::duration::max())) {
        invalid("conflict_window_seconds is too large");
    }
    if (config.version_interval == 0) {
        invalid("version_interval must be positive");
    }
    if (!(config.conflict_severity >= 0.0 && config.conflict_severity <= 1.0)) {
        invalid("conflict_severity must lie within [0, 1]");
    }
    if (!config.clock) {
        invalid("clock must be set");
    }
}

auto load_config(const nlohmann::json& j) -> EngineConfig {
    if (!j.is_object()) {
        invalid("engine config must be a JSON object");
    }

    auto config = EngineConfig{};

    if (j.contains("conflict_window_seconds")) {
        config.conflict_window = std::chrono::seconds{
            static_cast<std::int64_t>(read_count(j, "conflict_window_seconds"))};
    }
    if (j.contains("version_interval")) {
        config.version_interval = read_count(j, "version_interval");
    }
    if (j.contains("conflict_severity")) {
        const auto& v = j.at("conflict_severity");
        if (!v.is_number()) invalid("conflict_severity must be a number");
        config.conflict_severity = v.get<double>();
    }
    if (j.contains("parallel_merge_threshold")) {
        config.parallel_merge_threshold = read_count(j, "parallel_merge_threshold");
    }

    validate(config);
    return config;
}

auto load_config_file(const std::filesystem::path& path) -> EngineConfig {
    auto in = std::ifstream{path};
    if (!in) {
        invalid("cannot open config file " + path.string());
    }
    try {
        return load_config(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        invalid("cannot parse config file " + path.string() + ": " + e.what());
    }
}

}  // namespace bimcollab
