// Fuzz target for load_config() — arbitrary JSON must either yield a
// valid config or raise CollabError{invalid_config}.

#include <bimcollab/config.hpp>
#include <bimcollab/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return 0;

    try {
        auto config = bimcollab::load_config(j);
        // Anything load_config() returns must pass validation again.
        bimcollab::validate(config);
    } catch (const bimcollab::CollabError& e) {
        if (e.kind() != bimcollab::ErrorKind::invalid_config) std::abort();
    }
    return 0;
}
