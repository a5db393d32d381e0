// Fuzz target for read_archive() — exercises raw DEFLATE decoding and the
// JSON parser. Any archive that decodes to an object is fed through the
// property-map reader as well.

#include <bimcollab/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto doc = bimcollab::read_archive(span);
    if (doc && doc->is_object()) {
        try {
            auto props = bimcollab::properties_from_json(*doc);
            (void)props;
        } catch (const std::exception&) {
            // Nested values are rejected; that is the expected outcome.
        }
    }
    return 0;
}
