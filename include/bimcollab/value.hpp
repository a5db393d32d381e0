/// @file value.hpp
/// @brief Opaque element property values carried by changes.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace bimcollab {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A closed set of primitive values an element property may hold.
///
/// The engine never interprets these beyond copying and shallow merge;
/// the authoritative model storage is owned by the enclosing service.
using PropertyValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

/// A flat key-value snapshot of element state, e.g. {"height": 10}.
using PropertyMap = std::map<std::string, PropertyValue, std::less<>>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { printf("%s\n", s.c_str()); },
///     [](auto&&) { printf("other\n"); },
/// }, some_value);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed property from a map, or nullopt on a missing key or
/// type mismatch.
/// @code
/// auto height = get_property<std::int64_t>(change.new_value, "height");
/// @endcode
template <typename T>
auto get_property(const PropertyMap& props, std::string_view key) -> std::optional<T> {
    auto it = props.find(key);
    if (it == props.end()) return std::nullopt;
    if (const auto* t = std::get_if<T>(&it->second)) {
        return *t;
    }
    return std::nullopt;
}

/// Shallow merge: keys of `overlay` replace keys of `base` on collision.
inline auto shallow_merge(PropertyMap base, const PropertyMap& overlay) -> PropertyMap {
    for (const auto& [key, value] : overlay) {
        base.insert_or_assign(key, value);
    }
    return base;
}

}  // namespace bimcollab
