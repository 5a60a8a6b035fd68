/// @file value.hpp
/// @brief Value types: ScalarValue, Value, ObjType, and tag types.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace auditdiff_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The kinds of structured (container) values a snapshot may hold.
///
/// A structured Value only appears for container nodes with no leaves,
/// so it carries no payload: two empty maps are equal.
enum class ObjType : std::uint8_t {
    map,   ///< A key-value object.
    list,  ///< An ordered sequence.
};

/// Convert an ObjType to its string representation.
constexpr auto to_string_view(ObjType type) noexcept -> std::string_view {
    switch (type) {
        case ObjType::map:  return "map";
        case ObjType::list: return "list";
    }
    return "unknown";
}

/// A closed set of primitive values found at snapshot leaves.
///
/// Alternatives: Null, bool, int64_t, uint64_t, double, string.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    std::uint64_t,
    double,
    std::string
>;

/// A leaf value: either a structured marker or a scalar.
///
/// Equality is structural: the alternatives must match and the payloads
/// must compare equal, so `std::int64_t{30}` and `30.0` are different values.
using Value = std::variant<ObjType, ScalarValue>;

/// Render a Value for display: strings unquoted, `null`, `{}` and `[]`.
auto to_string(const Value& v) -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](auto&&) { std::printf("other\n"); },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar from a Value, or nullopt on type mismatch.
/// @code
/// auto name = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* sv = std::get_if<ScalarValue>(&v)) {
        if (const auto* t = std::get_if<T>(sv)) {
            return *t;
        }
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<Value>.
template <typename T>
auto get_scalar(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

}  // namespace auditdiff_cpp
