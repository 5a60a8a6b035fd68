/// @file element.hpp
/// @brief Change records: EventType, ElementMetadata, and Element.

#pragma once

#include <auditdiff-cpp/value.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace auditdiff_cpp {

/// The flattening event an Element originates from.
///
/// An UPDATED record is never produced by flattening; it is synthesized
/// by pairing a DELETED and a CREATED element at the same path.
enum class EventType : std::uint8_t {
    created,
    updated,
    deleted,
};

/// Convert an EventType to its wire representation ("CREATED", ...).
constexpr auto to_string_view(EventType type) noexcept -> std::string_view {
    switch (type) {
        case EventType::created: return "CREATED";
        case EventType::updated: return "UPDATED";
        case EventType::deleted: return "DELETED";
    }
    return "unknown";
}

/// Parse the wire representation of an EventType.
/// @return nullopt for unknown names.
auto parse_event_type(std::string_view name) -> std::optional<EventType>;

/// Identifier field name -> rendered identifier value.
using Identifiers = std::map<std::string, std::string>;

/// Structural location of an Element.
struct ElementMetadata {
    /// Fully-qualified structural path (e.g. "order.items[].sku").
    /// Elements sharing an fqdn are compared against each other.
    std::optional<std::string> fqdn;
    /// Identifier fields of the enclosing collection member, if any.
    std::optional<Identifiers> identifiers;

    auto operator==(const ElementMetadata&) const -> bool = default;
};

/// An atomic before/after record for one field position.
///
/// Only previous_value set: a deletion. Only updated_value set: a creation.
/// Both set: a resolved update.
struct Element {
    std::optional<std::string> name;
    std::optional<Value> previous_value;
    std::optional<Value> updated_value;
    ElementMetadata metadata;

    auto operator==(const Element&) const -> bool = default;
};

inline auto is_creation(const Element& e) -> bool {
    return !e.previous_value && e.updated_value;
}

inline auto is_deletion(const Element& e) -> bool {
    return e.previous_value && !e.updated_value;
}

inline auto is_update(const Element& e) -> bool {
    return e.previous_value && e.updated_value;
}

}  // namespace auditdiff_cpp
