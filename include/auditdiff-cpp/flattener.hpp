/// @file flattener.hpp
/// @brief Flattener: converts a snapshot into leaf-level Elements.

#pragma once

#include <auditdiff-cpp/element.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace auditdiff_cpp {

/// Turns one snapshot into a sequence of leaf Elements tagged with an event.
///
/// Implementations must emit one Element per leaf with metadata.fqdn set
/// to the structural path. When ignore_collection_order is true, members
/// of collections must not carry their index in the fqdn, and members with
/// identifier fields must carry them in metadata.identifiers.
class Flattener {
public:
    virtual ~Flattener() = default;

    /// @param node The snapshot.
    /// @param event_type created (fills updated_value) or deleted
    ///   (fills previous_value).
    /// @param root_type_name Leading fqdn segment.
    /// @param ignore_collection_order Match collection members by identity
    ///   or value instead of position.
    /// @param identifier_field_names Fields identifying a collection member.
    virtual auto flatten(const nlohmann::json& node,
                         EventType event_type,
                         std::string_view root_type_name,
                         bool ignore_collection_order,
                         const std::vector<std::string>& identifier_field_names) const
        -> std::vector<Element> = 0;
};

/// Flattener over nlohmann::json documents.
///
/// Paths are dot-separated starting at the root type name:
/// - object member `k` appends `.k` and names its leaves `k`;
/// - array members inherit the array's name and append `[i]`, or, when
///   order is ignored, `[f=v,...]` for objects with identifier fields
///   (`v` is the field's JSON text, so `1` and `"1"` differ) and `[]` for
///   everything else;
/// - `\`, `.`, `[`, `]`, `,` and `=` inside keys and identifier text are
///   escaped with a backslash, so distinct fields never share a path;
/// - scalars and JSON null are leaves; empty objects and arrays are leaves
///   holding ObjType::map / ObjType::list.
///
/// @code
/// // {"items": [{"id": 1, "v": "a"}]}, order ignored, fields {"id"}
/// //   Order.items[id=1].id  name=id  identifiers={id: 1}
/// //   Order.items[id=1].v   name=v   identifiers={id: 1}
/// // {"a.b": 1, "a": {"b": 2}}
/// //   Order.a\.b  name=a.b
/// //   Order.a.b   name=b
/// @endcode
class JsonFlattener final : public Flattener {
public:
    /// @throws DiffError (invalid_argument) for EventType::updated.
    auto flatten(const nlohmann::json& node,
                 EventType event_type,
                 std::string_view root_type_name,
                 bool ignore_collection_order,
                 const std::vector<std::string>& identifier_field_names) const
        -> std::vector<Element> override;
};

}  // namespace auditdiff_cpp
