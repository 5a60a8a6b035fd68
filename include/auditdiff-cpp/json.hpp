/// @file json.hpp
/// @brief nlohmann/json interoperability for auditdiff-cpp.
///
/// Provides ADL serialization (to_json/from_json) for values and change
/// records, and the conversion of snapshot leaves into Values.

#pragma once

#include <auditdiff-cpp/element.hpp>
#include <auditdiff-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace auditdiff_cpp {

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

/// Structured values serialize as `{}` / `[]`.
void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

/// Convert a JSON leaf (scalar, null, empty object or array) to a Value.
/// Unsigned integers that fit in int64 become int64.
/// @throws DiffError (invalid_argument) for non-empty objects and arrays.
auto to_value(const nlohmann::json& leaf) -> Value;

// -- Change records -----------------------------------------------------------

void to_json(nlohmann::json& j, EventType type);
/// @throws DiffError (parse_error) for unknown names.
void from_json(const nlohmann::json& j, EventType& type);

/// Absent optionals are omitted.
void to_json(nlohmann::json& j, const ElementMetadata& m);
void from_json(const nlohmann::json& j, ElementMetadata& m);

/// Keys: name, previousValue, updatedValue, metadata. Absent optionals
/// are omitted; a present JSON null is a Null value.
void to_json(nlohmann::json& j, const Element& e);
void from_json(const nlohmann::json& j, Element& e);

}  // namespace auditdiff_cpp
