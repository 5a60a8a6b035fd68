#include <auditdiff-cpp/json.hpp>
#include <auditdiff-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <variant>

namespace auditdiff_cpp {

namespace {

auto structured_leaf(const nlohmann::json& j) -> std::optional<ObjType> {
    if (j.is_object() && j.empty()) return ObjType::map;
    if (j.is_array() && j.empty()) return ObjType::list;
    return std::nullopt;
}

template <typename T>
auto optional_field(const nlohmann::json& j, const char* key) -> std::optional<T> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

}  // anonymous namespace

// =============================================================================
// Values
// =============================================================================

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_null()) {
        sv = Null{};
    } else if (j.is_boolean()) {
        sv = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        // If it fits in int64, prefer int64 so 30 and 30u compare equal
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sv = static_cast<std::int64_t>(val);
        } else {
            sv = val;
        }
    } else if (j.is_number_integer()) {
        sv = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        sv = j.get<double>();
    } else if (j.is_string()) {
        sv = j.get<std::string>();
    } else {
        throw DiffError{ErrorKind::parse_error, "cannot convert JSON to ScalarValue"};
    }
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](ObjType type) {
            j = type == ObjType::map ? nlohmann::json::object() : nlohmann::json::array();
        },
        [&](const ScalarValue& sv) { to_json(j, sv); },
    }, v);
}

void from_json(const nlohmann::json& j, Value& v) {
    if (auto type = structured_leaf(j)) {
        v = *type;
        return;
    }
    auto sv = ScalarValue{};
    from_json(j, sv);
    v = std::move(sv);
}

auto to_value(const nlohmann::json& leaf) -> Value {
    if (auto type = structured_leaf(leaf)) return Value{*type};
    if (leaf.is_structured()) {
        throw DiffError{ErrorKind::invalid_argument, "non-empty container is not a leaf"};
    }
    auto sv = ScalarValue{};
    from_json(leaf, sv);
    return Value{std::move(sv)};
}

// =============================================================================
// Change records
// =============================================================================

void to_json(nlohmann::json& j, EventType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const nlohmann::json& j, EventType& type) {
    if (!j.is_string()) {
        throw DiffError{ErrorKind::parse_error, "event type must be a string"};
    }
    auto parsed = parse_event_type(j.get<std::string>());
    if (!parsed) {
        throw DiffError{ErrorKind::parse_error, "unknown event type: " + j.get<std::string>()};
    }
    type = *parsed;
}

void to_json(nlohmann::json& j, const ElementMetadata& m) {
    j = nlohmann::json::object();
    if (m.fqdn) j["fqdn"] = *m.fqdn;
    if (m.identifiers) j["identifiers"] = *m.identifiers;
}

void from_json(const nlohmann::json& j, ElementMetadata& m) {
    m.fqdn = optional_field<std::string>(j, "fqdn");
    m.identifiers = optional_field<Identifiers>(j, "identifiers");
}

void to_json(nlohmann::json& j, const Element& e) {
    j = nlohmann::json::object();
    if (e.name) j["name"] = *e.name;
    if (e.previous_value) to_json(j["previousValue"], *e.previous_value);
    if (e.updated_value) to_json(j["updatedValue"], *e.updated_value);
    to_json(j["metadata"], e.metadata);
}

void from_json(const nlohmann::json& j, Element& e) {
    if (!j.is_object()) {
        throw DiffError{ErrorKind::parse_error, "element must be a JSON object"};
    }
    e = Element{};
    e.name = optional_field<std::string>(j, "name");
    // Presence, not nullness, decides: a JSON null is a Null value
    if (auto it = j.find("previousValue"); it != j.end()) {
        auto v = Value{};
        from_json(*it, v);
        e.previous_value = std::move(v);
    }
    if (auto it = j.find("updatedValue"); it != j.end()) {
        auto v = Value{};
        from_json(*it, v);
        e.updated_value = std::move(v);
    }
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        from_json(*it, e.metadata);
    }
}

}  // namespace auditdiff_cpp
