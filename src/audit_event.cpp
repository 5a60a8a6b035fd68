#include <auditdiff-cpp/audit_event.hpp>
#include <auditdiff-cpp/error.hpp>
#include <auditdiff-cpp/json.hpp>

#include <algorithm>
#include <utility>

namespace auditdiff_cpp {

namespace {

template <typename T>
auto optional_field(const nlohmann::json& j, const char* key) -> std::optional<T> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

auto required_field(const nlohmann::json& j, const char* key) -> const nlohmann::json& {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw DiffError{ErrorKind::parse_error, std::string{"audit event is missing '"} + key + "'"};
    }
    return *it;
}

}  // anonymous namespace

auto summarize_event_type(const std::vector<Element>& changes) -> EventType {
    if (changes.empty()) return EventType::updated;
    if (std::ranges::all_of(changes, is_creation)) return EventType::created;
    if (std::ranges::all_of(changes, is_deletion)) return EventType::deleted;
    return EventType::updated;
}

auto make_audit_event(std::string id,
                      std::string application_name,
                      std::int64_t timestamp,
                      EventSource source,
                      std::vector<Element> changes) -> AuditEvent {
    auto event = AuditEvent{};
    event.id = std::move(id);
    event.application_name = std::move(application_name);
    event.timestamp = timestamp;
    event.type = summarize_event_type(changes);
    event.source = std::move(source);
    event.elements = std::move(changes);
    return event;
}

// =============================================================================
// JSON mapping
// =============================================================================

void to_json(nlohmann::json& j, EventSourceType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const nlohmann::json& j, EventSourceType& type) {
    auto name = j.is_string() ? j.get<std::string>() : std::string{};
    if (name == to_string_view(EventSourceType::user)) {
        type = EventSourceType::user;
    } else if (name == to_string_view(EventSourceType::system)) {
        type = EventSourceType::system;
    } else {
        throw DiffError{ErrorKind::parse_error, "unknown event source type: " + j.dump()};
    }
}

void to_json(nlohmann::json& j, const EventSourceMetadata& m) {
    j = nlohmann::json::object();
    if (m.id) j["id"] = *m.id;
    if (m.email) j["email"] = *m.email;
    if (m.name) j["name"] = *m.name;
}

void from_json(const nlohmann::json& j, EventSourceMetadata& m) {
    m.id = optional_field<std::string>(j, "id");
    m.email = optional_field<std::string>(j, "email");
    m.name = optional_field<std::string>(j, "name");
}

void to_json(nlohmann::json& j, const EventSource& s) {
    j = nlohmann::json{{"type", s.type}, {"metadata", s.metadata}};
}

void from_json(const nlohmann::json& j, EventSource& s) {
    from_json(required_field(j, "type"), s.type);
    s.metadata = optional_field<EventSourceMetadata>(j, "metadata").value_or(EventSourceMetadata{});
}

void to_json(nlohmann::json& j, const AuditEvent& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"applicationName", e.application_name},
        {"timestamp", e.timestamp},
        {"type", e.type},
        {"source", e.source},
        {"elements", e.elements},
    };
    if (e.sub_type) j["subType"] = *e.sub_type;
    if (e.metadata) j["metadata"] = *e.metadata;
}

void from_json(const nlohmann::json& j, AuditEvent& e) {
    if (!j.is_object()) {
        throw DiffError{ErrorKind::parse_error, "audit event must be a JSON object"};
    }
    try {
        e = AuditEvent{};
        e.id = required_field(j, "id").get<std::string>();
        e.application_name = required_field(j, "applicationName").get<std::string>();
        e.timestamp = required_field(j, "timestamp").get<std::int64_t>();
        from_json(required_field(j, "type"), e.type);
        from_json(required_field(j, "source"), e.source);
        e.elements = optional_field<std::vector<Element>>(j, "elements").value_or(std::vector<Element>{});
        e.sub_type = optional_field<std::string>(j, "subType");
        e.metadata = optional_field<std::map<std::string, std::string>>(j, "metadata");
    } catch (const nlohmann::json::exception& ex) {
        throw DiffError{ErrorKind::parse_error, ex.what()};
    }
}

}  // namespace auditdiff_cpp
