/// @file audit_event.hpp
/// @brief AuditEvent: the envelope in which change records are published.

#pragma once

#include <auditdiff-cpp/element.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditdiff_cpp {

/// Who caused the audited change.
enum class EventSourceType : std::uint8_t {
    user,
    system,
};

/// Convert an EventSourceType to its wire representation ("USER", "SYSTEM").
constexpr auto to_string_view(EventSourceType type) noexcept -> std::string_view {
    switch (type) {
        case EventSourceType::user:   return "USER";
        case EventSourceType::system: return "SYSTEM";
    }
    return "unknown";
}

struct EventSourceMetadata {
    std::optional<std::string> id;
    std::optional<std::string> email;
    std::optional<std::string> name;

    auto operator==(const EventSourceMetadata&) const -> bool = default;
};

struct EventSource {
    EventSourceType type{EventSourceType::system};
    EventSourceMetadata metadata;

    auto operator==(const EventSource&) const -> bool = default;
};

/// One audit event: a set of change records plus who/when/where.
struct AuditEvent {
    std::string id;
    std::string application_name;
    std::int64_t timestamp{0};  ///< Milliseconds since Unix epoch.
    EventType type{EventType::updated};
    EventSource source;
    std::vector<Element> elements;
    std::optional<std::string> sub_type;
    std::optional<std::map<std::string, std::string>> metadata;

    auto operator==(const AuditEvent&) const -> bool = default;
};

/// The event type summarizing a set of changes: CREATED when every record
/// is a creation, DELETED when every record is a deletion, else UPDATED.
auto summarize_event_type(const std::vector<Element>& changes) -> EventType;

/// Wrap diff output in an AuditEvent, deriving its type from the changes.
auto make_audit_event(std::string id,
                      std::string application_name,
                      std::int64_t timestamp,
                      EventSource source,
                      std::vector<Element> changes) -> AuditEvent;

void to_json(nlohmann::json& j, EventSourceType type);
/// @throws DiffError (parse_error) for unknown names.
void from_json(const nlohmann::json& j, EventSourceType& type);

void to_json(nlohmann::json& j, const EventSourceMetadata& m);
void from_json(const nlohmann::json& j, EventSourceMetadata& m);

void to_json(nlohmann::json& j, const EventSource& s);
void from_json(const nlohmann::json& j, EventSource& s);

/// Keys: id, applicationName, timestamp, type, source, elements, subType,
/// metadata.
void to_json(nlohmann::json& j, const AuditEvent& e);
/// @throws DiffError (parse_error) when a required key is missing.
void from_json(const nlohmann::json& j, AuditEvent& e);

}  // namespace auditdiff_cpp
