#include <auditdiff-cpp/audit_event.hpp>
#include <auditdiff-cpp/error.hpp>
#include <auditdiff-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ad = auditdiff_cpp;
using json = nlohmann::json;

namespace {

auto change(bool previous, bool updated) -> ad::Element {
    auto e = ad::Element{};
    e.name = "status";
    if (previous) e.previous_value = ad::Value{ad::ScalarValue{std::string{"open"}}};
    if (updated) e.updated_value = ad::Value{ad::ScalarValue{std::string{"closed"}}};
    e.metadata.fqdn = "Ticket.status";
    return e;
}

auto user_source() -> ad::EventSource {
    auto source = ad::EventSource{};
    source.type = ad::EventSourceType::user;
    source.metadata.id = "u-17";
    source.metadata.email = "ops@example.com";
    return source;
}

}  // namespace

// -- summarize_event_type -----------------------------------------------------

TEST(SummarizeEventType, all_creations_is_created) {
    EXPECT_EQ(ad::summarize_event_type({change(false, true), change(false, true)}),
              ad::EventType::created);
}

TEST(SummarizeEventType, all_deletions_is_deleted) {
    EXPECT_EQ(ad::summarize_event_type({change(true, false)}), ad::EventType::deleted);
}

TEST(SummarizeEventType, mixed_or_update_is_updated) {
    EXPECT_EQ(ad::summarize_event_type({change(true, true)}), ad::EventType::updated);
    EXPECT_EQ(ad::summarize_event_type({change(true, false), change(false, true)}),
              ad::EventType::updated);
    EXPECT_EQ(ad::summarize_event_type({}), ad::EventType::updated);
}

// -- make_audit_event ---------------------------------------------------------

TEST(MakeAuditEvent, fills_envelope_and_derives_type) {
    auto event = ad::make_audit_event("evt-1", "billing", 1708000000000, user_source(),
                                      {change(false, true)});
    EXPECT_EQ(event.id, "evt-1");
    EXPECT_EQ(event.application_name, "billing");
    EXPECT_EQ(event.timestamp, 1708000000000);
    EXPECT_EQ(event.type, ad::EventType::created);
    EXPECT_EQ(event.source, user_source());
    ASSERT_EQ(event.elements.size(), 1u);
    EXPECT_FALSE(event.sub_type.has_value());
}

// -- JSON mapping -------------------------------------------------------------

TEST(AuditEventJson, serializes_wire_keys) {
    auto event = ad::make_audit_event("evt-2", "orders", 42, user_source(), {change(true, true)});
    event.sub_type = "status-change";
    event.metadata = std::map<std::string, std::string>{{"region", "eu"}};

    json j = event;
    EXPECT_EQ(j["id"], "evt-2");
    EXPECT_EQ(j["applicationName"], "orders");
    EXPECT_EQ(j["timestamp"], 42);
    EXPECT_EQ(j["type"], "UPDATED");
    EXPECT_EQ(j["source"]["type"], "USER");
    EXPECT_EQ(j["source"]["metadata"]["email"], "ops@example.com");
    EXPECT_FALSE(j["source"]["metadata"].contains("name"));
    EXPECT_EQ(j["subType"], "status-change");
    EXPECT_EQ(j["metadata"]["region"], "eu");
    ASSERT_EQ(j["elements"].size(), 1u);
    EXPECT_EQ(j["elements"][0]["previousValue"], "open");
    EXPECT_EQ(j["elements"][0]["metadata"]["fqdn"], "Ticket.status");
}

TEST(AuditEventJson, round_trip) {
    auto event = ad::make_audit_event("evt-3", "crm", 7, user_source(),
                                      {change(true, false), change(false, true)});
    event.sub_type = "merge";
    json j = event;
    EXPECT_EQ(j.get<ad::AuditEvent>(), event);
}

TEST(AuditEventJson, optional_sections_may_be_absent) {
    auto event = json::parse(R"({
        "id": "evt-4",
        "applicationName": "crm",
        "timestamp": 1,
        "type": "DELETED",
        "source": {"type": "SYSTEM"}
    })").get<ad::AuditEvent>();

    EXPECT_EQ(event.type, ad::EventType::deleted);
    EXPECT_EQ(event.source.type, ad::EventSourceType::system);
    EXPECT_EQ(event.source.metadata, ad::EventSourceMetadata{});
    EXPECT_TRUE(event.elements.empty());
    EXPECT_FALSE(event.metadata.has_value());
}

TEST(AuditEventJson, missing_required_key_is_parse_error) {
    try {
        (void)json::parse(R"({"id": "x", "timestamp": 1, "type": "CREATED",
                             "source": {"type": "USER"}})").get<ad::AuditEvent>();
        FAIL() << "expected DiffError";
    } catch (const ad::DiffError& e) {
        EXPECT_EQ(e.kind(), ad::ErrorKind::parse_error);
    }
}

TEST(AuditEventJson, unknown_source_type_is_parse_error) {
    EXPECT_THROW((void)json("ROBOT").get<ad::EventSourceType>(), ad::DiffError);
}

TEST(EventSourceType, to_string_view_covers_all_variants) {
    EXPECT_EQ(ad::to_string_view(ad::EventSourceType::user), "USER");
    EXPECT_EQ(ad::to_string_view(ad::EventSourceType::system), "SYSTEM");
}
