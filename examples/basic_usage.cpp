// basic_usage — demonstrates the core auditdiff-cpp API
//
// Shows a plain field update, created/deleted snapshots, order-independent
// collections with identifier fields and duplicates, and wrapping the
// result in an AuditEvent.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <auditdiff-cpp/auditdiff.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace ad = auditdiff_cpp;
using json = nlohmann::json;

static void print_changes(const char* title, const std::vector<ad::Element>& changes) {
    std::printf("\n=== %s (%zu) ===\n", title, changes.size());
    for (const auto& c : changes) {
        std::printf("  %-28s %-8s %s -> %s\n",
                    c.metadata.fqdn.value_or("?").c_str(),
                    c.name.value_or("?").c_str(),
                    c.previous_value ? ad::to_string(*c.previous_value).c_str() : "(none)",
                    c.updated_value ? ad::to_string(*c.updated_value).c_str() : "(none)");
    }
}

int main() {
    // -- A single changed field -----------------------------------------------
    auto checker = ad::DiffChecker{ad::DiffConfig{}};
    auto person = checker.diff(
        json{{"name", "Alice"}, {"age", 30}},
        json{{"name", "Alice"}, {"age", 31}},
        "Person");
    print_changes("Person update", person);
    if (auto age = ad::get_scalar<std::int64_t>(person.at(0).updated_value)) {
        std::printf("  new age as int64: %lld\n", static_cast<long long>(*age));
    }

    // -- One side absent: everything created / deleted ------------------------
    print_changes("Person created", checker.diff(std::nullopt, json{{"name", "Bob"}}, "Person"));
    print_changes("Person deleted", checker.diff(json{{"name", "Bob"}}, std::nullopt, "Person"));

    // -- Order-independent collections ----------------------------------------
    auto config = ad::DiffConfig{};
    config.ignore_collection_order.enabled = true;
    config.ignore_collection_order.fields = {"id"};
    auto unordered = ad::DiffChecker{config};

    auto before = json{
        {"items", {{{"id", 1}, {"v", "a"}}, {{"id", 2}, {"v", "b"}}}},
        {"tags", {"x", "x", "y"}},
    };
    auto after = json{
        {"items", {{{"id", 2}, {"v", "b"}}, {{"id", 1}, {"v", "c"}}}},
        {"tags", {"x", "y", "y"}},
    };
    auto changes = unordered.diff(before, after, "Order");
    print_changes("Order, order ignored", changes);

    // -- Audit event envelope -------------------------------------------------
    auto source = ad::EventSource{};
    source.type = ad::EventSourceType::user;
    source.metadata.email = "alice@example.com";
    auto event = ad::make_audit_event("evt-1", "orders", 1708000000000, source, changes);
    std::printf("\n=== Audit event ===\n%s\n", json(event).dump(2).c_str());

    return 0;
}
