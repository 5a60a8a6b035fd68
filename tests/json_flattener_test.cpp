#include <auditdiff-cpp/flattener.hpp>
#include <auditdiff-cpp/error.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace ad = auditdiff_cpp;
using json = nlohmann::json;

namespace {

const auto default_fields = std::vector<std::string>{"id"};

auto flatten(const json& node, ad::EventType type = ad::EventType::created,
             bool ignore_order = false,
             const std::vector<std::string>& fields = default_fields) -> std::vector<ad::Element> {
    return ad::JsonFlattener{}.flatten(node, type, "Order", ignore_order, fields);
}

auto find_fqdn(const std::vector<ad::Element>& elements, const std::string& fqdn)
    -> const ad::Element* {
    auto it = std::ranges::find_if(elements, [&](const ad::Element& e) {
        return e.metadata.fqdn == fqdn;
    });
    return it == elements.end() ? nullptr : &*it;
}

auto fqdns(const std::vector<ad::Element>& elements) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    for (const auto& e : elements) out.push_back(e.metadata.fqdn.value_or("<none>"));
    return out;
}

}  // namespace

// -- Objects ------------------------------------------------------------------

TEST(JsonFlattener, object_members_become_named_leaves) {
    auto elements = flatten(json{{"name", "Alice"}, {"age", 30}});
    ASSERT_EQ(elements.size(), 2u);

    const auto* age = find_fqdn(elements, "Order.age");
    ASSERT_NE(age, nullptr);
    EXPECT_EQ(age->name, "age");
    EXPECT_EQ(age->updated_value, ad::Value{ad::ScalarValue{std::int64_t{30}}});
    EXPECT_FALSE(age->previous_value.has_value());
    EXPECT_FALSE(age->metadata.identifiers.has_value());
}

TEST(JsonFlattener, deleted_event_fills_previous_value) {
    auto elements = flatten(json{{"name", "Alice"}}, ad::EventType::deleted);
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_TRUE(ad::is_deletion(elements[0]));
}

TEST(JsonFlattener, nested_objects_extend_the_path) {
    auto elements = flatten(json{{"customer", {{"address", {{"city", "Oslo"}}}}}});
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements[0].metadata.fqdn, "Order.customer.address.city");
    EXPECT_EQ(elements[0].name, "city");
}

TEST(JsonFlattener, null_is_a_leaf) {
    auto elements = flatten(json{{"note", nullptr}});
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(elements[0].updated_value, ad::Value{ad::ScalarValue{ad::Null{}}});
}

TEST(JsonFlattener, empty_containers_are_structured_leaves) {
    auto elements = flatten(json{{"attrs", json::object()}, {"tags", json::array()}});
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(find_fqdn(elements, "Order.attrs")->updated_value, ad::Value{ad::ObjType::map});
    EXPECT_EQ(find_fqdn(elements, "Order.tags")->updated_value, ad::Value{ad::ObjType::list});
}

TEST(JsonFlattener, root_scalar_is_unnamed) {
    auto elements = flatten(json("just a string"));
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_FALSE(elements[0].name.has_value());
    EXPECT_EQ(elements[0].metadata.fqdn, "Order");
}

TEST(JsonFlattener, updated_event_is_rejected) {
    try {
        (void)flatten(json{{"a", 1}}, ad::EventType::updated);
        FAIL() << "expected DiffError";
    } catch (const ad::DiffError& e) {
        EXPECT_EQ(e.kind(), ad::ErrorKind::invalid_argument);
    }
}

// -- Escaping -----------------------------------------------------------------

TEST(JsonFlattener, dotted_key_differs_from_nested_path) {
    auto elements = flatten(json{{"a.b", 1}, {"a", {{"b", 2}}}});
    ASSERT_EQ(elements.size(), 2u);

    const auto* dotted = find_fqdn(elements, "Order.a\\.b");
    ASSERT_NE(dotted, nullptr);
    EXPECT_EQ(dotted->name, "a.b");
    EXPECT_EQ(dotted->updated_value, ad::Value{ad::ScalarValue{std::int64_t{1}}});

    const auto* nested = find_fqdn(elements, "Order.a.b");
    ASSERT_NE(nested, nullptr);
    EXPECT_EQ(nested->name, "b");
}

TEST(JsonFlattener, bracketed_key_differs_from_array_member) {
    auto elements = flatten(json{{"t", {1}}, {"t[0]", 5}});
    EXPECT_NE(find_fqdn(elements, "Order.t[0]"), nullptr);
    EXPECT_NE(find_fqdn(elements, "Order.t\\[0\\]"), nullptr);
}

TEST(JsonFlattener, backslash_in_key_is_escaped) {
    auto elements = flatten(json{{"a\\", {{"b", 1}}}, {"a\\.b", 2}});
    EXPECT_NE(find_fqdn(elements, "Order.a\\\\.b"), nullptr);
    EXPECT_NE(find_fqdn(elements, "Order.a\\\\\\.b"), nullptr);
}

// -- Collections, order significant -------------------------------------------

TEST(JsonFlattener, ordered_arrays_use_indices) {
    auto elements = flatten(json{{"tags", {"x", "y"}}});
    EXPECT_EQ(fqdns(elements), (std::vector<std::string>{"Order.tags[0]", "Order.tags[1]"}));
    for (const auto& e : elements) EXPECT_EQ(e.name, "tags");
}

TEST(JsonFlattener, ordered_arrays_ignore_identifier_fields) {
    auto elements = flatten(json{{"items", {{{"id", 1}, {"v", "a"}}}}});
    ASSERT_NE(find_fqdn(elements, "Order.items[0].v"), nullptr);
    for (const auto& e : elements) EXPECT_FALSE(e.metadata.identifiers.has_value());
}

// -- Collections, order ignored -----------------------------------------------

TEST(JsonFlattener, unordered_members_with_ids_are_keyed_by_identity) {
    auto elements = flatten(json{{"items", {{{"id", 1}, {"v", "a"}}, {{"id", 2}, {"v", "b"}}}}},
                            ad::EventType::created, true);
    ASSERT_EQ(elements.size(), 4u);

    const auto* v1 = find_fqdn(elements, "Order.items[id=1].v");
    ASSERT_NE(v1, nullptr);
    EXPECT_EQ(v1->name, "v");
    EXPECT_EQ(v1->metadata.identifiers, (ad::Identifiers{{"id", "1"}}));

    const auto* id2 = find_fqdn(elements, "Order.items[id=2].id");
    ASSERT_NE(id2, nullptr);
    EXPECT_EQ(id2->metadata.identifiers, (ad::Identifiers{{"id", "2"}}));
}

TEST(JsonFlattener, unordered_scalar_members_share_one_path) {
    auto elements = flatten(json{{"tags", {"x", "x", "y"}}}, ad::EventType::deleted, true);
    ASSERT_EQ(elements.size(), 3u);
    for (const auto& e : elements) {
        EXPECT_EQ(e.metadata.fqdn, "Order.tags[]");
        EXPECT_EQ(e.name, "tags");
    }
}

TEST(JsonFlattener, unordered_members_without_ids_share_one_path) {
    auto elements = flatten(json{{"lines", {{{"qty", 1}}, {{"qty", 2}}}}},
                            ad::EventType::created, true);
    EXPECT_EQ(fqdns(elements), (std::vector<std::string>{"Order.lines[].qty", "Order.lines[].qty"}));
}

TEST(JsonFlattener, multiple_identifier_fields_follow_configured_order) {
    auto elements = flatten(json{{"items", {{{"sku", "A"}, {"id", 7}, {"v", 1}}}}},
                            ad::EventType::created, true, {"sku", "id"});
    const auto* v = find_fqdn(elements, "Order.items[sku=\"A\",id=7].v");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->metadata.identifiers, (ad::Identifiers{{"id", "7"}, {"sku", "A"}}));
}

TEST(JsonFlattener, identifier_values_keep_their_json_type) {
    auto elements = flatten(json{{"items", {{{"id", 1}, {"v", "a"}}, {{"id", "1"}, {"v", "b"}}}}},
                            ad::EventType::created, true);
    const auto* numeric = find_fqdn(elements, "Order.items[id=1].v");
    const auto* text = find_fqdn(elements, "Order.items[id=\"1\"].v");
    ASSERT_NE(numeric, nullptr);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(numeric->updated_value, ad::Value{ad::ScalarValue{std::string{"a"}}});
    EXPECT_EQ(text->updated_value, ad::Value{ad::ScalarValue{std::string{"b"}}});
}

TEST(JsonFlattener, identifier_text_is_escaped) {
    auto elements = flatten(json{{"items", {{{"id", "x],sku=2"}, {"v", 1}}}}},
                            ad::EventType::created, true, {"id", "sku"});
    const auto* v = find_fqdn(elements, "Order.items[id=\"x\\]\\,sku\\=2\"].v");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->metadata.identifiers, (ad::Identifiers{{"id", "x],sku=2"}}));
}

TEST(JsonFlattener, nested_members_inherit_enclosing_identifiers) {
    auto elements = flatten(
        json{{"items", {{{"id", 1}, {"dims", {{"w", 3}}}}}}},
        ad::EventType::created, true);
    const auto* w = find_fqdn(elements, "Order.items[id=1].dims.w");
    ASSERT_NE(w, nullptr);
    EXPECT_EQ(w->metadata.identifiers, (ad::Identifiers{{"id", "1"}}));
}
