#include <auditdiff-cpp/config.hpp>
#include <auditdiff-cpp/error.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

namespace ad = auditdiff_cpp;
using json = nlohmann::json;

namespace {

auto expect_kind(const json& j, ad::ErrorKind kind) -> void {
    try {
        (void)j.get<ad::DiffConfig>();
        ADD_FAILURE() << "expected DiffError for " << j.dump();
    } catch (const ad::DiffError& e) {
        EXPECT_EQ(e.kind(), kind) << j.dump();
    }
}

// Temporary file removed on scope exit.
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(const std::string& contents)
        : path{std::filesystem::temp_directory_path() /
               ("auditdiff_config_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + ".json")} {
        auto out = std::ofstream{path};
        out << contents;
    }
    ~TempFile() {
        auto ec = std::error_code{};
        std::filesystem::remove(path, ec);
    }
};

}  // namespace

// -- Defaults -----------------------------------------------------------------

TEST(DiffConfig, defaults) {
    const auto config = ad::DiffConfig{};
    EXPECT_FALSE(config.max_elements.has_value());
    EXPECT_FALSE(config.ignore_collection_order.enabled);
    EXPECT_EQ(config.ignore_collection_order.fields, (std::vector<std::string>{"id"}));
    EXPECT_EQ(config.root_type_name, "root");
}

TEST(DiffConfig, bucket_capacity_defaults_to_one_thousand) {
    EXPECT_EQ(ad::bucket_capacity(ad::DiffConfig{}), 1000u);
}

TEST(DiffConfig, bucket_capacity_is_twice_max_elements) {
    auto config = ad::DiffConfig{};
    config.max_elements = 250;
    EXPECT_EQ(ad::bucket_capacity(config), 500u);
}

TEST(DiffConfig, bucket_capacity_saturates_for_huge_limits) {
    auto config = ad::DiffConfig{};
    config.max_elements = std::size_t{1} << (std::numeric_limits<std::size_t>::digits - 1);
    EXPECT_EQ(ad::bucket_capacity(config), std::numeric_limits<std::size_t>::max());
    config.max_elements = std::numeric_limits<std::size_t>::max();
    EXPECT_EQ(ad::bucket_capacity(config), std::numeric_limits<std::size_t>::max());
    config.max_elements = std::numeric_limits<std::size_t>::max() / 2;
    EXPECT_EQ(ad::bucket_capacity(config), std::numeric_limits<std::size_t>::max() - 1);
}

// -- JSON ---------------------------------------------------------------------

TEST(DiffConfigJson, empty_object_gives_defaults) {
    EXPECT_EQ(json::object().get<ad::DiffConfig>(), ad::DiffConfig{});
}

TEST(DiffConfigJson, reads_all_keys) {
    auto config = json::parse(R"({
        "maxElements": 50,
        "ignoreCollectionOrder": {"enabled": true, "fields": ["sku", "id"]},
        "rootTypeName": "Order"
    })").get<ad::DiffConfig>();

    EXPECT_EQ(config.max_elements, 50u);
    EXPECT_TRUE(config.ignore_collection_order.enabled);
    EXPECT_EQ(config.ignore_collection_order.fields, (std::vector<std::string>{"sku", "id"}));
    EXPECT_EQ(config.root_type_name, "Order");
}

TEST(DiffConfigJson, partial_ignore_collection_order_keeps_default_fields) {
    auto config = json::parse(R"({"ignoreCollectionOrder": {"enabled": true}})").get<ad::DiffConfig>();
    EXPECT_TRUE(config.ignore_collection_order.enabled);
    EXPECT_EQ(config.ignore_collection_order.fields, (std::vector<std::string>{"id"}));
}

TEST(DiffConfigJson, null_values_keep_defaults) {
    auto config = json::parse(R"({"maxElements": null, "ignoreCollectionOrder": null})").get<ad::DiffConfig>();
    EXPECT_EQ(config, ad::DiffConfig{});
}

TEST(DiffConfigJson, round_trip) {
    auto config = ad::DiffConfig{};
    config.max_elements = 10;
    config.ignore_collection_order = ad::IgnoreCollectionOrder{true, {"key"}};
    config.root_type_name = "Invoice";

    json j = config;
    EXPECT_EQ(j["maxElements"], 10);
    EXPECT_EQ(j.get<ad::DiffConfig>(), config);
}

// -- Validation ---------------------------------------------------------------

TEST(DiffConfigJson, rejects_non_positive_max_elements) {
    expect_kind(json{{"maxElements", 0}}, ad::ErrorKind::invalid_config);
    expect_kind(json{{"maxElements", -3}}, ad::ErrorKind::invalid_config);
    expect_kind(json{{"maxElements", "many"}}, ad::ErrorKind::invalid_config);
}

TEST(DiffConfigJson, rejects_empty_identifier_fields) {
    expect_kind(json::parse(R"({"ignoreCollectionOrder": {"fields": []}})"), ad::ErrorKind::invalid_config);
    expect_kind(json::parse(R"({"ignoreCollectionOrder": {"fields": [""]}})"), ad::ErrorKind::invalid_config);
}

TEST(DiffConfigJson, rejects_wrong_types) {
    expect_kind(json::parse(R"({"ignoreCollectionOrder": {"enabled": "yes"}})"), ad::ErrorKind::invalid_config);
    expect_kind(json::array(), ad::ErrorKind::invalid_config);
}

TEST(Validate, accepts_defaults) {
    EXPECT_NO_THROW(ad::validate(ad::DiffConfig{}));
}

// -- load_config --------------------------------------------------------------

TEST(LoadConfig, reads_file) {
    const auto file = TempFile{R"({"maxElements": 5, "ignoreCollectionOrder": {"enabled": true}})"};
    auto config = ad::load_config(file.path);
    EXPECT_EQ(config.max_elements, 5u);
    EXPECT_TRUE(config.ignore_collection_order.enabled);
}

TEST(LoadConfig, malformed_json_is_parse_error) {
    const auto file = TempFile{"{ not json"};
    try {
        (void)ad::load_config(file.path);
        FAIL() << "expected DiffError";
    } catch (const ad::DiffError& e) {
        EXPECT_EQ(e.kind(), ad::ErrorKind::parse_error);
    }
}

TEST(LoadConfig, missing_file_is_invalid_config) {
    try {
        (void)ad::load_config("/nonexistent/auditdiff/config.json");
        FAIL() << "expected DiffError";
    } catch (const ad::DiffError& e) {
        EXPECT_EQ(e.kind(), ad::ErrorKind::invalid_config);
    }
}
