/// @file config.hpp
/// @brief DiffConfig: tuning knobs consumed by DiffChecker.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace auditdiff_cpp {

/// Bucket capacity used when max_elements is not configured.
inline constexpr std::size_t default_bucket_capacity = 1000;

/// Order-independent matching of collection members.
struct IgnoreCollectionOrder {
    bool enabled{false};
    /// Fields identifying a collection member, in priority order.
    std::vector<std::string> fields{"id"};

    auto operator==(const IgnoreCollectionOrder&) const -> bool = default;
};

/// Configuration of a DiffChecker.
///
/// JSON form:
/// @code
/// {
///   "maxElements": 500,
///   "ignoreCollectionOrder": { "enabled": true, "fields": ["id", "sku"] },
///   "rootTypeName": "Order"
/// }
/// @endcode
struct DiffConfig {
    /// Expected maximum elements per snapshot. Drives bucket capacity.
    std::optional<std::size_t> max_elements;
    IgnoreCollectionOrder ignore_collection_order;
    /// Leading fqdn segment when the caller does not name the type.
    std::string root_type_name{"root"};

    auto operator==(const DiffConfig&) const -> bool = default;
};

/// Maximum number of elements a single bucket may hold:
/// twice max_elements when set, otherwise default_bucket_capacity.
auto bucket_capacity(const DiffConfig& config) noexcept -> std::size_t;

/// Check a configuration.
/// @throws DiffError with ErrorKind::invalid_config.
void validate(const DiffConfig& config);

/// Read and validate a JSON configuration file.
/// @throws DiffError (parse_error, invalid_config) on bad input.
auto load_config(const std::filesystem::path& path) -> DiffConfig;

void to_json(nlohmann::json& j, const IgnoreCollectionOrder& c);
void from_json(const nlohmann::json& j, IgnoreCollectionOrder& c);

void to_json(nlohmann::json& j, const DiffConfig& c);
/// Missing keys keep their defaults. Validates the result.
void from_json(const nlohmann::json& j, DiffConfig& c);

}  // namespace auditdiff_cpp
