#include <auditdiff-cpp/config.hpp>
#include <auditdiff-cpp/error.hpp>
#include <auditdiff-cpp/logging.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

namespace auditdiff_cpp {

auto bucket_capacity(const DiffConfig& config) noexcept -> std::size_t {
    if (!config.max_elements) return default_bucket_capacity;
    // Saturate instead of wrapping
    if (*config.max_elements > std::numeric_limits<std::size_t>::max() / 2) {
        return std::numeric_limits<std::size_t>::max();
    }
    return *config.max_elements * 2;
}

void validate(const DiffConfig& config) {
    if (config.max_elements && *config.max_elements == 0) {
        throw DiffError{ErrorKind::invalid_config, "maxElements must be positive"};
    }
    const auto& fields = config.ignore_collection_order.fields;
    if (fields.empty()) {
        throw DiffError{ErrorKind::invalid_config, "ignoreCollectionOrder.fields must not be empty"};
    }
    for (const auto& field : fields) {
        if (field.empty()) {
            throw DiffError{ErrorKind::invalid_config, "ignoreCollectionOrder.fields contains an empty name"};
        }
    }
}

auto load_config(const std::filesystem::path& path) -> DiffConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw DiffError{ErrorKind::invalid_config, "cannot open config file: " + path.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw DiffError{ErrorKind::parse_error, "config file is not valid JSON: " + path.string()};
    }
    auto config = j.get<DiffConfig>();
    logger()->debug("loaded config from {}: bucket capacity {}", path.string(), bucket_capacity(config));
    return config;
}

// -- JSON ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const IgnoreCollectionOrder& c) {
    j = nlohmann::json{{"enabled", c.enabled}, {"fields", c.fields}};
}

void from_json(const nlohmann::json& j, IgnoreCollectionOrder& c) {
    c = IgnoreCollectionOrder{};
    if (auto it = j.find("enabled"); it != j.end() && !it->is_null()) {
        c.enabled = it->get<bool>();
    }
    if (auto it = j.find("fields"); it != j.end() && !it->is_null()) {
        c.fields = it->get<std::vector<std::string>>();
    }
}

void to_json(nlohmann::json& j, const DiffConfig& c) {
    j = nlohmann::json{
        {"ignoreCollectionOrder", c.ignore_collection_order},
        {"rootTypeName", c.root_type_name},
    };
    if (c.max_elements) j["maxElements"] = *c.max_elements;
}

void from_json(const nlohmann::json& j, DiffConfig& c) {
    if (!j.is_object()) {
        throw DiffError{ErrorKind::invalid_config, "config must be a JSON object"};
    }
    c = DiffConfig{};
    try {
        if (auto it = j.find("maxElements"); it != j.end() && !it->is_null()) {
            if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
                throw DiffError{ErrorKind::invalid_config, "maxElements must be a positive integer"};
            }
            c.max_elements = it->get<std::size_t>();
        }
        if (auto it = j.find("ignoreCollectionOrder"); it != j.end() && !it->is_null()) {
            c.ignore_collection_order = it->get<IgnoreCollectionOrder>();
        }
        if (auto it = j.find("rootTypeName"); it != j.end() && !it->is_null()) {
            c.root_type_name = it->get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw DiffError{ErrorKind::invalid_config, e.what()};
    }
    validate(c);
}

}  // namespace auditdiff_cpp
