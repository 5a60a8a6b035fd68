#include <auditdiff-cpp/flattener.hpp>
#include <auditdiff-cpp/error.hpp>
#include <auditdiff-cpp/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace auditdiff_cpp {

namespace {

// Backslash-escapes the characters that delimit fqdn segments.
auto escape_segment(std::string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': case '.': case '[': case ']': case ',': case '=':
                out += '\\';
                break;
            default:
                break;
        }
        out += c;
    }
    return out;
}

class FlattenWalk {
public:
    FlattenWalk(EventType event_type, bool ignore_collection_order,
                const std::vector<std::string>& identifier_fields,
                std::vector<Element>& out)
        : event_type_{event_type},
          ignore_collection_order_{ignore_collection_order},
          identifier_fields_{identifier_fields},
          out_{out} {}

    void visit(const nlohmann::json& node, const std::string& path,
               const std::optional<std::string>& name,
               const std::optional<Identifiers>& identifiers) {
        if (node.is_object() && !node.empty()) {
            for (auto it = node.begin(); it != node.end(); ++it) {
                visit(it.value(), path + "." + escape_segment(it.key()), it.key(), identifiers);
            }
            return;
        }
        if (node.is_array() && !node.empty()) {
            for (std::size_t i = 0; i < node.size(); ++i) {
                const auto& member = node[i];
                auto member_ids = member_identifiers(member);
                auto segment = member_segment(i, member, member_ids);
                visit(member, path + segment, name, member_ids ? member_ids : identifiers);
            }
            return;
        }
        emit(node, path, name, identifiers);
    }

private:
    // Identifier fields present on a collection member, when order is ignored.
    auto member_identifiers(const nlohmann::json& member) const -> std::optional<Identifiers> {
        if (!ignore_collection_order_ || !member.is_object()) return std::nullopt;
        auto ids = Identifiers{};
        for (const auto& field : identifier_fields_) {
            auto it = member.find(field);
            if (it == member.end() || (it->is_structured() && !it->empty())) continue;
            ids.emplace(field, to_string(to_value(*it)));
        }
        if (ids.empty()) return std::nullopt;
        return ids;
    }

    auto member_segment(std::size_t index, const nlohmann::json& member,
                        const std::optional<Identifiers>& ids) const -> std::string {
        if (!ignore_collection_order_) return "[" + std::to_string(index) + "]";
        if (!ids) return "[]";
        // Configured field order, not map order. Values are JSON text so
        // 1 and "1" stay distinct.
        auto segment = std::string{"["};
        auto first = true;
        for (const auto& field : identifier_fields_) {
            if (!ids->contains(field)) continue;
            if (!first) segment += ",";
            segment += escape_segment(field) + "=" + escape_segment(member.at(field).dump());
            first = false;
        }
        return segment + "]";
    }

    void emit(const nlohmann::json& leaf, const std::string& path,
              const std::optional<std::string>& name,
              const std::optional<Identifiers>& identifiers) {
        auto element = Element{};
        element.name = name;
        if (event_type_ == EventType::deleted) {
            element.previous_value = to_value(leaf);
        } else {
            element.updated_value = to_value(leaf);
        }
        element.metadata.fqdn = path;
        element.metadata.identifiers = identifiers;
        out_.push_back(std::move(element));
    }

    EventType event_type_;
    bool ignore_collection_order_;
    const std::vector<std::string>& identifier_fields_;
    std::vector<Element>& out_;
};

}  // anonymous namespace

auto JsonFlattener::flatten(const nlohmann::json& node,
                            EventType event_type,
                            std::string_view root_type_name,
                            bool ignore_collection_order,
                            const std::vector<std::string>& identifier_field_names) const
    -> std::vector<Element> {
    if (event_type == EventType::updated) {
        throw DiffError{ErrorKind::invalid_argument, "cannot flatten a snapshot as UPDATED"};
    }
    auto out = std::vector<Element>{};
    auto walk = FlattenWalk{event_type, ignore_collection_order, identifier_field_names, out};
    walk.visit(node, std::string{root_type_name}, std::nullopt, std::nullopt);
    return out;
}

}  // namespace auditdiff_cpp
