#include <auditdiff-cpp/value.hpp>
#include <auditdiff-cpp/json.hpp>

#include <string>
#include <variant>

namespace auditdiff_cpp {

auto to_string(const Value& v) -> std::string {
    return std::visit(overload{
        [](ObjType type) -> std::string {
            return type == ObjType::map ? "{}" : "[]";
        },
        [](const ScalarValue& sv) -> std::string {
            if (const auto* s = std::get_if<std::string>(&sv)) return *s;
            auto j = nlohmann::json{};
            to_json(j, sv);
            return j.dump();
        },
    }, v);
}

}  // namespace auditdiff_cpp
