#include <auditdiff-cpp/element.hpp>

#include <array>

namespace auditdiff_cpp {

auto parse_event_type(std::string_view name) -> std::optional<EventType> {
    static constexpr auto all = std::array{
        EventType::created, EventType::updated, EventType::deleted,
    };
    for (auto type : all) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

}  // namespace auditdiff_cpp
