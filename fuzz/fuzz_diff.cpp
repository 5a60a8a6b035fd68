// Fuzz target for DiffChecker::diff() — the input is split into two JSON
// documents at the first NUL byte. Checks reflexivity and that the changes
// never outnumber the leaves of both snapshots.

#include <auditdiff-cpp/auditdiff.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    const auto first = input.substr(0, split);
    const auto second = split == std::string_view::npos ? std::string_view{} : input.substr(split + 1);

    auto before = nlohmann::json::parse(first, nullptr, false);
    auto after = nlohmann::json::parse(second, nullptr, false);
    if (before.is_discarded() || after.is_discarded()) return 0;

    auto config = auditdiff_cpp::DiffConfig{};
    config.ignore_collection_order.enabled = (size % 2) == 0;
    config.max_elements = 1 << 16;
    const auto checker = auditdiff_cpp::DiffChecker{config};

    const auto& order = config.ignore_collection_order;
    const auto flattener = auditdiff_cpp::JsonFlattener{};
    const auto leaves =
        flattener.flatten(before, auditdiff_cpp::EventType::deleted, "root", order.enabled, order.fields).size() +
        flattener.flatten(after, auditdiff_cpp::EventType::created, "root", order.enabled, order.fields).size();

    try {
        if (!checker.diff(before, before).empty()) std::abort();
        if (checker.diff(before, after).size() > leaves) std::abort();
    } catch (const auditdiff_cpp::DiffError& e) {
        // An oversized bucket is the only acceptable failure
        if (e.kind() != auditdiff_cpp::ErrorKind::capacity_exceeded) std::abort();
    }
    return 0;
}
