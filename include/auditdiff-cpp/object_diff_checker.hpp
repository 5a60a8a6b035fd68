/// @file object_diff_checker.hpp
/// @brief ObjectDiffChecker: field-level diff of two optional snapshots.

#pragma once

#include <auditdiff-cpp/config.hpp>
#include <auditdiff-cpp/element.hpp>
#include <auditdiff-cpp/flattener.hpp>
#include <auditdiff-cpp/thread_pool.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace auditdiff_cpp {

/// An absent or present object snapshot.
using Snapshot = std::optional<nlohmann::json>;

/// Produces the field-level changes between a "before" and an "after" state.
class ObjectDiffChecker {
public:
    virtual ~ObjectDiffChecker() = default;

    /// Diff two snapshots. Every returned Element has a name.
    /// Records of different paths come in no particular order.
    virtual auto diff(const Snapshot& before, const Snapshot& after) const
        -> std::vector<Element> = 0;
};

/// The default ObjectDiffChecker.
///
/// Flattens both sides, groups the elements by fqdn and runs
/// detect_changes() on every group. Holds no state between calls, so one
/// instance may serve concurrent callers.
///
/// @code
/// auto checker = DiffChecker{DiffConfig{}};
/// auto changes = checker.diff(
///     nlohmann::json{{"name", "Alice"}, {"age", 30}},
///     nlohmann::json{{"name", "Alice"}, {"age", 31}});
/// // one record: name=age, previous=30, updated=31
/// @endcode
class DiffChecker final : public ObjectDiffChecker {
public:
    /// Sequential checker using JsonFlattener.
    explicit DiffChecker(DiffConfig config);

    /// @param num_threads Worker count for flattening and bucket processing.
    ///   0 = hardware_concurrency(), 1 = sequential (no pool).
    DiffChecker(DiffConfig config, unsigned int num_threads);

    /// @param flattener Snapshot flattener. nullptr = JsonFlattener.
    /// @param pool Shared worker pool. nullptr = sequential.
    DiffChecker(DiffConfig config,
                std::shared_ptr<const Flattener> flattener,
                std::shared_ptr<ThreadPool> pool);

    /// @throws DiffError (capacity_exceeded) when one path collects more
    ///   elements than bucket_capacity(config()).
    auto diff(const Snapshot& before, const Snapshot& after) const
        -> std::vector<Element> override;

    /// Diff with an explicit leading fqdn segment.
    auto diff(const Snapshot& before, const Snapshot& after,
              std::string_view root_type_name) const -> std::vector<Element>;

    /// Cancellable diff. Cancellation is observed between phases and
    /// between buckets; no partial result is ever returned.
    /// @throws DiffError (cancelled) once stop is requested.
    auto diff(const Snapshot& before, const Snapshot& after,
              std::string_view root_type_name, std::stop_token stop) const
        -> std::vector<Element>;

    auto config() const -> const DiffConfig& { return config_; }
    auto get_thread_pool() const -> std::shared_ptr<ThreadPool> { return pool_; }

private:
    auto flatten_one(const nlohmann::json& node, EventType type,
                     std::string_view root_type_name) const -> std::vector<Element>;

    auto diff_both(const nlohmann::json& before, const nlohmann::json& after,
                   std::string_view root_type_name,
                   const std::stop_token& stop) const -> std::vector<Element>;

    DiffConfig config_;
    std::shared_ptr<const Flattener> flattener_;
    std::shared_ptr<ThreadPool> pool_;
    std::size_t capacity_;
};

}  // namespace auditdiff_cpp
