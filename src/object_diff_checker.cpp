#include <auditdiff-cpp/object_diff_checker.hpp>
#include <auditdiff-cpp/change_detector.hpp>
#include <auditdiff-cpp/error.hpp>
#include <auditdiff-cpp/logging.hpp>

#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace auditdiff_cpp {

namespace {

auto make_pool(unsigned int num_threads) -> std::shared_ptr<ThreadPool> {
    if (num_threads == 1) return nullptr;
    auto n = (num_threads == 0) ? std::thread::hardware_concurrency() : num_threads;
    if (n <= 1) return nullptr;
    return std::make_shared<ThreadPool>(n);
}

void throw_if_stopped(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw DiffError{ErrorKind::cancelled, "diff cancelled by caller"};
    }
}

void drop_unnamed(std::vector<Element>& elements) {
    std::erase_if(elements, [](const Element& e) { return !e.name.has_value(); });
}

// Elements sharing one fqdn.
struct Bucket {
    std::string fqdn;
    std::vector<Element> elements;
};

// Groups elements by fqdn, keeping buckets in first-appearance order.
// Elements without an fqdn are counted and discarded.
class BucketTable {
public:
    explicit BucketTable(std::size_t capacity) : capacity_{capacity} {}

    void add(Element element) {
        if (!element.metadata.fqdn) {
            ++missing_metadata_;
            return;
        }
        auto [it, inserted] = index_.try_emplace(*element.metadata.fqdn, buckets_.size());
        if (inserted) buckets_.push_back(Bucket{*element.metadata.fqdn, {}});

        auto& bucket = buckets_[it->second];
        if (bucket.elements.size() >= capacity_) {
            logger()->warn("bucket '{}' exceeds capacity of {} elements", bucket.fqdn, capacity_);
            throw DiffError{ErrorKind::capacity_exceeded,
                            "more than " + std::to_string(capacity_) +
                            " elements at path '" + bucket.fqdn + "'"};
        }
        bucket.elements.push_back(std::move(element));
    }

    auto buckets() -> std::vector<Bucket>& { return buckets_; }
    auto missing_metadata() const -> std::size_t { return missing_metadata_; }

private:
    std::size_t capacity_;
    std::vector<Bucket> buckets_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t missing_metadata_ = 0;
};

}  // anonymous namespace

DiffChecker::DiffChecker(DiffConfig config)
    : DiffChecker{std::move(config), nullptr, nullptr} {}

DiffChecker::DiffChecker(DiffConfig config, unsigned int num_threads)
    : DiffChecker{std::move(config), nullptr, make_pool(num_threads)} {}

DiffChecker::DiffChecker(DiffConfig config,
                         std::shared_ptr<const Flattener> flattener,
                         std::shared_ptr<ThreadPool> pool)
    : config_{std::move(config)},
      flattener_{flattener ? std::move(flattener) : std::make_shared<JsonFlattener>()},
      pool_{std::move(pool)},
      capacity_{bucket_capacity(config_)} {
    validate(config_);
}

auto DiffChecker::diff(const Snapshot& before, const Snapshot& after) const
    -> std::vector<Element> {
    return diff(before, after, config_.root_type_name, std::stop_token{});
}

auto DiffChecker::diff(const Snapshot& before, const Snapshot& after,
                       std::string_view root_type_name) const -> std::vector<Element> {
    return diff(before, after, root_type_name, std::stop_token{});
}

auto DiffChecker::diff(const Snapshot& before, const Snapshot& after,
                       std::string_view root_type_name, std::stop_token stop) const
    -> std::vector<Element> {
    throw_if_stopped(stop);

    if (!before && !after) return {};

    if (!before || !after) {
        auto elements = before ? flatten_one(*before, EventType::deleted, root_type_name)
                               : flatten_one(*after, EventType::created, root_type_name);
        drop_unnamed(elements);
        throw_if_stopped(stop);
        logger()->debug("diff {}: {} {} elements", root_type_name, elements.size(),
                        before ? "deleted" : "created");
        return elements;
    }

    return diff_both(*before, *after, root_type_name, stop);
}

auto DiffChecker::flatten_one(const nlohmann::json& node, EventType type,
                              std::string_view root_type_name) const -> std::vector<Element> {
    const auto& order = config_.ignore_collection_order;
    return flattener_->flatten(node, type, root_type_name, order.enabled, order.fields);
}

auto DiffChecker::diff_both(const nlohmann::json& before, const nlohmann::json& after,
                            std::string_view root_type_name,
                            const std::stop_token& stop) const -> std::vector<Element> {
    auto previous = std::vector<Element>{};
    auto updated = std::vector<Element>{};
    auto flatten_side = [&](std::size_t side) {
        if (side == 0) {
            previous = flatten_one(before, EventType::deleted, root_type_name);
        } else {
            updated = flatten_one(after, EventType::created, root_type_name);
        }
    };
    if (pool_) {
        pool_->parallel_for(2, flatten_side);
    } else {
        flatten_side(0);
        flatten_side(1);
    }
    throw_if_stopped(stop);

    // Every bucket must be complete before any of them is examined
    auto table = BucketTable{capacity_};
    const auto element_count = previous.size() + updated.size();
    for (auto& element : previous) table.add(std::move(element));
    for (auto& element : updated) table.add(std::move(element));
    if (table.missing_metadata() > 0) {
        logger()->debug("diff {}: dropped {} elements without fqdn",
                        root_type_name, table.missing_metadata());
    }

    auto& buckets = table.buckets();
    auto results = std::vector<std::vector<Element>>(buckets.size());
    auto process = [&](std::size_t i) {
        throw_if_stopped(stop);
        results[i] = detect_changes(std::move(buckets[i].elements));
    };
    if (pool_ && buckets.size() > 1) {
        pool_->parallel_for(buckets.size(), process);
    } else {
        for (std::size_t i = 0; i < buckets.size(); ++i) process(i);
    }
    throw_if_stopped(stop);

    auto changes = std::vector<Element>{};
    for (auto& result : results) {
        for (auto& element : result) {
            if (element.name) changes.push_back(std::move(element));
        }
    }
    logger()->debug("diff {}: {} elements in {} buckets -> {} changes",
                    root_type_name, element_count, buckets.size(), changes.size());
    return changes;
}

}  // namespace auditdiff_cpp
