#include <auditdiff-cpp/change_detector.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace auditdiff_cpp {

namespace {

// One previous-side and one updated-side element.
auto is_opposing_pair(const Element& a, const Element& b) -> bool {
    return a.previous_value.has_value() != b.previous_value.has_value();
}

// Occurrences of one value, in arrival order.
struct ValueGroup {
    Value value;
    std::vector<const Element*> members;
};

// Insertion-ordered multiset keyed by Value equality.
class ValueTable {
public:
    void add(const Value& value, const Element* member) {
        auto it = std::ranges::find_if(groups_, [&](const ValueGroup& g) {
            return g.value == value;
        });
        if (it == groups_.end()) {
            groups_.push_back(ValueGroup{value, {member}});
        } else {
            it->members.push_back(member);
        }
    }

    auto find(const Value& value) const -> const ValueGroup* {
        auto it = std::ranges::find_if(groups_, [&](const ValueGroup& g) {
            return g.value == value;
        });
        return it == groups_.end() ? nullptr : &*it;
    }

    auto count(const Value& value) const -> std::size_t {
        const auto* group = find(value);
        return group ? group->members.size() : 0;
    }

    auto groups() const -> const std::vector<ValueGroup>& { return groups_; }

private:
    std::vector<ValueGroup> groups_;
};

// Members of `group` beyond the first `matched`, appended to `surplus`.
void take_surplus(const ValueGroup& group, std::size_t matched,
                  std::vector<const Element*>& surplus) {
    surplus.insert(surplus.end(),
                   group.members.begin() + static_cast<std::ptrdiff_t>(matched),
                   group.members.end());
}

}  // anonymous namespace

auto detect_changes(std::vector<Element> bucket) -> std::vector<Element> {
    switch (bucket.size()) {
        case 0:
        case 1:
            return bucket;
        case 2: {
            const auto& a = bucket[0];
            const auto& b = bucket[1];
            // Two creations or two deletions at one path: an unordered
            // collection, not an update. Direct comparison would drop the
            // second record.
            if (!is_opposing_pair(a, b)) return reconcile_duplicates(bucket);

            // Arrival order is not guaranteed, so check both ways
            if (a.previous_value && a.previous_value != b.updated_value) {
                auto update = a;
                update.updated_value = b.updated_value;
                return {std::move(update)};
            }
            if (b.previous_value && b.previous_value != a.updated_value) {
                auto update = b;
                update.updated_value = a.updated_value;
                return {std::move(update)};
            }
            return {};
        }
        default:
            return reconcile_duplicates(bucket);
    }
}

auto reconcile_duplicates(const std::vector<Element>& bucket) -> std::vector<Element> {
    auto previous = ValueTable{};
    auto updated = ValueTable{};
    for (const auto& element : bucket) {
        if (element.previous_value) {
            previous.add(*element.previous_value, &element);
        } else if (element.updated_value) {
            updated.add(*element.updated_value, &element);
        }
    }

    auto deleted_surplus = std::vector<const Element*>{};
    auto created_surplus = std::vector<const Element*>{};

    // Previous-side values first, then values only seen on the updated side
    for (const auto& group : previous.groups()) {
        auto prev_count = group.members.size();
        auto upd_count = updated.count(group.value);
        if (prev_count > upd_count) {
            take_surplus(group, upd_count, deleted_surplus);
        } else if (upd_count > prev_count) {
            take_surplus(*updated.find(group.value), prev_count, created_surplus);
        }
    }
    for (const auto& group : updated.groups()) {
        if (previous.find(group.value) == nullptr) {
            take_surplus(group, 0, created_surplus);
        }
    }

    // Pair surpluses into updates; the larger side supplies the record
    auto changes = std::vector<Element>{};
    changes.reserve(std::max(deleted_surplus.size(), created_surplus.size()));
    if (deleted_surplus.size() >= created_surplus.size()) {
        for (std::size_t n = 0; n < created_surplus.size(); ++n) {
            auto update = *deleted_surplus[n];
            update.updated_value = created_surplus[n]->updated_value;
            changes.push_back(std::move(update));
        }
        for (std::size_t n = created_surplus.size(); n < deleted_surplus.size(); ++n) {
            changes.push_back(*deleted_surplus[n]);
        }
    } else {
        for (std::size_t n = 0; n < deleted_surplus.size(); ++n) {
            auto update = *created_surplus[n];
            update.previous_value = deleted_surplus[n]->previous_value;
            changes.push_back(std::move(update));
        }
        for (std::size_t n = deleted_surplus.size(); n < created_surplus.size(); ++n) {
            changes.push_back(*created_surplus[n]);
        }
    }
    return changes;
}

}  // namespace auditdiff_cpp
