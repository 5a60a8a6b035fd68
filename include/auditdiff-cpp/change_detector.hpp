/// @file change_detector.hpp
/// @brief Per-path change detection and multiset duplicate reconciliation.

#pragma once

#include <auditdiff-cpp/element.hpp>

#include <vector>

namespace auditdiff_cpp {

/// Decide the effective changes of one bucket (all elements share an fqdn).
///
/// - 1 element: returned unchanged (a plain creation or deletion).
/// - 2 elements: compared in both directions; yields one update record
///   when the values differ, nothing when they are equal.
/// - more: delegated to reconcile_duplicates().
auto detect_changes(std::vector<Element> bucket) -> std::vector<Element>;

/// Reconcile a bucket of arbitrary size by multiset difference.
///
/// Values present the same number of times on both sides are matched and
/// produce nothing. Surplus previous-side and updated-side elements are
/// paired into update records in order; the remainder is emitted as pure
/// deletions or creations. Elements holding neither value are dropped.
/// Output order is deterministic for a given input order.
auto reconcile_duplicates(const std::vector<Element>& bucket) -> std::vector<Element>;

}  // namespace auditdiff_cpp
