/// @file auditdiff.hpp
/// @brief Umbrella header for the auditdiff-cpp library.
///
/// Include this single header for access to all public types:
/// DiffChecker, DiffConfig, Element, Value, Flattener, AuditEvent,
/// ThreadPool, and Error.

#pragma once

#include <auditdiff-cpp/audit_event.hpp>
#include <auditdiff-cpp/change_detector.hpp>
#include <auditdiff-cpp/config.hpp>
#include <auditdiff-cpp/element.hpp>
#include <auditdiff-cpp/error.hpp>
#include <auditdiff-cpp/flattener.hpp>
#include <auditdiff-cpp/json.hpp>
#include <auditdiff-cpp/logging.hpp>
#include <auditdiff-cpp/object_diff_checker.hpp>
#include <auditdiff-cpp/thread_pool.hpp>
#include <auditdiff-cpp/value.hpp>
