#include <auditdiff-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace auditdiff_cpp {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto instance = []() -> std::shared_ptr<spdlog::logger> {
        if (auto existing = spdlog::get(logger_name)) return existing;
        return spdlog::stderr_color_mt(logger_name);
    }();
    return instance;
}

}  // namespace auditdiff_cpp
