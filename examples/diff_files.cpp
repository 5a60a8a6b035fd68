// diff_files — command-line structural diff of two JSON files
//
// Usage:
//   diff_files [options] <before.json|-> <after.json|->
//
//   A "-" (or an omitted trailing argument) stands for an absent snapshot.
//
// Options:
//   --config <file>   DiffConfig JSON (maxElements, ignoreCollectionOrder, ...)
//   --type <name>     Root type name used as the leading path segment
//   --threads <n>     Worker threads (0 = hardware concurrency, 1 = sequential)
//   --event <app>     Wrap the changes in an AuditEvent for application <app>
//   --verbose         Debug logging
//
// Build: cmake --build build
// Run:   ./build/examples/diff_files --type Order before.json after.json

#include <auditdiff-cpp/auditdiff.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ad = auditdiff_cpp;
using json = nlohmann::json;

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> type_name;
    unsigned int threads{1};
    std::optional<std::string> application;
    bool verbose{false};
    std::vector<std::string> files;
};

void print_usage() {
    std::fprintf(stderr,
        "usage: diff_files [--config <file>] [--type <name>] [--threads <n>]\n"
        "                  [--event <app>] [--verbose] <before|-> [<after|->]\n");
}

auto parse_args(int argc, char** argv) -> std::optional<Options> {
    auto options = Options{};
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string{argv[++i]};
        };
        if (arg == "--config") {
            options.config_path = next();
            if (!options.config_path) return std::nullopt;
        } else if (arg == "--type") {
            options.type_name = next();
            if (!options.type_name) return std::nullopt;
        } else if (arg == "--threads") {
            auto value = next();
            if (!value) return std::nullopt;
            auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), options.threads);
            if (ec != std::errc{} || ptr != value->data() + value->size()) return std::nullopt;
        } else if (arg == "--event") {
            options.application = next();
            if (!options.application) return std::nullopt;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg.starts_with("--")) {
            std::fprintf(stderr, "unknown option: %s\n", argv[i]);
            return std::nullopt;
        } else {
            options.files.emplace_back(arg);
        }
    }
    if (options.files.empty() || options.files.size() > 2) return std::nullopt;
    return options;
}

auto read_snapshot(const std::string& path) -> ad::Snapshot {
    if (path == "-") return std::nullopt;
    auto in = std::ifstream{path};
    if (!in) {
        throw ad::DiffError{ad::ErrorKind::invalid_argument, "cannot open " + path};
    }
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw ad::DiffError{ad::ErrorKind::parse_error, path + " is not valid JSON"};
    }
    return j;
}

auto now_millis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return 2;
    }

    auto log = ad::logger();
    log->set_level(options->verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        auto config = options->config_path ? ad::load_config(*options->config_path) : ad::DiffConfig{};
        auto checker = ad::DiffChecker{config, options->threads};

        auto before = read_snapshot(options->files[0]);
        auto after = options->files.size() > 1 ? read_snapshot(options->files[1]) : ad::Snapshot{};
        auto type_name = options->type_name.value_or(config.root_type_name);

        auto changes = checker.diff(before, after, type_name);
        log->info("{} changes between {} and {}", changes.size(), options->files[0],
                  options->files.size() > 1 ? options->files[1] : std::string{"-"});

        auto output = json{};
        if (options->application) {
            auto source = ad::EventSource{};
            source.type = ad::EventSourceType::system;
            source.metadata.name = "diff_files";
            output = ad::make_audit_event(type_name + "-" + std::to_string(now_millis()),
                                          *options->application, now_millis(), source,
                                          std::move(changes));
        } else {
            output = changes;
        }
        std::printf("%s\n", output.dump(2).c_str());
    } catch (const ad::DiffError& e) {
        log->error("{}", e.what());
        return 1;
    } catch (const json::exception& e) {
        log->error("JSON error: {}", e.what());
        return 1;
    }
    return 0;
}
