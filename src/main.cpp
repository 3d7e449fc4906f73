#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "report/summary_json.hpp"
#include "scope/project_scope.hpp"
#include "scrub/snapshot_scrubber.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace snapredact;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitEngine = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "usage: snapredact --config <file.toml>\n"
        "       snapredact <snapshot.sqlite3> [--preset NAME] [--project ID]...\n"
        "                  [--scope-only | --scrub-only]\n";
}

/**
 * @brief Parse command line into a RedactorConfig
 * @return error text, empty on success
 */
std::string parse_args(int argc, char* argv[], RedactorConfig& cfg) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) return "missing arguments";

    if (args[0] == "--config") {
        if (args.size() != 2) return "--config takes exactly one file";
        auto loaded = ConfigLoader::load_from_file(args[1]);
        if (!loaded.success) return loaded.error_message;
        cfg = std::move(loaded.config);
        return {};
    }

    bool scope_only = false;
    bool scrub_only = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--preset" || arg == "--project") {
            if (i + 1 >= args.size()) return std::format("{} requires a value", arg);
            if (arg == "--preset") {
                cfg.scrub.preset = args[++i];
            } else {
                cfg.scope.projects.push_back(args[++i]);
            }
        } else if (arg == "--scope-only") {
            scope_only = true;
        } else if (arg == "--scrub-only") {
            scrub_only = true;
        } else if (arg.starts_with("--")) {
            return std::format("unknown option {}", arg);
        } else if (cfg.snapshot.path.empty()) {
            cfg.snapshot.path = arg;
        } else {
            return std::format("unexpected argument {}", arg);
        }
    }

    if (scope_only && scrub_only) return "--scope-only and --scrub-only are exclusive";
    if (scope_only) cfg.scrub.enabled = false;
    if (scrub_only) cfg.scope.projects.clear();

    const auto errors = ConfigLoader::validate_config(cfg);
    if (!errors.empty()) {
        std::string combined = "Invalid arguments:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return combined;
    }
    return {};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        RedactorConfig cfg;
        if (auto err = parse_args(argc, argv, cfg); !err.empty()) {
            utils::log::error(err);
            print_usage();
            return kExitUsage;
        }

        if (auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format("Opening snapshot {}", cfg.snapshot.path));
        SqliteConnectionFactory factory;
        auto conn = factory.create(cfg.snapshot.path);
        if (!conn) {
            std::cout << report::error_json(ErrorCategory::STORAGE_ERROR,
                std::format("cannot open snapshot {}", cfg.snapshot.path)) << '\n';
            return kExitEngine;
        }

        if (!cfg.scope.projects.empty()) {
            auto scoped = ProjectScopeFilter::apply(*conn, cfg.scope.projects);
            if (scoped.is_error()) {
                std::cout << report::error_json(scoped.error_category(),
                                                scoped.error_message()) << '\n';
                return kExitEngine;
            }
            std::cout << report::to_json_string(scoped.value()) << '\n';
        }

        if (cfg.scrub.enabled) {
            auto summary = SnapshotScrubber::scrub(*conn, cfg.scrub.preset);
            if (summary.is_error()) {
                std::cout << report::error_json(summary.error_category(),
                                                summary.error_message()) << '\n';
                return kExitEngine;
            }
            std::cout << report::to_json_string(summary.value()) << '\n';
        }

        conn->close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitEngine;
    }

    return kExitOk;
}
