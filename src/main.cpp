#include "config/config_loader.hpp"
#include "core/result_json.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/connection_manager.hpp"
#include "db/database_service.hpp"
#include "executor/execution_bridge.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace dbaccess;

namespace {

constexpr int64_t kDefaultPageSize = 100;

void print_usage() {
    std::cerr <<
        "Usage: dbaccess [--config path] <command> <connection> [args]\n"
        "\n"
        "Commands:\n"
        "  test      <connection>                          check the backend is reachable\n"
        "  schema    <connection>                          list tables, views, collections\n"
        "  structure <connection> <table>                  describe columns or fields\n"
        "  data      <connection> <table> [offset] [limit] fetch one page of rows\n"
        "  query     <connection> <text>                   run SQL or a MongoDB command document\n"
        "  list                                            list configured connections\n"
        "\n"
        "<connection> is a [[connections]] name from the config file or a\n"
        "postgres:// / mongodb:// URL.\n";
}

int64_t parse_int_arg(const std::string& text, std::string_view what) {
    int64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw InvalidArgumentError(std::format("{} must be an integer, got '{}'", what, text));
    }
    return value;
}

/**
 * @brief Resolve a configured connection name or a raw URL to a spec
 */
ConnectionSpec resolve_connection(const AccessConfig& config, const std::string& target) {
    if (const auto* named = config.find_connection(target)) {
        return named->to_spec();
    }

    const auto scheme_end = target.find("://");
    if (scheme_end == std::string::npos) {
        throw InvalidArgumentError(std::format("Unknown connection '{}'", target));
    }

    std::string scheme = target.substr(0, scheme_end);
    if (scheme == "mongodb+srv") {
        scheme = "mongodb";
    }

    ConnectionSpec spec;
    spec.type = parse_database_type(scheme);
    spec.connection_string = target;
    return spec;
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << '\n';
}

template <typename T>
int report(const Result<T>& result) {
    if (result.is_error()) {
        print_json({
            {"error", std::string(error_code_to_string(result.error_code()))},
            {"message", result.error_message()},
        });
        return EXIT_FAILURE;
    }
    print_json(nlohmann::json(result.value()));
    return EXIT_SUCCESS;
}

int run_command(DatabaseService& service, const AccessConfig& config,
                const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "list") {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& conn : config.connections) {
            out.push_back({{"name", conn.name}, {"type", conn.type}});
        }
        print_json(out);
        return EXIT_SUCCESS;
    }

    if (args.size() < 2) {
        print_usage();
        return EXIT_FAILURE;
    }
    const ConnectionSpec spec = resolve_connection(config, args[1]);

    if (command == "test") {
        const auto result = service.test_spec(spec);
        if (result.is_error()) return report(result);
        print_json({{"reachable", result.value()}});
        return result.value() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const auto opened = service.open(spec);
    if (opened.is_error()) return report(opened);
    const std::string& id = opened.value();

    int rc = EXIT_FAILURE;
    if (command == "schema") {
        rc = report(service.get_schema(id));
    } else if (command == "structure" && args.size() >= 3) {
        rc = report(service.get_table_structure(id, args[2]));
    } else if (command == "data" && args.size() >= 3) {
        const int64_t offset = args.size() >= 4 ? parse_int_arg(args[3], "offset") : 0;
        const int64_t limit = args.size() >= 5 ? parse_int_arg(args[4], "limit") : kDefaultPageSize;
        rc = report(service.get_table_data(id, args[2], offset, limit));
    } else if (command == "query" && args.size() >= 3) {
        rc = report(service.execute_query(id, args[2]));
    } else {
        print_usage();
    }

    (void)service.disconnect(id);
    return rc;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file = ConfigLoader::kDefaultPath;
    bool config_explicit = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
            config_explicit = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    AccessConfig config;
    if (config_explicit || std::filesystem::exists(config_file)) {
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        config = std::move(loaded.config);
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    try {
        register_builtin_backends();

        ExecutionBridge bridge(ExecutionBridge::Config{
            static_cast<size_t>(config.bridge.blocking_threads),
            config.bridge.operation_timeout,
        });

        int rc = EXIT_FAILURE;
        {
            ConnectionManager manager(bridge, ConnectionManager::Config{
                config.bridge.connect_timeout,
                EngineLimits{
                    static_cast<size_t>(config.limits.max_result_rows),
                    static_cast<size_t>(config.limits.structure_sample_size),
                },
            });
            DatabaseService service(manager, DatabaseService::Config{config.bridge.operation_timeout});

            rc = run_command(service, config, args);
            service.shutdown();
        }

        bridge.stop();
        return rc;
    } catch (const DbError& e) {
        utils::log::error(std::format("{}: {}", error_code_to_string(e.code()), e.what()));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
    }
    return EXIT_FAILURE;
}
