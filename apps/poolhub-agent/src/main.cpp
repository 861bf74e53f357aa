#include <poolhub/common/debug.hpp>
#include <poolhub/core/config/config_loader.hpp>
#include <poolhub/core/orchestrator/pool_orchestrator.hpp>

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <getopt.h>

namespace {

using namespace poolhub;
using namespace poolhub::common::debug;

constexpr const char* POOLHUB_AGENT_VERSION = "1.0.0";

constexpr std::string_view LOG_CAT = category::LIFECYCLE;

// Set from signal context, consumed by the main loop
std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_dump_requested{false};

void signal_handler(int signal) {
    if (signal == SIGUSR1) {
        g_dump_requested.store(true);
    } else {
        g_shutdown_requested.store(true);
    }
}

void setup_signal_handlers() {
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Termination request
    std::signal(SIGUSR1, signal_handler);  // Status dump
}

void print_usage(const char* program_name) {
    std::cout << "poolhub agent - adaptive object pools with cross-instance coordination\n"
              << "Version: " << POOLHUB_AGENT_VERSION << "\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -c, --config FILE     Configuration file path (required)\n"
              << "  -l, --log-level LEVEL Log level (trace, debug, info, warn, error, off)\n"
              << "  -t, --test-config     Validate configuration and exit\n"
              << "  -s, --status          Print one status snapshot and exit\n"
              << "  -h, --help            Show this help message\n"
              << "  --version             Show version information\n\n"
              << "Signals:\n"
              << "  SIGINT/SIGTERM        Graceful shutdown\n"
              << "  SIGUSR1               Print YAML status dump\n\n"
              << "Examples:\n"
              << "  " << program_name << " -c /etc/poolhub/agent.yaml\n"
              << "  " << program_name << " -c agent.yaml -t\n"
              << std::endl;
}

void print_version() {
    std::cout << "poolhub-agent " << POOLHUB_AGENT_VERSION << "\n"
              << "Coordinator backends: none, memory, redis\n"
              << "Configuration formats: YAML, JSON\n"
              << std::endl;
}

/**
 * @brief Replace the default console sink with the configured ones
 */
void setup_logging(const core::config::LoggingConfig& logging, const std::string& level_override) {
    auto& logger = Logger::instance();
    logger.clear_sinks();

    if (logging.output == "console" || logging.output == "both") {
        ConsoleSink::Config console;
        console.include_timestamp = logging.include_timestamp;
        console.include_thread_id = logging.include_thread_id;
        logger.add_sink(std::make_shared<ConsoleSink>(console));
    }
    if (logging.output == "file" || logging.output == "both") {
        FileSink::Config file;
        file.file_path     = logging.file_path;
        file.max_file_size = static_cast<size_t>(logging.max_file_size_mb) * 1024 * 1024;
        file.max_files     = logging.max_files;
        logger.add_sink(std::make_shared<FileSink>(std::move(file)));
    }

    init_logging(parse_log_level(level_override.empty() ? logging.level : level_override));
    for (const auto& [name, level] : logging.categories) {
        logger.filter().set_category_level(name, parse_log_level(level));
    }
}

/**
 * @brief Load and validate, printing the reason on failure
 */
bool load_configuration(const std::string& path, core::config::ApplicationConfig& out) {
    auto loader = core::config::create_config_loader();

    auto loaded = loader->load(path);
    if (loaded.is_error()) {
        std::cerr << "Error: Cannot load configuration: " << loaded.error().to_string()
                  << std::endl;
        return false;
    }

    auto valid = loader->validate(loaded.value());
    if (valid.is_error()) {
        std::cerr << "Error: Configuration validation failed: " << valid.message() << std::endl;
        return false;
    }

    out = std::move(loaded.value());
    return true;
}

/**
 * @brief Register a byte-buffer pool for every configured kind
 */
bool register_kinds(core::PoolOrchestrator& orchestrator,
                    const core::config::ApplicationConfig& config) {
    auto factory = std::make_shared<core::pool::TypedSlotFactory<std::vector<uint8_t>>>(
        [](std::vector<uint8_t>& buffer) { buffer.clear(); });

    for (const auto& [kind, pool_config] : config.pools.kinds) {
        auto result = orchestrator.register_kind(kind, factory);
        if (result.is_error()) {
            std::cerr << "Error: Cannot register kind '" << kind << "': " << result.message()
                      << std::endl;
            return false;
        }
    }
    if (config.pools.kinds.empty()) {
        POOLHUB_LOG_WARN(LOG_CAT, "No pool kinds configured, only coordinator upkeep will run");
    }
    return true;
}

void dump_status(core::PoolOrchestrator& orchestrator) {
    YAML::Emitter out;
    out << orchestrator.get_status();
    std::cout << "---\n" << out.c_str() << std::endl;
}

int test_configuration(const core::config::ApplicationConfig& config,
                       const std::string& config_file_path) {
    std::cout << "Configuration is valid: " << config_file_path << std::endl;

    std::cout << "\nConfiguration Summary:" << std::endl;
    std::cout << "  Instance ID: "
              << (config.instance_id.empty() ? "(generated)" : config.instance_id) << std::endl;
    std::cout << "  Log level: " << config.logging.level << std::endl;
    std::cout << "  Tick interval: " << config.tick_interval.count() << " ms" << std::endl;
    std::cout << "  Pool kinds: " << config.pools.kinds.size() << std::endl;
    std::cout << "  Memory monitor: " << (config.memory.enabled ? "enabled" : "disabled")
              << std::endl;
    std::cout << "  Coordinator: " << core::config::backend_type_name(config.coordinator.backend)
              << std::endl;
    return 0;
}

int show_status(const core::config::ApplicationConfig& config) {
    auto orchestrator = core::OrchestratorFactory::create(config);
    if (!register_kinds(*orchestrator, config)) {
        return 1;
    }
    orchestrator->tick();
    dump_status(*orchestrator);
    orchestrator->shutdown();
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_file_path;
    std::string log_level;
    bool test_config      = false;
    bool show_status_flag = false;

    static struct option long_options[] = {
        {"config",      required_argument, 0, 'c'},
        {"log-level",   required_argument, 0, 'l'},
        {"test-config", no_argument,       0, 't'},
        {"status",      no_argument,       0, 's'},
        {"help",        no_argument,       0, 'h'},
        {"version",     no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "c:l:tsh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config_file_path = optarg;
                break;
            case 'l':
                log_level = optarg;
                break;
            case 't':
                test_config = true;
                break;
            case 's':
                show_status_flag = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 0:
                if (option_index == 5) {  // --version
                    print_version();
                    return 0;
                }
                break;
            case '?':
                std::cerr << "Error: Unknown option. Use -h for help." << std::endl;
                return 1;
            default:
                break;
        }
    }

    if (config_file_path.empty()) {
        std::cerr << "Error: Configuration file is required. Use -c option." << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    core::config::ApplicationConfig config;
    if (!load_configuration(config_file_path, config)) {
        return 1;
    }

    if (test_config) {
        return test_configuration(config, config_file_path);
    }

    try {
        setup_logging(config.logging, log_level);

        if (show_status_flag) {
            int rc = show_status(config);
            shutdown_logging();
            return rc;
        }

        setup_signal_handlers();

        auto orchestrator = core::OrchestratorFactory::create(config);
        if (!register_kinds(*orchestrator, config)) {
            shutdown_logging();
            return 1;
        }

        auto start_result = orchestrator->start();
        if (start_result.is_error()) {
            std::cerr << "Error: Failed to start orchestrator: " << start_result.message()
                      << std::endl;
            shutdown_logging();
            return 1;
        }
        POOLHUB_LOG_INFO(LOG_CAT, "poolhub-agent " << POOLHUB_AGENT_VERSION << " started as "
                                                   << orchestrator->instance_id());

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (g_dump_requested.exchange(false)) {
                dump_status(*orchestrator);
            }
        }

        POOLHUB_LOG_INFO(LOG_CAT, "Shutdown requested");
        orchestrator->shutdown();
        shutdown_logging();

    } catch (const std::exception& e) {
        std::cerr << "Error: Exception caught: " << e.what() << std::endl;
        shutdown_logging();
        return 1;
    }

    return 0;
}
