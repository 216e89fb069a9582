#include "token_keeper/core/application.hpp"
#include "token_keeper/utils/logger.hpp"
#include "version.h"

#include <boost/program_options.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {
    constexpr int kExitOk = 0;
    constexpr int kExitStartupFailed = 1;
    constexpr int kExitUsage = 2;

    std::atomic<token_keeper::core::Application*> g_app_instance{nullptr};

    void handle_shutdown_signal(int) {
        if (auto* app = g_app_instance.load()) {
            app->quit();
        }
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
    }

    std::unique_ptr<token_keeper::utils::Logger> setup_logging(token_keeper::utils::LogLevel log_level,
                                                               const std::string& log_file) {
        using namespace token_keeper::utils;

        auto logger = std::make_unique<Logger>(log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        if (!log_file.empty()) {
            auto file_sink = std::make_unique<FileSink>(log_file, false);
            if (file_sink->is_open()) {
                logger->add_sink(std::move(file_sink));
            } else {
                std::cerr << "Cannot open log file: " << log_file << std::endl;
            }
        }

        return logger;
    }

    struct CommandLine {
        std::string config_path;
        std::string log_level;
        bool once = false;
        bool sample_config = false;
        bool help = false;
        bool version = false;
    };
} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace token_keeper;

    CommandLine cli;
    po::options_description desc("token-keeper options");
    desc.add_options()
        ("help,h", po::bool_switch(&cli.help), "Show this help")
        ("version", po::bool_switch(&cli.version), "Print the version and exit")
        ("config,c", po::value<std::string>(&cli.config_path), "Configuration file (YAML)")
        ("log-level", po::value<std::string>(&cli.log_level), "Override log level: debug, info, warning, error, none")
        ("once", po::bool_switch(&cli.once), "Authenticate, store the token and exit without refreshing")
        ("sample-config", po::bool_switch(&cli.sample_config), "Print a sample configuration and exit");

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Failed to parse options: " << e.what() << "\n" << desc << std::endl;
        return kExitUsage;
    }

    if (cli.help) {
        std::cout << core::ConfigManager::description() << "\n\n" << desc << std::endl;
        return kExitOk;
    }
    if (cli.version) {
        std::cout << "token-keeper " << TOKEN_KEEPER_VERSION_STRING << std::endl;
        return kExitOk;
    }
    if (cli.sample_config) {
        std::cout << core::ConfigManager::sample_config();
        return kExitOk;
    }
    if (!cli.log_level.empty() && !utils::is_log_level_name(cli.log_level)) {
        std::cerr << "Unknown log level: " << cli.log_level << std::endl;
        return kExitUsage;
    }

    core::ConfigManager config_manager(cli.config_path);
    if (auto loaded = config_manager.load(); !loaded) {
        std::cerr << "Cannot load configuration " << config_manager.path() << ": "
                  << core::to_string(loaded.error()) << std::endl;
        return kExitUsage;
    }

    const auto& config = config_manager.get();
    auto log_level = cli.log_level.empty() ? config.log_level : utils::log_level_from_string(cli.log_level);
    utils::LoggerManager::set_instance(setup_logging(log_level, config.log_file));

    LOG_INFO("Main", "token-keeper v" TOKEN_KEEPER_VERSION_STRING " starting...");
    LOG_DEBUG("Main", "Configuration: " + config_manager.path().string());

    try {
        auto app_result = core::create_application(config);
        if (!app_result) {
            LOG_ERROR("Main", "Application creation failed: " + core::to_string(app_result.error()));
            return kExitUsage;
        }

        auto app = std::move(*app_result);

        if (auto initialized = app->initialize(); !initialized) {
            LOG_ERROR("Main", "Startup failed: " + core::to_string(initialized.error()));
            return kExitStartupFailed;
        }

        if (cli.once) {
            LOG_INFO("Main", "Token stored, exiting (--once)");
            return kExitOk;
        }

        if (auto started = app->start(); !started) {
            LOG_ERROR("Main", "Application start failed: " + core::to_string(started.error()));
            return kExitStartupFailed;
        }

        g_app_instance = app.get();
        register_signal_handlers();

        app->run();

        LOG_INFO("Main", "Shutting down...");
        app->shutdown();
        g_app_instance = nullptr;

        LOG_INFO("Main", "Shutdown complete");
        return kExitOk;

    } catch (const std::exception& e) {
        LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return kExitStartupFailed;
    }
}
