// src/app/driver_main.cpp
#include "app/driver_app.hpp"
#include "config/drive_config.hpp"
#include "engine/engine_registry.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <exception>
#include <string>
#include <vector>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nBuilds a car, starts and stops it, swaps the engine, and repeats.\n");
    printf("\nOptions:\n");
    printf("  --engine KEY          Initial engine (default: petrol)\n");
    printf("  --swap KEY            Replacement engine, repeatable (default: electric)\n");
    printf("  --config PATH         Drive config YAML\n");
    printf("  --script PATH         Lua drive script instead of the fixed sequence\n");
    printf("  --list-engines        Print available engines and exit\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off (default: warn)\n");
    printf("  --log-file PATH       Mirror diagnostics to a file\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  %s\n", prog_name);
    printf("  %s --engine diesel --swap hybrid --swap electric\n", prog_name);
    printf("  %s --config config/drive/default.yaml\n", prog_name);
    printf("  %s --script config/lua/swap_demo.lua\n", prog_name);
}

void print_engines(const engine::EngineRegistry& registry) {
    for (const auto& key : registry.keys()) {
        printf("  %-10s %s\n", key.c_str(), registry.create(key)->type().c_str());
    }
}

int main(int argc, char** argv) {
    const engine::EngineRegistry registry = engine::EngineRegistry::with_builtin_engines();

    std::string config_path;
    std::string engine_override;
    std::vector<std::string> swap_overrides;
    std::string script_path;
    std::string log_file;
    bool list_engines = false;

    static struct option long_options[] = {
        {"engine",       required_argument, 0, 'e'},
        {"swap",         required_argument, 0, 's'},
        {"config",       required_argument, 0, 'c'},
        {"script",       required_argument, 0, 'S'},
        {"list-engines", no_argument,       0, 'l'},
        {"log-level",    required_argument, 0, 'L'},
        {"log-file",     required_argument, 0, 'f'},
        {"help",         no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    try {
        while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
            switch (opt) {
                case 'e':
                    engine_override = optarg;
                    break;
                case 's':
                    swap_overrides.push_back(optarg);
                    break;
                case 'c':
                    config_path = optarg;
                    break;
                case 'S':
                    script_path = optarg;
                    break;
                case 'l':
                    list_engines = true;
                    break;
                case 'L':
                    utils::set_level(utils::level_from_string(optarg));
                    break;
                case 'f':
                    log_file = optarg;
                    break;
                case 'h':
                default:
                    print_usage(argv[0]);
                    return (opt == 'h') ? 0 : 1;
            }
        }

        if (optind < argc) {
            fprintf(stderr, "Error: Unexpected argument: %s\n", argv[optind]);
            print_usage(argv[0]);
            return 1;
        }

        if (!log_file.empty() && !utils::open_log_file(log_file)) {
            return 1;
        }

        if (list_engines) {
            print_engines(registry);
            return 0;
        }

        app::DriverAppConfig cfg;
        cfg.drive = app::resolve_drive(config_path, engine_override, swap_overrides, registry);
        cfg.script_path = script_path;

        cfg.drive.print_summary();

        app::DriverApp driver(cfg, registry);
        const int rc = driver.run();
        utils::close_log_file();
        return rc;

    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        utils::close_log_file();
        return 1;
    }
}
