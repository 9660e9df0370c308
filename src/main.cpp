/*
 * Copyright 2025 Bastion Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bastion Authorization Gateway - Main Entry Point
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"
#include "gateway/factory.hpp"

namespace {

// Signal handlers only set flags; the main loop acts on them
std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    } else if (signal == SIGHUP) {
        g_reload_requested = true;
    }
}

void print_validation(const bastion::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        fprintf(stderr, "Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            fprintf(stderr, "  - %s\n", warning.c_str());
        }
    }
}

// SIGHUP: policy and routes only (keys and listener stay as they are)
void reload(bastion::control::ConfigManager& config_manager, bastion::gateway::Gateway& gateway) {
    auto* logger = bastion::logging::get_current_logger();

    if (!config_manager.reload()) {
        LOG_ERROR(logger, "Reload failed, keeping current policy and routes: {}",
                  config_manager.last_validation().errors.empty()
                      ? std::string("unknown error")
                      : config_manager.last_validation().errors.front());
        return;
    }

    for (const auto& warning : config_manager.last_validation().warnings) {
        LOG_WARNING(logger, "Configuration warning: {}", warning);
    }

    auto config = config_manager.get();
    try {
        bool policy_ok = gateway.reload_policy(bastion::gateway::build_rules(config->policy));
        bool routes_ok = gateway.reload_routes(bastion::gateway::build_routes(config->routes));
        LOG_INFO(logger, "Reload finished: policy={}, routes={}", policy_ok ? "applied" : "kept",
                 routes_ok ? "applied" : "kept");
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(logger, "Reload rejected: {}", e.what());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--check") {
            check_only = true;
        } else {
            config_path.clear();
            break;
        }
    }

    if (config_path.empty()) {
        fprintf(stderr, "Usage: %s --config <config.json> [--check]\n", argv[0]);
        return EXIT_FAILURE;
    }

    auto config_manager = std::make_unique<bastion::control::ConfigManager>();
    if (!config_manager->load(config_path)) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());
        print_validation(config_manager->last_validation());
        return EXIT_FAILURE;
    }

    if (check_only) {
        print_validation(config_manager->last_validation());
        printf("Configuration OK: %s\n", config_path.c_str());
        return EXIT_SUCCESS;
    }

    auto config = config_manager->get();

    bastion::logging::init_logging_system();
    auto* logger = bastion::logging::init_logger(config->logging);

    for (const auto& warning : config_manager->last_validation().warnings) {
        LOG_WARNING(logger, "Configuration warning: {}", warning);
    }

    std::shared_ptr<bastion::gateway::Gateway> gateway;
    try {
        auto keys = bastion::gateway::build_key_resolver(config->identity);
        if (config->identity.jwks && config->identity.jwks->prefetch && !keys->prefetch()) {
            // Not fatal: keys are fetched again on the first unknown kid
            LOG_WARNING(logger, "Initial JWKS fetch failed: url={}", config->identity.jwks->url);
        }
        gateway = bastion::gateway::build_gateway(*config, std::move(keys));
    } catch (const std::exception& e) {
        LOG_CRITICAL(logger, "Refusing to start: {}", e.what());
        bastion::logging::shutdown_logging();
        fprintf(stderr, "Refusing to start: %s\n", e.what());
        return EXIT_FAILURE;
    }

    bastion::core::Server server(config->server, gateway);
    if (!server.start()) {
        bastion::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGHUP, signal_handler);   // Policy and route reload

    while (!g_shutdown_requested.load() && server.is_running()) {
        if (g_reload_requested.exchange(false)) {
            reload(*config_manager, *gateway);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO(logger, "Shutting down");
    server.stop();
    bastion::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
