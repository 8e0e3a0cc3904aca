/*
 * Copyright 2026 Tollgate Contributors
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


// Tollgate - Main Entry Point
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/orchestrator.hpp"

using namespace tollgate;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string error;
    auto options = runtime::parse_command_line(args, error);
    if (!options) {
        fprintf(stderr, "%s\n\n", error.c_str());
        runtime::print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        runtime::print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (options->show_version) {
        printf("tollgate %.*s\n", static_cast<int>(runtime::kVersion.size()),
               runtime::kVersion.data());
        return EXIT_SUCCESS;
    }

    control::ValidationResult validation;
    auto config = runtime::resolve_config(*options, control::process_env(), validation);

    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "Warning: %s\n", warning.c_str());
    }
    if (!config) {
        fprintf(stderr, "Configuration errors:\n");
        for (const auto& err : validation.errors) {
            fprintf(stderr, "  - %s\n", err.c_str());
        }
        return EXIT_FAILURE;
    }

    auto keys = runtime::resolve_keys(config->keys, error);
    if (!keys) {
        fprintf(stderr, "%s\n", error.c_str());
        return EXIT_FAILURE;
    }

    quill::Logger* logger = nullptr;
    try {
        logging::init_logging_system();
        logger = logging::init_logger(config->logging);
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        return EXIT_FAILURE;
    }

    runtime::install_signal_handlers();

    auto ec = runtime::run_proxy(*config, std::move(*keys), logger);
    if (ec) {
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    printf("Tollgate stopped.\n");
    logging::shutdown_logging();
    return EXIT_SUCCESS;
}
