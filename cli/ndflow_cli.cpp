// FILE: cli/ndflow_cli.cpp
#include <csignal>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "cli/print_cli_help.hpp"
#include "cli/process_command.hpp"
#include "cli_config.hpp"
#include "kernel/interaction.hpp"
#include "kernel/kernel.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    // A closed stdout (e.g. `ndflow cat x | head -1`) ends the program quietly.
    std::signal(SIGPIPE, SIG_DFL);

    std::string home_override;
    std::string custom_config_path;
    bool verbose = false;

    // '+' stops at the first non-option: everything after it is the command.
    const char* const short_opts = "+hv";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"verbose", no_argument, nullptr, 'v'},
        {"home", required_argument, nullptr, 1001}, {"config", required_argument, nullptr, 1002},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': print_cli_help(); return 0;
        case 'v': verbose = true; break;
        case 1001: home_override = optarg; break;
        case 1002: custom_config_path = optarg; break;
        default: print_cli_help(); return 2;
        }
    }
    std::vector<std::string> command(argv + optind, argv + argc);
    if (command.empty()) {
        print_cli_help();
        return 2;
    }

    CliConfig config;
    try {
        config.home = resolve_home_dir(home_override);
        std::string config_to_load = custom_config_path.empty()
            ? (fs::path(config.home) / "config.yaml").string()
            : custom_config_path;
        if (!custom_config_path.empty() && !fs::exists(custom_config_path)) {
            std::cerr << "Error: config file not found: " << custom_config_path << "\n";
            return 2;
        }
        load_or_create_config(config_to_load, config);
        if (verbose) config.verbose = true;

        nf::Kernel kernel(to_kernel_options(config));
        nf::InteractionService svc(kernel);
        return process_command(command, svc, config);
    } catch (const nf::FlowError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
