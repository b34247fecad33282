// FILE: include/cli/command/commands.hpp
#pragma once

#include <string>
#include <vector>
#include "cli_config.hpp"
#include "kernel/interaction.hpp"

// Each command exposes two functions:
//  - handle_<command>: runs the command on its arguments (command name
//    excluded); returns the process exit code
//  - print_help_<command>: prints detailed help for the command

// help
int handle_help(const std::vector<std::string>& args,
                nf::InteractionService& svc,
                CliConfig& config);
void print_help_help(const CliConfig& config);

// cat
int handle_cat(const std::vector<std::string>& args,
               nf::InteractionService& svc,
               CliConfig& config);
void print_help_cat(const CliConfig& config);

// put
int handle_put(const std::vector<std::string>& args,
               nf::InteractionService& svc,
               CliConfig& config);
void print_help_put(const CliConfig& config);

// run
int handle_run(const std::vector<std::string>& args,
               nf::InteractionService& svc,
               CliConfig& config);
void print_help_run(const CliConfig& config);

// filter
int handle_filter(const std::vector<std::string>& args,
                  nf::InteractionService& svc,
                  CliConfig& config);
void print_help_filter(const CliConfig& config);

// head
int handle_head(const std::vector<std::string>& args,
                nf::InteractionService& svc,
                CliConfig& config);
void print_help_head(const CliConfig& config);

// tail
int handle_tail(const std::vector<std::string>& args,
                nf::InteractionService& svc,
                CliConfig& config);
void print_help_tail(const CliConfig& config);

// explain
int handle_explain(const std::vector<std::string>& args,
                   nf::InteractionService& svc,
                   CliConfig& config);
void print_help_explain(const CliConfig& config);

// plugins
int handle_plugins(const std::vector<std::string>& args,
                   nf::InteractionService& svc,
                   CliConfig& config);
void print_help_plugins(const CliConfig& config);

// config
int handle_config(const std::vector<std::string>& args,
                  nf::InteractionService& svc,
                  CliConfig& config);
void print_help_config(const CliConfig& config);
