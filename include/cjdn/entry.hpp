#pragma once

#include<string>
#include<vector>

// Dispatches argv[1..] to a subcommand. No arguments starts the interactive
// menu. Exceptions propagate to the caller.
int run_cli_args(const std::vector<std::string>&args);
