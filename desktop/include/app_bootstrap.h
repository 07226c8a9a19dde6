#pragma once

#include "logger.h"

#include <string>
#include <vector>

// Startup steps shared by droproom_server and droproom_peer.

// Tries config_path, then the usual build-tree locations (cwd parents and
// paths next to the executable). Returns the path that loaded, or "".
std::string load_config_with_fallbacks(const std::string& config_path, const char* argv0,
                                       std::vector<std::string>* tried = nullptr);

// Log level: an explicit command-line value wins over config.json.
// Also switches on async logging when the config asks for it.
void apply_logging_config(const std::string& cli_level);

// Telemetry from the "telemetry" config section, reports tagged with process_tag.
void init_telemetry(const std::string& process_tag);

// Parses "--flag VALUE" pairs; prints an error and returns false when VALUE is missing.
bool take_arg_value(int argc, char* argv[], int* i, std::string* out);
