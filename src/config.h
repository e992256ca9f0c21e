#pragma once

#include <istream>
#include <string>
#include <vector>

#include "controller.h"

// Parsed representation of an INI configuration file.
//
//   [gateway]
//   host = 192.168.1.6
//   port = 8899
//   repeat_commands = 3
//   pause_between_commands = 0.1
//   group_1 = rgbw
//   group_2 = white
//
// Every [gateway] section adds one gateway, in file order. Keys that are not
// given keep the ControllerConfig defaults.
struct Config {
    std::vector<ControllerConfig> gateways;
};

// Parse an INI config file from disk.
// Throws std::runtime_error if the file cannot be read or has syntax errors.
Config parse_config_file(const std::string& path);

// Parse INI text from a stream. `origin` is used in error messages.
Config parse_config(std::istream& in, const std::string& origin = "<input>");

// Validate a parsed Config and throw std::runtime_error if it has no gateway,
// or InvalidConfig if any value is out of range.
void validate_config(const Config& cfg);
