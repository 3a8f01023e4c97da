// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CONFIG_CONFIG
#define H_CONFIG_CONFIG

#include <string>
#include <string_view>
#include <vector>

#include "config/config_core.hpp"

namespace config {

// Loads the known keys of the config file into flags. A missing default
// config file is not an error, a missing or broken file named by
// --configfile is.
bool ReadConfig();

// Writes the flags back into the config file.
bool SaveConfig();

// Returns a comma separated list of problems with the current flags, empty
// if there is none.
std::string ValidateConfig();

// Handles the config file and version options, reads the config file and
// parses the command line. Returns the positional arguments, without the
// program name.
std::vector<std::string> ReadConfigFileAndArguments(int argc, const char** argv);

void SetUsageMessage(std::string_view exec_path);

}  // namespace config

#endif  // H_CONFIG_CONFIG
