#pragma once

#include <string>

// Returns the base config directory used by memeseed.
//
// $XDG_CONFIG_HOME/memeseed, else $HOME/.config/memeseed, else ".".
std::string GetMemeseedConfigDir();

// Default config file: "<config_dir>/config.json".
std::string GetMemeseedConfigPath();

