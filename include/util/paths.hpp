#pragma once

#include <filesystem>

namespace cw::paths {

// Resolution order: CHUNKWISE_CONFIG, $XDG_CONFIG_HOME/chunkwise/config.yaml, ~/.config/chunkwise/config.yaml
std::filesystem::path getConfigPath();

// $XDG_STATE_HOME/chunkwise/logs, ~/.local/state/chunkwise/logs, then the temp dir
std::filesystem::path getLogPath();

void setLogPathForTesting();

}
