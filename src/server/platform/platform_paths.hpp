#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/speech-server, falling back to ~/.config/speech-server.
// Empty when neither variable is set.
std::string config_dir();

} // namespace platform
