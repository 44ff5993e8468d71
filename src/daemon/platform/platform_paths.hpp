#pragma once

#include <string>

namespace platform {

// Empty when no home directory can be determined.
std::string config_dir();
std::string data_dir();

// OpenCC text dictionaries (STPhrases.txt, STCharacters.txt) under data_dir().
std::string dictionary_dir();

// $XDG_RUNTIME_DIR/voxdiff.sock, else a per-user socket in /tmp.
std::string ipc_endpoint();

} // namespace platform
