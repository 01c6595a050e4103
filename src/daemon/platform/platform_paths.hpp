#pragma once

#include <string>

namespace platform {

// Empty string when neither the XDG variable nor HOME is set.
std::string config_dir();
std::string data_dir();
std::string ipc_endpoint();

// Defaults for the staging and alias directories.
std::string default_staging_dir();
std::string default_alias_dir();

} // namespace platform
