#pragma once
#include <string>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* OIKOS_CONFIG_FILE = "oikos_config.json";
inline constexpr const char* OIKOS_ERRORS_FILE = "errors.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
// Config directory: ./resources, then ../resources, then the working directory.
std::string getResourcePath();
