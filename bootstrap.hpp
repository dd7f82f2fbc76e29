#pragma once
#include "bootstrap_config.hpp"
#include "wake/sleeper.hpp"

// Load oikos_config.json (argv[1] overrides the location) and errors.json,
// apply logging settings, and return the typed options.
Options runBootstrapChecks(int argc, char** argv);

// Timer backend per options (RTC when suspending), suspend policy, exit keys.
Wake::Sleeper buildSleeper(const SleepOptions& options);
