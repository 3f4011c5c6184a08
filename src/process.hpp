#pragma once

#include "output_monitor.hpp"

#include <string>
#include <vector>

// Runs argv[0] (PATH lookup) with stdout and stderr merged into one pipe, feeding
// every line to the monitor as it arrives. Returns the child's exit code
// (128 + signal if it was killed). Throws PipwallException if the child cannot be started.
int run_monitored(const std::vector<std::string>& args, InstallOutputMonitor& monitor);
