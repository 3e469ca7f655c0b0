#pragma once
#include "config.hpp"
#include <string>
#include <vector>

namespace queuectl {

// worker start [--count N] | stop | run --id N
int cmd_worker(const std::vector<std::string>& args);

// Body of one worker process: registers, loops until SIGINT/SIGTERM,
// deregisters. Returns the process exit code.
int run_worker_process(const Config& cfg, int ordinal);

} // namespace queuectl
