#pragma once
#include <string>
#include <vector>

namespace queuectl {
int cmd_config(const std::vector<std::string>& args);
} // namespace queuectl
