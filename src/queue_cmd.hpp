#pragma once
#include <string>
#include <vector>

namespace queuectl {
int cmd_init_db();
int cmd_enqueue(const std::vector<std::string>& args);
int cmd_status();
int cmd_list(const std::vector<std::string>& args);
int cmd_dlq(const std::vector<std::string>& args);
} // namespace queuectl
