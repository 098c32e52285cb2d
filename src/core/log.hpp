#pragma once

#include <string>

// Debug log file. Defaults to <temp dir>/sshpool_debug.log.
std::string pool_log_path();

// Redirect the debug log. An empty path disables logging.
void set_pool_log_path(const std::string& path);

// Append a timestamped line ("[HH:MM:SS.mmm] msg") to the debug log.
void pool_log(const std::string& msg);
