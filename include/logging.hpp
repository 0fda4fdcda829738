#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

// Builds the "glimpse" logger (stderr + in-memory ring) and makes it the
// spdlog default. Safe to call more than once.
void init_logging(bool debug);

// While the terminal UI owns the screen nothing may reach stderr.
void set_console_logging(bool enabled);

// Most recent formatted log lines, oldest first.
std::vector<std::string> recent_log_lines(size_t limit);
