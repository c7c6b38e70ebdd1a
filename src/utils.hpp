#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
// Terminates a progress line started by log_progress
void end_progress();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
bool is_executable_file(const fs::path& path);

// Resolves `name` the way a shell does: a name containing '/' is taken as a
// path, anything else is searched for in each PATH entry in order.
std::optional<fs::path> find_executable(const std::string& name);

// Joins a relative archive entry path onto `root`, rejecting absolute paths and '..'
fs::path validate_path(const fs::path& path, const fs::path& root);
