#pragma once

#include "exception.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>
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
void end_progress();

// Quiet mode drops info and progress output; warnings and errors still go to stderr.
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// String helpers
std::string trim(std::string_view s);
std::vector<std::string> split_list(std::string_view s, char delim);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file_to_string(const fs::path& path);
void write_string_to_file(const fs::path& path, std::string_view content);

// Runs argv[0] with the given arguments and captures its stdout.
// Returns std::nullopt when the process could not be started or did not exit normally.
struct CommandOutput {
    int exit_code = 0;
    std::string stdout_text;
};
std::optional<CommandOutput> run_command_capture(const std::vector<std::string>& args);
