#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

// Serializes whole lines so a progress redraw never splits a log message
std::mutex log_mutex;
bool progress_line_open = false;

struct TerminalState {
    bool out = false;
    bool err = false;
};

const TerminalState& terminal() {
    static const TerminalState state{isatty(STDOUT_FILENO) != 0, isatty(STDERR_FILENO) != 0};
    return state;
}

// Info lines go to stdout, warnings and errors to stderr. Colors only reach a terminal.
void emit_line(std::ostream& stream, bool colored, std::string_view tag, std::string_view color, std::string_view msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_line_open && &stream == &std::cout) {
        stream << '\n';
        progress_line_open = false;
    }
    if (colored) {
        stream << color << tag << COLOR_WHITE << msg << COLOR_RESET << std::endl;
    } else {
        stream << tag << msg << std::endl;
    }
}

} // anonymous namespace

void log_info(std::string_view msg) {
    emit_line(std::cout, terminal().out, get_string("info.log_prefix"), COLOR_GREEN, msg);
}

void log_warning(std::string_view msg) {
    emit_line(std::cerr, terminal().err, get_string("warning.prefix") + " ", COLOR_YELLOW, msg);
}

void log_error(std::string_view msg) {
    emit_line(std::cerr, terminal().err, get_string("error.prefix") + " ", COLOR_RED, msg);
}

// Redraws the download bar in place; skipped entirely when stdout is redirected
void log_progress(const std::string& msg, double percentage, int bar_width) {
    if (!terminal().out) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex);

    const int filled = static_cast<int>(bar_width * percentage / 100.0);
    std::string bar(static_cast<size_t>(bar_width), '-');
    for (int i = 0; i < bar_width && i <= filled; ++i) {
        bar[static_cast<size_t>(i)] = i < filled ? '#' : '>';
    }

    std::cout << "\r" << COLOR_GREEN << get_string("info.log_prefix") << COLOR_WHITE << msg
              << " [" << bar << "] " << std::fixed << std::setprecision(1) << percentage << "%"
              << COLOR_RESET << std::flush;
    progress_line_open = true;
}

void end_progress() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_line_open) {
        std::cout << std::endl;
        progress_line_open = false;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw WmsetupException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message(), EXIT_CANT_CREATE);
        }
    }
    else if (!fs::is_directory(path)) {
        throw WmsetupException(string_format("error.path_not_dir", path.string()), EXIT_CANT_CREATE);
    }
}

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return fs::path(name);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        // An empty PATH entry means the current directory
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw ExtractException(string_format("error.path_absolute", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw ExtractException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}
