#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    bool quiet_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_active = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        // A warning in the middle of a progress bar starts on a fresh line.
        if (progress_active) {
            std::cout << std::endl;
            progress_active = false;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    if (quiet_mode) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    if (quiet_mode) return;
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
    progress_active = true;
}

void end_progress() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_active) {
        std::cout << std::endl;
        progress_active = false;
    }
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

bool get_quiet_mode() {
    return quiet_mode;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::vector<std::string> split_list(std::string_view s, char delim) {
    std::vector<std::string> res;
    size_t start = 0, end = 0;
    while ((end = s.find(delim, start)) != std::string_view::npos) {
        if (auto item = trim(s.substr(start, end - start)); !item.empty()) res.push_back(std::move(item));
        start = end + 1;
    }
    if (auto item = trim(s.substr(start)); !item.empty()) res.push_back(std::move(item));
    return res;
}

void ensure_dir_exists(const fs::path& path) {
    if (path.empty()) return;
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw DepsizeException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw DepsizeException(string_format("error.path_not_dir", path.string()));
    }
}

std::string read_file_to_string(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DepsizeException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_string_to_file(const fs::path& path, std::string_view content) {
    fs::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw DepsizeException(string_format("error.create_file_failed", tmp_path.string()));
        }
        file << content;
        if (!file) {
            throw DepsizeException(string_format("error.write_file_failed", tmp_path.string()));
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw DepsizeException(string_format("error.write_file_failed", path.string()));
    }
}

std::optional<CommandOutput> run_command_capture(const std::vector<std::string>& args) {
    if (args.empty()) return std::nullopt;

    std::vector<char*> c_args;
    for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    // Close-on-exec: a child forked concurrently by another worker must not
    // inherit this pipe. dup2 clears the flag on the child's stdout/stderr.
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) return std::nullopt;

    int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);

    pid_t pid = fork();
    if (pid == -1) {
        close(pipefd[0]);
        close(pipefd[1]);
        if (devnull >= 0) close(devnull);
        return std::nullopt;
    }
    if (pid == 0) {
        dup2(pipefd[1], STDOUT_FILENO);
        if (devnull >= 0) dup2(devnull, STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    close(pipefd[1]);
    if (devnull >= 0) close(devnull);

    CommandOutput output;
    char buffer[4096];
    ssize_t n;
    while ((n = read(pipefd[0], buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        output.stdout_text.append(buffer, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return std::nullopt;
    }
    if (!WIFEXITED(status)) return std::nullopt;
    output.exit_code = WEXITSTATUS(status);
    return output;
}
