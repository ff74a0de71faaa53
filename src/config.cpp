#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = DEPSIZE_CONF_DIR;
fs::path L10N_DIR = DEPSIZE_L10N_DIR;
fs::path CONFIG_FILE = fs::path(DEPSIZE_CONF_DIR) / "depsize.conf";

namespace {

constexpr int DEFAULT_JOBS = 8;
constexpr long DEFAULT_TIMEOUT_SECONDS = 5;
constexpr int DEFAULT_MAX_RETRIES = 2;

struct Settings {
    std::string pypi_url = "https://pypi.org";
    std::string npm_url = "https://registry.npmjs.org";
    int jobs = DEFAULT_JOBS;
    long timeout = DEFAULT_TIMEOUT_SECONDS;
    int retries = DEFAULT_MAX_RETRIES;
    std::string python_audit = "safety check --bare --dependency {name}";
    std::string node_audit = "npm audit package {name}";
    std::vector<std::string> python_paid;
    std::vector<std::string> node_paid;
};

Settings settings;

long parse_number(const std::string& key, const std::string& value, long min) {
    long result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || result < min) {
        throw DepsizeException(string_format("error.invalid_config_value", key, value));
    }
    return result;
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::vector<std::string> normalized_list(const std::string& value, Ecosystem eco) {
    std::vector<std::string> names;
    for (const auto& item : split_list(value, ',')) {
        names.push_back(normalize_package_name(item, eco));
    }
    return names;
}

} // anonymous namespace

void load_config(const fs::path& path, bool required) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw DepsizeException(string_format("error.open_file_failed", path.string()));
        }
        return;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            log_warning(string_format("warning.config_line_ignored", path.string(), line_no));
            continue;
        }
        std::string key = trim(std::string_view(stripped).substr(0, pos));
        std::string value = trim(std::string_view(stripped).substr(pos + 1));

        if (key == "pypi_url") {
            set_registry_url(Ecosystem::PYTHON, value);
        } else if (key == "npm_url") {
            set_registry_url(Ecosystem::NODE, value);
        } else if (key == "jobs") {
            set_jobs(static_cast<int>(parse_number(key, value, 1)));
        } else if (key == "timeout") {
            set_request_timeout(parse_number(key, value, 1));
        } else if (key == "retries") {
            set_max_retries(static_cast<int>(parse_number(key, value, 1)));
        } else if (key == "python_audit_command") {
            set_audit_command(Ecosystem::PYTHON, value);
        } else if (key == "node_audit_command") {
            set_audit_command(Ecosystem::NODE, value);
        } else if (key == "paid.python") {
            settings.python_paid = normalized_list(value, Ecosystem::PYTHON);
        } else if (key == "paid.node") {
            settings.node_paid = normalized_list(value, Ecosystem::NODE);
        } else {
            log_warning(string_format("warning.unknown_config_key", key, path.string()));
        }
    }
}

void reset_config() {
    settings = Settings{};
}

std::string get_registry_url(Ecosystem eco) {
    return eco == Ecosystem::PYTHON ? settings.pypi_url : settings.npm_url;
}

void set_registry_url(Ecosystem eco, const std::string& url) {
    if (url.empty()) {
        throw DepsizeException(string_format("error.invalid_config_value", "registry url", url));
    }
    (eco == Ecosystem::PYTHON ? settings.pypi_url : settings.npm_url) = strip_trailing_slash(url);
}

int get_jobs() {
    return settings.jobs;
}

void set_jobs(int jobs) {
    if (jobs < 1) {
        throw DepsizeException(string_format("error.invalid_config_value", "jobs", std::to_string(jobs)));
    }
    settings.jobs = jobs;
}

long get_request_timeout() {
    return settings.timeout;
}

void set_request_timeout(long seconds) {
    if (seconds < 1) {
        throw DepsizeException(string_format("error.invalid_config_value", "timeout", std::to_string(seconds)));
    }
    settings.timeout = seconds;
}

int get_max_retries() {
    return settings.retries;
}

void set_max_retries(int retries) {
    if (retries < 1) {
        throw DepsizeException(string_format("error.invalid_config_value", "retries", std::to_string(retries)));
    }
    settings.retries = retries;
}

std::vector<std::string> get_audit_command(Ecosystem eco, const std::string& pkg_name) {
    const std::string& tmpl = (eco == Ecosystem::PYTHON) ? settings.python_audit : settings.node_audit;
    std::vector<std::string> args;
    std::istringstream iss(tmpl);
    std::string token;
    while (iss >> token) {
        if (auto pos = token.find("{name}"); pos != std::string::npos) {
            token.replace(pos, 6, pkg_name);
        }
        args.push_back(std::move(token));
    }
    return args;
}

void set_audit_command(Ecosystem eco, const std::string& command_template) {
    (eco == Ecosystem::PYTHON ? settings.python_audit : settings.node_audit) = command_template;
}

const std::vector<std::string>& get_extra_paid_packages(Ecosystem eco) {
    return eco == Ecosystem::PYTHON ? settings.python_paid : settings.node_paid;
}
