#pragma once

#include "ecosystem.hpp"

#include <string>
#include <vector>
#include <filesystem>

// Global paths (initially set to defaults, but can be modified)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path CONFIG_FILE;

// Loads `key = value` settings. A missing file is only an error when `required` is set.
void load_config(const std::filesystem::path& path, bool required = false);
void reset_config();

std::string get_registry_url(Ecosystem eco);
void set_registry_url(Ecosystem eco, const std::string& url);

int get_jobs();
void set_jobs(int jobs);

long get_request_timeout();
void set_request_timeout(long seconds);

int get_max_retries();
void set_max_retries(int retries);

// Command template for the security audit of one package; "{name}" is replaced by the package name.
std::vector<std::string> get_audit_command(Ecosystem eco, const std::string& pkg_name);
void set_audit_command(Ecosystem eco, const std::string& command_template);

const std::vector<std::string>& get_extra_paid_packages(Ecosystem eco);
