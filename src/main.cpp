#include "analyzer.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "registry.hpp"
#include "report.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.ecosystems") << std::endl;
    std::cerr << get_string("info.python_desc") << std::endl;
    std::cerr << get_string("info.node_desc") << std::endl;
}

// Manifests may be listed separately or as one comma-separated argument.
std::vector<fs::path> collect_manifests(const std::vector<std::string>& args) {
    std::vector<fs::path> manifests;
    for (const auto& arg : args) {
        for (const auto& item : split_list(arg, ',')) {
            manifests.emplace_back(item);
        }
    }
    return manifests;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("o,output", get_string("help.output_file"), cxxopts::value<std::string>()->default_value("analysis_output.json"))
            ("j,jobs", get_string("help.jobs"), cxxopts::value<int>())
            ("timeout", get_string("help.timeout"), cxxopts::value<long>())
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("registry-dir", get_string("help.registry_dir"), cxxopts::value<std::string>())
            ("no-audit", get_string("help.no_audit"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("ecosystem", "", cxxopts::value<std::string>())
            ("manifests", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"ecosystem", "manifests"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("quiet")) {
            set_quiet_mode(result["quiet"].as<bool>());
        }

        if (result.count("config")) {
            load_config(result["config"].as<std::string>(), true);
        } else {
            load_config(CONFIG_FILE);
        }

        if (result.count("jobs")) {
            set_jobs(result["jobs"].as<int>());
        }

        if (result.count("timeout")) {
            set_request_timeout(result["timeout"].as<long>());
        }

        if (!result.count("ecosystem") || !result.count("manifests")) {
            print_usage(options);
            return 1;
        }

        const std::string ecosystem_tag = result["ecosystem"].as<std::string>();
        const auto manifests = collect_manifests(result["manifests"].as<std::vector<std::string>>());
        if (manifests.empty()) {
            print_usage(options);
            return 1;
        }

        std::unique_ptr<RegistryClient> registry;
        if (result.count("registry-dir")) {
            registry = std::make_unique<LocalRegistryClient>(result["registry-dir"].as<std::string>());
        } else {
            registry = std::make_unique<HttpRegistryClient>(get_request_timeout(), get_max_retries());
        }

        std::unique_ptr<AuditClient> auditor;
        if (result["no-audit"].as<bool>()) {
            auditor = std::make_unique<DisabledAuditClient>();
        } else {
            auditor = std::make_unique<CommandAuditClient>();
        }

        Analyzer analyzer(*registry, *auditor, get_jobs());
        const AnalysisReport report = analyzer.analyze(manifests, ecosystem_tag);

        const fs::path output_file = result["output"].as<std::string>();
        write_report(report, output_file);
        log_info(string_format("info.analysis_saved", output_file.string()));

        print_summary(report, std::cout);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const DepsizeException& e) {
        log_error(string_format("error.depsize_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
