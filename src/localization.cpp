#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    using Catalog = std::unordered_map<std::string, std::string>;

    Catalog translations;
    Catalog missing_key_placeholders;
    // Resolver workers log concurrently.
    std::mutex missing_mutex;

    bool read_catalog(const fs::path& path, Catalog& into) {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;
            into[line.substr(0, pos)] = line.substr(pos + 1);
        }
        return true;
    }

    // First non-empty of DEPSIZE_LANG, LC_ALL, LC_MESSAGES, LANG; "zh_CN.UTF-8" -> "zh".
    std::string detect_language() {
        for (const char* var : {"DEPSIZE_LANG", "LC_ALL", "LC_MESSAGES", "LANG"}) {
            const char* value = std::getenv(var);
            if (value == nullptr || *value == '\0') continue;
            std::string locale(value);
            return locale.substr(0, locale.find_first_of("_.@"));
        }
        return "en";
    }
}

void init_localization() {
    if (!translations.empty()) return;

    // English is the base layer, so a partial translation still renders every key.
    read_catalog(L10N_DIR / "en.txt", translations);

    const std::string lang = detect_language();
    if (lang == "en" || lang == "C" || lang == "POSIX") return;
    if (!read_catalog(L10N_DIR / (lang + ".txt"), translations)) {
        log_warning("No message catalog for '" + lang + "' in " + L10N_DIR.string() + ", using English.");
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
