#include "config_manager.hpp"
#include "errors.hpp"
#include <fstream>
#include <filesystem>
#include <QDir>

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string home_dir() {
    const QString home = QDir::homePath();
    if (home.isEmpty()) {
        throw ConfigError("Could not find home directory");
    }
    return home.toStdString();
}

} // namespace

ConfigManager::ConfigManager(const std::optional<std::string>& config_path)
    : config_path_(config_path.value_or(default_config_path())),
      file_present_(std::filesystem::exists(config_path_))
{
    if (config_path && !file_present_) {
        throw ConfigError("Config file not found: " + config_path_);
    }
}

std::string ConfigManager::default_config_path() {
    return (std::filesystem::path(home_dir()) / ".todo.ini").string();
}

std::string ConfigManager::default_db_path() {
    return (std::filesystem::path(home_dir()) / ".todo.db").string();
}

std::string ConfigManager::get_config_path() const {
    return config_path_;
}

std::string ConfigManager::get_db_path() const {
    if (auto path = read_key("Database", "Path")) {
        return *path;
    }
    return default_db_path();
}

std::optional<std::string> ConfigManager::read_key(const std::string& section, const std::string& key) const {
    if (!file_present_) {
        return std::nullopt;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        throw ConfigError("Cannot read config file: " + config_path_);
    }

    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == ';' || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        if (current_section == section) {
            size_t delimiter = line.find('=');
            if (delimiter != std::string::npos) {
                std::string k = trim(line.substr(0, delimiter));
                if (k == key) {
                    std::string value = trim(line.substr(delimiter + 1));
                    if (!value.empty()) {
                        return value;
                    }
                }
            }
        }
    }

    return std::nullopt;
}
