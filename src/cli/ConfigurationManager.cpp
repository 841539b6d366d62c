/**
 * @file ConfigurationManager.cpp
 * @brief rc-file configuration for hydromesh
 */

#include "ConfigurationManager.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace hydromesh {

namespace {

void trim(std::string& text) {
    text.erase(0, text.find_first_not_of(" \t\r"));
    text.erase(text.find_last_not_of(" \t\r") + 1);
}

} // anonymous namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Simple key=value parser
    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        // Skip comments, section headers and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim(key);
        trim(value);

        if (!key.empty()) {
            config_values_[key] = value;
        }
    }

    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# hydromesh configuration" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << " = " << value << std::endl;
    }

    return true;
}

size_t ConfigurationManager::load_search_path(const std::vector<std::string>& files) {
    size_t loaded = 0;
    for (const auto& filename : files) {
        if (load_from_file(filename)) {
            ++loaded;
        }
    }
    return loaded;
}

std::vector<std::string> ConfigurationManager::default_search_path() {
    namespace fs = std::filesystem;
    std::vector<std::string> files;
    if (const char* home = std::getenv("HOME")) {
        files.push_back((fs::path(home) / ".hydromeshrc").string());
    }
    files.push_back((fs::current_path() / ".hydromeshrc").string());
    files.push_back((fs::current_path() / "hydromeshrc").string());
    return files;
}

WorkflowConfig ConfigurationManager::load_default_config() {
    ConfigurationManager manager;
    if (const char* data_dir = std::getenv("HYDROMESH_DATA_DIR")) {
        manager.set_value("data_directory", data_dir);
    } else {
        manager.set_value("data_directory", (std::filesystem::current_path() / "data").string());
    }
    manager.load_search_path(default_search_path());
    return manager.to_workflow_config();
}

WorkflowConfig ConfigurationManager::to_workflow_config() const {
    WorkflowConfig config;
    config.data_directory = get_string("data_directory", config.data_directory);
    config.default_crs = get_string("default_crs", config.default_crs);
    config.latlon_crs = get_string("latlon_crs", config.latlon_crs);
    config.digits = get_int("digits", config.digits);
    config.log_config = get_string("log_config", config.log_config);
    if (has_value("log_file") && !get_string("log_file").empty()) {
        config.log_file = get_string("log_file");
    }
    return config;
}

void ConfigurationManager::from_workflow_config(const WorkflowConfig& config) {
    set_value("data_directory", config.data_directory);
    set_value("default_crs", config.default_crs);
    set_value("latlon_crs", config.latlon_crs);
    set_value("digits", std::to_string(config.digits));
    set_value("log_config", config.log_config);
    if (config.log_file) {
        set_value("log_file", *config.log_file);
    }
}

} // namespace hydromesh
