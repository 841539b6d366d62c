/**
 * @file ConfigurationManager.hpp
 * @brief rc-file configuration for hydromesh
 */

#pragma once

#include "hydromesh.hpp"
#include <string>
#include <map>
#include <optional>
#include <vector>

namespace hydromesh {

/**
 * @brief key = value configuration store backed by rc files
 *
 * Later files override earlier ones. Lines starting with '#' or ';' and
 * [section] headers are ignored.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if the file was read, false if it could not be opened
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Load every readable file of the search path, in order
     * @return Number of files read
     */
    size_t load_search_path(const std::vector<std::string>& files);

    /**
     * @brief $HOME/.hydromeshrc, ./.hydromeshrc, ./hydromeshrc
     */
    static std::vector<std::string> default_search_path();

    /**
     * @brief Defaults, then HYDROMESH_DATA_DIR, then the rc files
     */
    static WorkflowConfig load_default_config();

    /**
     * @brief Convert to WorkflowConfig, falling back to its defaults
     */
    WorkflowConfig to_workflow_config() const;

    void from_workflow_config(const WorkflowConfig& config);

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                return std::stoi(it->second);
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    double get_double(const std::string& key, double default_value = 0.0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                return std::stod(it->second);
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "True" || value == "1" || value == "yes";
        }
        return default_value;
    }

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace hydromesh
