#include "stratum/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "stratum/log/logger.hpp"

namespace stratum::config {

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child("", yaml_to_ptree(*it));  // Empty key for elements
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::parse_file(
    const std::string& config_file, ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML: {
            YAML::Node yaml_node = YAML::LoadFile(config_file);
            tree = yaml_to_ptree(yaml_node);
            break;
        }
        case ConfigFormat::JSON: {
            std::ifstream ifs(config_file);
            if (!ifs) {
                throw std::runtime_error("Cannot open " + config_file);
            }
            boost::property_tree::read_json(ifs, tree);
            break;
        }
        case ConfigFormat::INI: {
            std::ifstream ifs(config_file);
            if (!ifs) {
                throw std::runtime_error("Cannot open " + config_file);
            }
            boost::property_tree::read_ini(ifs, tree);
            break;
        }
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    STRATUM_LOG_INFO << "Loading config file: " << config_file;

    try {
        auto tree = parse_file(config_file, format);
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = std::move(tree);
        load_component_configs();
    } catch (const std::exception& e) {
        STRATUM_LOG_ERROR << "Failed to load config file: " << config_file
                          << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
    STRATUM_LOG_INFO << "Successfully loaded config file: " << config_file;
}

void ConfigManager::load_config_with_profile(const std::string& base_file,
                                             const std::string& profile,
                                             ConfigFormat format) {
    boost::property_tree::ptree tree;
    try {
        tree = parse_file(base_file, format);
    } catch (const std::exception& e) {
        STRATUM_LOG_ERROR << "Failed to load base config: " << base_file
                          << ", Error: " << e.what();
        throw std::runtime_error("Failed to load base config: " +
                                 std::string(e.what()));
    }

    if (!profile.empty()) {
        const auto profile_file = ConfigPaths::get_profile_config_file(profile);
        if (!std::filesystem::exists(profile_file)) {
            throw std::runtime_error("Profile config file not found: " +
                                     profile_file);
        }
        try {
            tree = merge_ptrees(tree, parse_file(profile_file, format));
        } catch (const std::exception& e) {
            STRATUM_LOG_ERROR << "Failed to load profile config: "
                              << profile_file << ", Error: " << e.what();
            throw std::runtime_error("Failed to load profile config: " +
                                     profile_file + ", Error: " + e.what());
        }
        STRATUM_LOG_INFO << "Loaded profile configuration: " << profile_file;
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    config_tree_ = std::move(tree);
    load_component_configs();
}

boost::property_tree::ptree ConfigManager::merge_ptrees(
    const boost::property_tree::ptree& base,
    const boost::property_tree::ptree& override) {
    boost::property_tree::ptree result = base;

    for (const auto& item : override) {
        if (result.count(item.first) && !item.second.empty() &&
            !result.get_child(item.first).empty()) {
            result.put_child(
                item.first,
                merge_ptrees(result.get_child(item.first), item.second));
        } else {
            result.put_child(item.first, item.second);
        }
    }

    return result;
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();

        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            STRATUM_LOG_WARN << "No configuration found for properties: "
                             << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*section);
            config->validate();
            STRATUM_LOG_DEBUG << "Loaded configuration for properties: "
                              << properties_name;
        } catch (const std::exception& e) {
            STRATUM_LOG_ERROR << "Failed to load configuration for properties "
                              << properties_name << ": " << e.what();
            throw;
        }
    }
}

std::shared_ptr<ConfigurationProperties> ConfigManager::get_config_by_name(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = config_by_name_.find(name);
    return (it != config_by_name_.end()) ? it->second : nullptr;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    configs_.clear();
    config_by_name_.clear();
    config_tree_ = boost::property_tree::ptree();
}

boost::property_tree::ptree ConfigManager::get_config_tree() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_tree_;
}

}  // namespace stratum::config
