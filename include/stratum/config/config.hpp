#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace stratum::config {

// Configuration file path constants
class ConfigPaths {
public:
    static constexpr const char* DEFAULT_CONFIG_DIR = "config/";

    static std::string get_profile_config_file(const std::string& profile) {
        return std::string(DEFAULT_CONFIG_DIR) + "stratum-" + profile +
               ".yaml";
    }
};

enum class ConfigFormat { YAML, JSON, INI };

/**
 * @brief Typed view of one section of the configuration tree
 *
 * Subclasses read their section in from_ptree() and reject inconsistent
 * values in validate(). The section name is properties_name().
 */
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;
    virtual std::unique_ptr<ConfigurationProperties> clone() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }
};

// CRTP helper providing clone()
template <typename Derived>
class ClonableConfigurationProperties : public ConfigurationProperties {
public:
    std::unique_ptr<ConfigurationProperties> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

/**
 * @brief Process-wide configuration registry
 *
 * Parses a file into a property tree and hands each registered properties
 * object its own section. Sections missing from the file keep their
 * defaults.
 */
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    /**
     * @brief Load a configuration file and populate registered properties
     * @throws std::runtime_error if the file cannot be parsed or a section
     * fails validation
     */
    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);

    /**
     * @brief Load a base file, then overlay the profile file on top of it
     */
    void load_config_with_profile(const std::string& base_file,
                                  const std::string& profile,
                                  ConfigFormat format = ConfigFormat::YAML);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        std::lock_guard<std::mutex> lock(config_mutex_);
        configs_[std::type_index(typeid(T))] = config;
        config_by_name_[config->properties_name()] = config;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = configs_.find(std::type_index(typeid(T)));
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const;

    // Raw value lookup with a fallback, e.g. "app.database_url"
    template <typename T>
    T get_value(const std::string& path, const T& default_value) const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return config_tree_.get<T>(path, default_value);
    }

    void reset();

    boost::property_tree::ptree get_config_tree() const;

private:
    ConfigManager() = default;

    boost::property_tree::ptree parse_file(const std::string& config_file,
                                           ConfigFormat format);
    boost::property_tree::ptree merge_ptrees(
        const boost::property_tree::ptree& base,
        const boost::property_tree::ptree& override);
    boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

    // Expects config_mutex_ held
    void load_component_configs();

    mutable std::mutex config_mutex_;
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;
};

template <typename T>
class ConfigurationPropertiesFactory {
public:
    static std::shared_ptr<T> create_and_register() {
        auto config = std::make_shared<T>();
        ConfigManager::instance().register_configuration_properties(config);
        return config;
    }
};

}  // namespace stratum::config
