// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <memory>

#include "stratum/config/config.hpp"
#include "stratum/di/container_config.hpp"
#include "stratum/log/log_config.hpp"

namespace fs = boost::filesystem;

// Creates and cleans up temporary configuration files
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("stratum_config_%%%%");

    ConfigFixture() {
        fs::create_directories(temp_dir);
        stratum::config::ConfigManager::instance().reset();
    }

    ~ConfigFixture() {
        fs::remove_all(temp_dir);
        stratum::config::ConfigManager::instance().reset();
    }

    fs::path create_temp_file(const std::string& filename,
                              const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        ofs.close();
        return file_path;
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_nested_config) {
    const std::string yaml_content = R"(
app:
  database_url: postgresql://db:5432/users
  redis:
    url: redis://cache:6379
    password: secret
)";

    fs::path config_path = create_temp_file("nested.yaml", yaml_content);
    auto& config_manager = stratum::config::ConfigManager::instance();

    BOOST_CHECK_NO_THROW(config_manager.load_config(
        config_path.string(), stratum::config::ConfigFormat::YAML));

    const auto config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("app.database_url"),
                      "postgresql://db:5432/users");
    BOOST_CHECK_EQUAL(config_manager.get_value<std::string>("app.redis.url", ""),
                      "redis://cache:6379");
    BOOST_CHECK_EQUAL(
        config_manager.get_value<std::string>("app.missing", "fallback"),
        "fallback");
}

BOOST_AUTO_TEST_CASE(test_json_and_ini_formats) {
    auto& config_manager = stratum::config::ConfigManager::instance();

    fs::path json_path = create_temp_file(
        "app.json", R"({"container": {"slow_creation_warning_ms": 75}})");
    config_manager.load_config(json_path.string(),
                               stratum::config::ConfigFormat::JSON);
    BOOST_CHECK_EQUAL(
        config_manager.get_value<int>("container.slow_creation_warning_ms", 0),
        75);

    fs::path ini_path =
        create_temp_file("app.ini", "[container]\nlog_resolutions=true\n");
    config_manager.load_config(ini_path.string(),
                               stratum::config::ConfigFormat::INI);
    BOOST_CHECK(
        config_manager.get_value<bool>("container.log_resolutions", false));
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    auto& config_manager = stratum::config::ConfigManager::instance();

    BOOST_CHECK_THROW(
        config_manager.load_config("non_existent_file.yaml",
                                   stratum::config::ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_manager_singleton) {
    auto& config1 = stratum::config::ConfigManager::instance();
    auto& config2 = stratum::config::ConfigManager::instance();

    BOOST_CHECK_EQUAL(&config1, &config2);
}

BOOST_AUTO_TEST_CASE(test_registered_properties_are_populated) {
    const std::string yaml_content = R"(
log:
  global_level: debug
  console:
    enabled: false
container:
  slow_creation_warning_ms: 120
  log_resolutions: true
)";

    fs::path config_path = create_temp_file("sections.yaml", yaml_content);
    auto& config_manager = stratum::config::ConfigManager::instance();

    auto log_config = stratum::config::ConfigurationPropertiesFactory<
        stratum::log::LogConfig>::create_and_register();
    auto container_config = stratum::config::ConfigurationPropertiesFactory<
        stratum::di::ContainerConfig>::create_and_register();

    config_manager.load_config(config_path.string());

    BOOST_CHECK(log_config->global_level ==
                stratum::log::LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(!log_config->console.enabled);
    BOOST_CHECK(!log_config->file.enabled);

    auto options = container_config->to_options();
    BOOST_CHECK_EQUAL(options.slow_creation_warning.count(), 120);
    BOOST_CHECK(options.log_resolutions);

    BOOST_CHECK_EQUAL(
        config_manager
            .get_configuration_properties<stratum::di::ContainerConfig>()
            .get(),
        container_config.get());
    BOOST_CHECK_EQUAL(config_manager.get_config_by_name("log").get(),
                      log_config.get());
}

BOOST_AUTO_TEST_CASE(test_missing_section_keeps_defaults) {
    fs::path config_path =
        create_temp_file("empty.yaml", "other:\n  key: value\n");
    auto& config_manager = stratum::config::ConfigManager::instance();
    auto container_config = stratum::config::ConfigurationPropertiesFactory<
        stratum::di::ContainerConfig>::create_and_register();

    BOOST_CHECK_NO_THROW(config_manager.load_config(config_path.string()));
    BOOST_CHECK_EQUAL(container_config->slow_creation_warning_ms, 0);
    BOOST_CHECK(!container_config->log_resolutions);
}

BOOST_AUTO_TEST_CASE(test_invalid_section_is_rejected) {
    fs::path config_path = create_temp_file(
        "invalid.yaml", "container:\n  slow_creation_warning_ms: -5\n");
    auto& config_manager = stratum::config::ConfigManager::instance();
    stratum::config::ConfigurationPropertiesFactory<
        stratum::di::ContainerConfig>::create_and_register();

    BOOST_CHECK_THROW(config_manager.load_config(config_path.string()),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_invalid_log_level_is_rejected) {
    BOOST_CHECK_THROW(stratum::log::LogConfig::level_from_string("verbose"),
                      std::invalid_argument);
    BOOST_CHECK(stratum::log::LogConfig::level_from_string("WARNING") ==
                stratum::log::LogConfig::LogLevel::WARN);
    BOOST_CHECK_EQUAL(stratum::log::LogConfig::level_to_string(
                          stratum::log::LogConfig::LogLevel::ERROR),
                      "error");
}

BOOST_AUTO_TEST_CASE(test_profile_overlays_base) {
    fs::path base_path = create_temp_file(
        "base.yaml",
        "app:\n  database_url: postgresql://localhost/app\n  name: base\n");

    const fs::path profile_path =
        stratum::config::ConfigPaths::get_profile_config_file("unittest");
    const fs::path profile_dir = profile_path.parent_path();
    const bool created_dir = fs::create_directories(profile_dir);
    {
        std::ofstream ofs(profile_path.string());
        ofs << "app:\n  database_url: postgresql://test-db/app\n";
    }

    auto& config_manager = stratum::config::ConfigManager::instance();
    BOOST_CHECK_NO_THROW(
        config_manager.load_config_with_profile(base_path.string(), "unittest"));

    fs::remove(profile_path);
    if (created_dir) {
        fs::remove_all(profile_dir);
    }

    BOOST_CHECK_EQUAL(config_manager.get_value<std::string>("app.database_url", ""),
                      "postgresql://test-db/app");
    BOOST_CHECK_EQUAL(config_manager.get_value<std::string>("app.name", ""),
                      "base");
    BOOST_CHECK_THROW(config_manager.load_config_with_profile(
                          base_path.string(), "absent-profile"),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_reset) {
    fs::path config_path =
        create_temp_file("reset_test.yaml", "temp:\n  data: should_be_reset\n");
    auto& config_manager = stratum::config::ConfigManager::instance();

    config_manager.load_config(config_path.string());
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        "should_be_reset");

    config_manager.reset();
    BOOST_CHECK_THROW(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        boost::property_tree::ptree_bad_path);
}

BOOST_AUTO_TEST_SUITE_END()
