// Layered application: configuration values, infrastructure, repositories
// and services composed from layers, with one child scope per request.

#include <boost/program_options.hpp>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "stratum/config/config.hpp"
#include "stratum/di/di.hpp"
#include "stratum/log/logger.hpp"

namespace po = boost::program_options;
namespace di = stratum::di;

namespace {

struct RedisConfig {
    std::string url;
    std::string password;
};

class DatabaseConnection {
public:
    static constexpr const char* tag_name = "DatabaseConnection";

    explicit DatabaseConnection(std::string connection_string)
        : connection_string_(std::move(connection_string)) {
        STRATUM_LOG_INFO << "Connected to " << connection_string_;
    }

    std::string query(const std::string& sql) const {
        STRATUM_LOG_DEBUG << "Executing: " << sql << " on "
                          << connection_string_;
        return "{\"id\": 1, \"name\": \"test\"}";
    }

    void close() { STRATUM_LOG_INFO << "Closed " << connection_string_; }

private:
    std::string connection_string_;
};

class CacheService {
public:
    static constexpr const char* tag_name = "CacheService";

    explicit CacheService(RedisConfig config) : config_(std::move(config)) {}

    std::string get(const std::string& key) const {
        STRATUM_LOG_DEBUG << "Cache GET: " << key << " from " << config_.url;
        return {};
    }

    void set(const std::string& key, const std::string&) const {
        STRATUM_LOG_DEBUG << "Cache SET: " << key << " to " << config_.url;
    }

private:
    RedisConfig config_;
};

class UserRepository {
public:
    static constexpr const char* tag_name = "UserRepository";

    explicit UserRepository(std::shared_ptr<DatabaseConnection> db)
        : db_(std::move(db)) {}

    std::string find_by_id(int id) const {
        return db_->query("SELECT * FROM users WHERE id = " +
                          std::to_string(id));
    }

private:
    std::shared_ptr<DatabaseConnection> db_;
};

class UserService {
public:
    static constexpr const char* tag_name = "UserService";

    UserService(std::shared_ptr<UserRepository> users,
                std::shared_ptr<CacheService> cache)
        : users_(std::move(users)), cache_(std::move(cache)) {}

    std::string get_user(int id) const {
        const auto key = "user:" + std::to_string(id);
        auto cached = cache_->get(key);
        if (!cached.empty()) {
            return cached;
        }
        auto user = users_->find_by_id(id);
        cache_->set(key, user);
        return user;
    }

private:
    std::shared_ptr<UserRepository> users_;
    std::shared_ptr<CacheService> cache_;
};

class RequestHandler {
public:
    RequestHandler(std::shared_ptr<UserService> users, int request_id)
        : users_(std::move(users)), request_id_(request_id) {}

    std::string handle() const { return users_->get_user(request_id_); }

    int request_id() const { return request_id_; }

private:
    std::shared_ptr<UserService> users_;
    int request_id_;
};

const auto connection_string = di::Tag<std::string>::of("ConnectionString");
const auto redis_config = di::Tag<RedisConfig>::of("RedisConfig");
const auto request_id = di::Tag<int>::of("RequestId");
const auto request_handler = di::Tag<RequestHandler>::of("RequestHandler");

di::Layer configuration_layer() {
    auto& config = stratum::config::ConfigManager::instance();
    return di::merge(
        di::value(connection_string,
                  config.get_value<std::string>(
                      "app.database_url", "postgresql://localhost:5432/app")),
        di::value(redis_config,
                  RedisConfig{config.get_value<std::string>(
                                  "app.redis.url", "redis://localhost:6379"),
                              config.get_value<std::string>(
                                  "app.redis.password", "")}));
}

di::Layer application_layer() {
    const auto& db = di::service_tag<DatabaseConnection>();
    const auto& cache = di::service_tag<CacheService>();
    const auto& repository = di::service_tag<UserRepository>();
    const auto& users = di::service_tag<UserService>();

    auto database_layer = di::service(
        db, {connection_string},
        [](const di::ResolutionContext& context) {
            return std::make_shared<DatabaseConnection>(
                *context.get(connection_string));
        },
        [](DatabaseConnection& connection) { connection.close(); });

    // The cache client connects asynchronously
    auto cache_layer =
        di::service(cache, {redis_config},
                    [](const di::ResolutionContext& context) {
                        return std::async(std::launch::async, [context]() {
                            return std::make_shared<CacheService>(
                                *context.get(redis_config));
                        });
                    });

    auto repository_layer = di::auto_service(repository, db);
    auto user_service_layer = di::auto_service(users, repository, cache);

    auto infrastructure = di::merge(database_layer, cache_layer);
    auto services = user_service_layer.provide_merge(
        repository_layer.provide_merge(infrastructure));
    return configuration_layer().to(services);
}

void handle_request(di::ScopedContainer& root, int id) {
    auto scope = root.child("request-" + std::to_string(id));
    try {
        scope->add_instance(request_id, std::make_shared<int>(id));
        scope->add_factory(
            request_handler,
            [](const di::ResolutionContext& context) {
                return std::make_shared<RequestHandler>(
                    context.get(di::service_tag<UserService>()),
                    *context.get(request_id));
            },
            [](RequestHandler& handler) {
                STRATUM_LOG_DEBUG << "Request " << handler.request_id()
                                  << " finished";
            });

        auto handler = scope->get(request_handler);
        STRATUM_LOG_INFO << "Request " << id << ": " << handler->handle();
    } catch (...) {
        scope->destroy();
        throw;
    }
    scope->destroy();
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Layered application options");
        desc.add_options()("help,h", "Show help")(
            "config,c", po::value<std::string>(), "Configuration file")(
            "profile,p", po::value<std::string>(), "Configuration profile")(
            "requests,n", po::value<int>()->default_value(3),
            "Number of concurrent requests to simulate");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        auto& config = stratum::config::ConfigManager::instance();
        auto log_config = stratum::config::ConfigurationPropertiesFactory<
            stratum::log::LogConfig>::create_and_register();
        auto container_config = stratum::config::ConfigurationPropertiesFactory<
            di::ContainerConfig>::create_and_register();

        if (vm.count("config")) {
            const auto file = vm["config"].as<std::string>();
            if (vm.count("profile")) {
                config.load_config_with_profile(
                    file, vm["profile"].as<std::string>());
            } else {
                config.load_config(file);
            }
        }
        stratum::log::Logger::init(*log_config);

        auto application = application_layer();
        auto built = application.build(container_config->to_options());
        auto root = di::scoped(*built, "application");

        const int requests = vm["requests"].as<int>();
        std::vector<std::future<void>> running;
        for (int id = 1; id <= requests; ++id) {
            running.push_back(std::async(std::launch::async, [&root, id]() {
                handle_request(*root, id);
            }));
        }

        int exit_code = 0;
        for (auto& request : running) {
            try {
                request.get();
            } catch (const di::DependencyContainerError& e) {
                STRATUM_LOG_ERROR << "Request failed: " << e.dump().dump();
                exit_code = 1;
            } catch (const std::exception& e) {
                STRATUM_LOG_ERROR << "Request failed: " << e.what();
                exit_code = 1;
            }
        }

        try {
            root->destroy();
        } catch (const di::DependencyFinalizationError& e) {
            STRATUM_LOG_ERROR << "Shutdown failed: " << e.dump().dump();
            exit_code = 1;
        }

        stratum::log::Logger::shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
