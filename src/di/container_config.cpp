#include "stratum/di/container_config.hpp"

#include <stdexcept>

namespace stratum::di {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    slow_creation_warning_ms =
        get_value(pt, "slow_creation_warning_ms", slow_creation_warning_ms);
    log_resolutions = get_value(pt, "log_resolutions", log_resolutions);
}

void ContainerConfig::validate() const {
    if (slow_creation_warning_ms < 0) {
        throw std::invalid_argument(
            "container.slow_creation_warning_ms must be >= 0");
    }
}

ContainerOptions ContainerConfig::to_options() const {
    ContainerOptions options;
    options.slow_creation_warning =
        std::chrono::milliseconds{slow_creation_warning_ms};
    options.log_resolutions = log_resolutions;
    return options;
}

}  // namespace stratum::di
