#pragma once

#include <string>

#include "stratum/config/config.hpp"
#include "stratum/di/container.hpp"

namespace stratum::di {

// "container" section of the configuration file
class ContainerConfig
    : public config::ClonableConfigurationProperties<ContainerConfig> {
public:
    int slow_creation_warning_ms = 0;
    bool log_resolutions = false;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "container"; }

    ContainerOptions to_options() const;
};

}  // namespace stratum::di
