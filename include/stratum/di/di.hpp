#pragma once

/**
 * @file di.hpp
 * @brief Stratum dependency injection runtime
 *
 * Tag-keyed containers with single-flight asynchronous creation, scoped
 * child containers with ordered teardown, and layers that compose
 * registrations with checked requirement manifests.
 */

#include "stratum/di/container.hpp"
#include "stratum/di/container_config.hpp"
#include "stratum/di/errors.hpp"
#include "stratum/di/layer.hpp"
#include "stratum/di/scoped_container.hpp"
#include "stratum/di/service.hpp"
#include "stratum/di/tag.hpp"
