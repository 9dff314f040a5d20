#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "stratum/log/log_config.hpp"

namespace stratum::log {

class Logger {
public:
    // Replaces the sinks installed by a previous init()
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
};

}  // namespace stratum::log

#define STRATUM_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define STRATUM_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define STRATUM_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define STRATUM_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define STRATUM_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define STRATUM_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
