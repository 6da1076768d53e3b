#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "enumtag/log/log_config.hpp"

namespace enumtag::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace enumtag::log

#define ENUMTAG_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define ENUMTAG_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define ENUMTAG_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define ENUMTAG_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define ENUMTAG_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define ENUMTAG_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
