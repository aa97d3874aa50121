#ifndef LOGLEVEL_HPP
#define LOGLEVEL_HPP

#include <string>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static const std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static const std::string INFO_LOG_PREFIX = "[Info] ";
    static const std::string WARN_LOG_PREFIX = "[Warning] ";
    static const std::string CERROR_LOG_PREFIX = "[Error] ";
    static const std::string SETUP_LOG_PREFIX = "[Setup] ";
}

#endif // LOGLEVEL_HPP
