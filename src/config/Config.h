#pragma once

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

}  // namespace config
