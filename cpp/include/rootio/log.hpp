// rootio – minimal leveled logger
//
//   rootio::debug() << "opened " << path << " (" << nkeys << " keys)";
//
// A line is emitted to stderr when the returned object goes out of scope.
// The threshold defaults to ROOTIO_LOG_LEVEL (trace|debug|info|warning|error|off).
#pragma once

#include <sstream>
#include <string>

namespace rootio {

enum class LogLevel { kTrace, kDebug, kInfo, kWarning, kError, kOff };

void     set_log_level(LogLevel level);
LogLevel log_level();
bool     parse_log_level(const std::string& s, LogLevel& out);

class LogLine {
public:
    explicit LogLine(LogLevel level);
    ~LogLine();
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;
    LogLine(LogLine&& o) noexcept;

    template <class T>
    LogLine& operator<<(const T& v) {
        if (enabled_) ss_ << v;
        return *this;
    }

private:
    LogLevel           level_;
    bool               enabled_;
    std::ostringstream ss_;
};

inline LogLine trace()   { return LogLine(LogLevel::kTrace); }
inline LogLine debug()   { return LogLine(LogLevel::kDebug); }
inline LogLine info()    { return LogLine(LogLevel::kInfo); }
inline LogLine warning() { return LogLine(LogLevel::kWarning); }
inline LogLine error()   { return LogLine(LogLevel::kError); }

} // namespace rootio
