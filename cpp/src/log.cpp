// rootio – leveled logger implementation

#include "rootio/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace rootio {

namespace {

LogLevel level_from_env() {
    const char* env = std::getenv("ROOTIO_LOG_LEVEL");
    LogLevel lvl = LogLevel::kWarning;
    if (env) parse_log_level(env, lvl);
    return lvl;
}

std::atomic<int>& threshold() {
    static std::atomic<int> lvl{static_cast<int>(level_from_env())};
    return lvl;
}

std::mutex& sink_mu() {
    static std::mutex mu;
    return mu;
}

const char* level_name(LogLevel l) {
    switch (l) {
        case LogLevel::kTrace:   return "TRACE";
        case LogLevel::kDebug:   return "DEBUG";
        case LogLevel::kInfo:    return "INFO";
        case LogLevel::kWarning: return "WARN";
        case LogLevel::kError:   return "ERROR";
        default:                 return "?";
    }
}

} // namespace

void set_log_level(LogLevel level) {
    threshold().store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(threshold().load());
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "trace")   { out = LogLevel::kTrace;   return true; }
    if (s == "debug")   { out = LogLevel::kDebug;   return true; }
    if (s == "info")    { out = LogLevel::kInfo;    return true; }
    if (s == "warning") { out = LogLevel::kWarning; return true; }
    if (s == "error")   { out = LogLevel::kError;   return true; }
    if (s == "off")     { out = LogLevel::kOff;     return true; }
    return false;
}

LogLine::LogLine(LogLevel level)
    : level_(level),
      enabled_(static_cast<int>(level) >= threshold().load()
               && level != LogLevel::kOff) {}

LogLine::LogLine(LogLine&& o) noexcept
    : level_(o.level_), enabled_(o.enabled_), ss_(std::move(o.ss_)) {
    o.enabled_ = false;
}

LogLine::~LogLine() {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(sink_mu());
    std::fprintf(stderr, "[rootio] %-5s %s\n", level_name(level_),
                 ss_.str().c_str());
}

} // namespace rootio
