#pragma once

// Windows defines ERROR as a macro
#ifdef ERROR
#undef ERROR
#endif

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <memory>
#include <string>
#include <utility>

namespace quarry {
namespace utils {

/// Process-wide logging facade. Messages emitted before init() are dropped.
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // An empty log_file keeps output on the console only.
    static void init(const std::string& log_file = "quarry.log", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();
    static std::shared_ptr<spdlog::logger> get();

    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);
    // Unknown names map to INFO
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args) {
        if (logger_) {
            logger_->log(toSpdlog(level), fmt::runtime(std::forward<FormatString>(fmt)),
                         std::forward<Args>(args)...);
        }
    }

private:
    static spdlog::level::level_enum toSpdlog(Level level);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace quarry

#define QUARRY_DEBUG(...) ::quarry::utils::Logger::log(::quarry::utils::Logger::Level::DEBUG, __VA_ARGS__)
#define QUARRY_INFO(...) ::quarry::utils::Logger::log(::quarry::utils::Logger::Level::INFO, __VA_ARGS__)
#define QUARRY_WARN(...) ::quarry::utils::Logger::log(::quarry::utils::Logger::Level::WARN, __VA_ARGS__)
#define QUARRY_ERROR(...) ::quarry::utils::Logger::log(::quarry::utils::Logger::Level::ERROR, __VA_ARGS__)
