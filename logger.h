#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

class Logger {
public:
    // Non-copyable singleton
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Initialize sinks. Safe to call more than once (tests re-init with stdout only).
    void init(bool use_stdout = true, bool use_stderr = true, bool use_file = false,
              const std::string&        file_path = "logs/intercom_hub.log",
              spdlog::level::level_enum lvl       = spdlog::level::info);

    void set_level(spdlog::level::level_enum lvl);

    // Parses "debug" / "info" / "warn" / "warning" / "error" (case-insensitive).
    // Unknown names map to info.
    static spdlog::level::level_enum parse_level(std::string_view name);

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    void flush();

private:
    Logger()  = default;
    ~Logger() = default;

    void rebuild_logger_locked();

    std::mutex                      mutex_;
    std::shared_ptr<spdlog::logger> logger_;

    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink_;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt>   file_sink_;

    bool stdout_enabled_ = true;
    bool stderr_enabled_ = true;
    bool file_enabled_   = false;

    spdlog::level::level_enum level_ = spdlog::level::info;
};

namespace Log {
template <typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().error(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().debug(fmt, std::forward<Args>(args)...);
}
}  // namespace Log
