#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <vector>

void Logger::init(bool use_stdout, bool use_stderr, bool use_file, const std::string& file_path,
                  spdlog::level::level_enum lvl) {
    std::scoped_lock lock(mutex_);
    stdout_enabled_ = use_stdout;
    stderr_enabled_ = use_stderr;
    file_enabled_   = use_file;
    level_          = lvl;

    if (use_stdout && !stdout_sink_) {
        stdout_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        stdout_sink_->set_pattern("[%T] [%^%l%$] %v");
        stdout_sink_->set_level(spdlog::level::debug);
    }

    if (use_stderr && !stderr_sink_) {
        stderr_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        stderr_sink_->set_pattern("[%T] [%^%l%$] %v");
        stderr_sink_->set_level(spdlog::level::warn);
    }

    if (use_file && !file_sink_) {
        try {
            std::filesystem::path path(file_path);
            if (!path.parent_path().empty()) {
                std::filesystem::create_directories(path.parent_path());
            }
            file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            file_sink_->set_pattern("[%Y-%m-%d %T.%e] [%^%l%$] %v");
        } catch (const std::exception& e) {
            fprintf(stderr, "Logger: failed to create log file (%s): %s\n", file_path.c_str(),
                    e.what());
        }
    }

    // The pool outlives re-initialisation; replacing it would orphan the async logger
    if (!spdlog::thread_pool()) {
        spdlog::init_thread_pool(8192, 1);
    }
    rebuild_logger_locked();

    if (logger_) {
        spdlog::set_default_logger(logger_);
    }
    spdlog::flush_every(std::chrono::milliseconds(3000));
}

void Logger::set_level(spdlog::level::level_enum lvl) {
    std::scoped_lock lock(mutex_);
    level_ = lvl;
    if (logger_) {
        logger_->set_level(lvl);
    }
}

spdlog::level::level_enum Logger::parse_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return spdlog::level::debug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return spdlog::level::warn;
    }
    if (lowered == "error") {
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

void Logger::rebuild_logger_locked() {
    std::vector<spdlog::sink_ptr> sinks;
    if (stdout_enabled_ && stdout_sink_) {
        sinks.push_back(stdout_sink_);
    }
    if (stderr_enabled_ && stderr_sink_) {
        sinks.push_back(stderr_sink_);
    }
    if (file_enabled_ && file_sink_) {
        sinks.push_back(file_sink_);
    }

    if (sinks.empty()) {
        logger_.reset();
        return;
    }

    logger_ = std::make_shared<spdlog::async_logger>("hub", sinks.begin(), sinks.end(),
                                                     spdlog::thread_pool(),
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(level_);
    logger_->flush_on(spdlog::level::warn);
}

void Logger::flush() {
    std::scoped_lock lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}
