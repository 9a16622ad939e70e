/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace leasemap {

/**
 * RAII manager for the logging subsystem.
 *
 * Usage:
 *   - Tests: create in SetUpTestSuite(), destroy in TearDownTestSuite()
 *   - Programs: create at startup, destroy at shutdown
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;  // Empty = LEASEMAP_LOG_DIR or the temp directory
        bool read_env_level;  // Apply LOG_LEVEL after initial_level
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , read_env_level(true)
            , initial_level(LOG_WARNING) {}
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config), saved_level_(logLevel.load(std::memory_order_relaxed)) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);
        if (config_.read_env_level) {
            initLoggingFromEnv();
        }

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir);
        }
    }

    ~LogRuntime() {
        shutdown();
        logLevel.store(saved_level_, std::memory_order_relaxed);
    }

    /**
     * Close the log file and fall back to stderr. Safe to call twice.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        log_manager_.reset();
    }

    LogManager* logManager() { return log_manager_.get(); }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    int saved_level_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

} // namespace leasemap
