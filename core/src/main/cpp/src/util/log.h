/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "../pch.h"
#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <type_traits>
#include <atomic>
#include <boost/filesystem/path.hpp>

namespace leasemap {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // Support engineering: per-operation tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString( LogLevel l );

    class Logger {
        static boost::mutex sm;
        stringstream ss;
        int indent;
        LogLevel logLevel;
        static FILE* logfile;
        string _threadName;
    public:

        friend class LogManager;

        /**
         * set the log file, nullptr restores stderr
         */
        static void setLogFile(FILE* f);
        static FILE* getLogFile();

        void flush();

        inline string getThreadName() { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        Logger& operator<<(const char *x)   { ss << x; return *this; }
        Logger& operator<<(const string& x) { ss << x; return *this; }
        Logger& operator<<(char *x)         { ss << x; return *this; }
        Logger& operator<<(char x)          { ss << x; return *this; }
        Logger& operator<<(int x)           { ss << x; return *this; }
        Logger& operator<<(long x)          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) { ss << x; return *this; }
        Logger& operator<<(unsigned x)      { ss << x; return *this; }
        Logger& operator<<(unsigned short x){ ss << x; return *this; }
        Logger& operator<<(double x)        { ss << x; return *this; }
        Logger& operator<<(void *x)         { ss << x; return *this; }
        Logger& operator<<(const void *x)   { ss << x; return *this; }
        Logger& operator<<(long long x)     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { ss << x; return *this; }
        Logger& operator<<(bool x)               { ss << x; return *this; }

        template<typename PathType>
        typename std::enable_if<
            std::is_same<PathType, boost::filesystem::path>::value,
            Logger&
        >::type operator<<(const PathType& p) {
            ss << p.string();
            return *this;
        }

        Logger& operator<< (ostream& ( *)(ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }
        Logger& operator<< (ios_base& (*_hex)(ios_base&)) {
            ss << _hex;
            return *this;
        }

        /**
         * converts time_t to a string
         */
        inline string time_t_to_String(time_t t = time(0)) {
            char buf[26];
            ctime_r(&t, buf);
            buf[24] = 0; // don't want the \n
            return buf;
        }

        Logger& prolog() {
            return *this;
        }

        void indentInc(){ indent++; }
        void indentDec(){ indent--; }
        int getIndent() const { return indent; }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() : indent(0) {
            _threadName = "LEASEMAP";
            _init();
        }
        void _init() {
            ss.str("");
            logLevel = LOG_INFO;
        }
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }
    };

    extern std::atomic<int> logLevel;

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        __attribute__((always_inline))
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        ~LoggerWrapper() {
            // filtered messages carry a nullptr logger
            if (should_flush_ && logger_) {
                (*logger_) << '\n';
                logger_->flush();
            }
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushes
            }
            return *this;
        }
    };

    __attribute__((always_inline))
    inline LoggerWrapper trace() {
        if (LOG_TRACE < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel(LOG_TRACE), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper debug() {
        if (LOG_DEBUG < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel(LOG_DEBUG), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper info() {
        if (LOG_INFO < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel(LOG_INFO), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper warning() {
        if (LOG_WARNING < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel(LOG_WARNING), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper warn() {
        return warning();
    }

    __attribute__((always_inline))
    inline LoggerWrapper error() {
        if (LOG_ERROR < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel(LOG_ERROR), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper severe() {
        if (LOG_SEVERE < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel(LOG_SEVERE), true);
    }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    struct LogIndentLevel {
        LogIndentLevel() {
            Logger::get().indentInc();
        }
        ~LogIndentLevel() {
            Logger::get().indentDec();
        }
    };

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")   { logLevel.store(LOG_TRACE, std::memory_order_relaxed); return true; }
        if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG, std::memory_order_relaxed); return true; }
        if (upper == "INFO")    { logLevel.store(LOG_INFO, std::memory_order_relaxed); return true; }
        if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
        if (upper == "ERROR")   { logLevel.store(LOG_ERROR, std::memory_order_relaxed); return true; }
        if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

        return false;
    }

    // Initialize logging from the LOG_LEVEL environment variable
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level) {
            if (!setLogLevelFromString(env_level)) {
                std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                          << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }
        }
    }

}
