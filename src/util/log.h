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

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <boost/thread/mutex.hpp>
#include <boost/thread/tss.hpp>

namespace flashkv {

    enum LogLevel {
        LOG_TRACE,    // page level detail: opens, erases, relocations
        LOG_DEBUG,    // compaction and recovery steps
        LOG_INFO,     // open/clear summaries
        LOG_WARNING,  // torn tails, discarded transactions
        LOG_ERROR,    // failed operations
        LOG_SEVERE    // corruption
    };

    class Tee {
    public:
        virtual ~Tee() {}
        virtual void write(LogLevel level, const std::string& str) = 0;
    };

    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        static Tee* tee;
        static boost::thread_specific_ptr<Logger> tsp;

        std::stringstream ss;
        LogLevel logLevel;
        std::string _threadName;

    public:
        /**
         * Redirect every logger to f. nullptr restores stderr.
         */
        static void setLogFile(FILE* f);

        /**
         * Mirror every flushed line to t (tests capture output this way).
         */
        static void setTee(Tee* t);

        void flush();

        inline const std::string& getThreadName() const { return _threadName; }
        inline void setThreadName(const std::string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        template<typename T>
        Logger& operator<<(const T& x) { ss << x; return *this; }

        // uint8_t would otherwise print as a character
        Logger& operator<<(unsigned char x) { ss << static_cast<unsigned>(x); return *this; }

        Logger& operator<<(std::ostream& (*_endl)(std::ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }

        static Logger& get() {
            Logger* p = tsp.get();
            if (p == nullptr)
                tsp.reset(p = new Logger());
            return *p;
        }

        static std::string time_t_to_String(time_t t = time(0)) {
            char buf[26];
            ctime_r(&t, buf);
            buf[24] = 0; // drop the \n
            return buf;
        }

    private:
        Logger() { _init(); _threadName = "FLASHKV"; }
        void _init() {
            ss.str("");
            ss.clear();
            logLevel = LOG_INFO;
        }
    };

    extern std::atomic<int> logLevel;

    const char* logLevelToString(LogLevel l);

    // Auto-flushing wrapper: one log line per statement
    class LoggerWrapper {
        Logger* logger_;
    public:
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}
        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;
        LoggerWrapper(LoggerWrapper&& other) noexcept : logger_(other.logger_) {
            other.logger_ = nullptr;
        }

        ~LoggerWrapper() {
            if (logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }
    };

    inline LoggerWrapper log(LogLevel l) {
        if (l < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr);
        return LoggerWrapper(&Logger::get().setLogLevel(l));
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline std::string errnoWithDescription(int x = errno) {
        std::stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

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

    // LOG_LEVEL environment variable, e.g. LOG_LEVEL=debug
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
