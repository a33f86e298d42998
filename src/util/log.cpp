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

#include "log.h"

namespace flashkv {

    std::atomic<int> logLevel{LOG_WARNING};

    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    Tee* Logger::tee = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    const char* logLevelToString(LogLevel l) {
        switch (l) {
        case LOG_TRACE:
            return "TRACE";
        case LOG_DEBUG:
            return "DEBUG";
        case LOG_INFO:
            return "INFO";
        case LOG_WARNING:
            return "WARNING";
        case LOG_ERROR:
            return "ERROR";
        case LOG_SEVERE:
            return "SEVERE";
        default:
            return "UNKNOWN";
        }
    }

    void Logger::flush() {
        std::string msg = ss.str();
        if (!msg.empty() && msg.back() == '\n')
            msg.pop_back();

        std::ostringstream oss;
        oss << time_t_to_String();
        oss << " [" << getThreadName() << "] ";
        oss << '[' << logLevelToString(logLevel) << "] ";
        oss << msg << '\n';
        std::string out = oss.str();

        boost::mutex::scoped_lock lk(sm);

        if (tee) tee->write(logLevel, out);

        FILE* f = logfile ? logfile : stderr;
        if (fprintf(f, "%s", out.c_str()) >= 0) {
            fflush(f);
        }
        else {
            int x = errno;
            std::cerr << "Failed to write to logfile: " << errnoWithDescription(x) << ": " << out;
        }
        _init();
    }

    void Logger::setLogFile(FILE* f) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }

    void Logger::setTee(Tee* t) {
        boost::mutex::scoped_lock lk(sm);
        tee = t;
    }
}
