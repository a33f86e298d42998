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

#include "log.h"
#include <cstdio>
#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>

namespace flashkv {

    /**
     * Sends all logger output to <logdir>/flashkv.log for the lifetime of
     * the manager. Output goes back to stderr on destruction.
     */
    class LogManager {
    public:
        explicit LogManager(const std::string& logdir, bool append = true)
            : _file(nullptr) {
            boost::filesystem::path dir(logdir);
            if (dir.empty()) {
                throw std::invalid_argument("LogManager: empty log directory");
            }
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("LogManager: can't create [" + dir.string() + "]: " + ec.message());
            }
            if (!boost::filesystem::is_directory(dir)) {
                throw std::runtime_error("LogManager: logpath [" + dir.string() + "] should be a directory");
            }

            _path = (dir / "flashkv.log").string();
            bool exists = boost::filesystem::exists(_path);

            _file = fopen(_path.c_str(), append ? "a" : "w");
            if (!_file) {
                throw std::runtime_error("LogManager: can't open [" + _path + "] for log file: " +
                                         errnoWithDescription());
            }

            if (append && exists) {
                const std::string msg = "\n\n***** STORE RESTARTED *****\n\n";
                fwrite(msg.data(), 1, msg.size(), _file);
            }

            Logger::setLogFile(_file);
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

    private:
        std::string _path;
        FILE* _file;
    };
}
