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
#include <sys/file.h>
#include <boost/filesystem.hpp>

namespace leasemap {

    /**
     * Routes all Logger output to <log_dir>/leasemap.log.
     * The previous sink is restored when the manager is destroyed.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir, bool append = true)
            : _append(append), _file(0), _previous(Logger::getLogFile()) {
            boost::filesystem::path dir(logdir.empty() ? defaultLogDir() : logdir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("LogManager: cannot create log directory " +
                                         dir.string() + ": " + ec.message());
            }
            _path = (dir / "leasemap.log").string();
            start();
        }

        ~LogManager() {
            Logger::setLogFile(_previous == stderr ? nullptr : _previous);
            if (_file) {
                fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            strftime(buf, sizeof(buf), fmt, &t);
            return buf;
        }

        /**
         * Move the current file aside under a timestamped name and reopen
         */
        void rotate() {
            if (_file) {
                stringstream ss;
                ss << _path << "." << terseCurrentTime(false);
                string s = ss.str();
                if (rename(_path.c_str(), s.c_str()) != 0) {
                    cerr << "can't rename " << _path << " to " << s << ": "
                         << errnoWithDescription() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if (!tmp) {
                throw std::runtime_error("LogManager: can't open " + _path + " for log file: " +
                                         errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if (_file) {
                fclose(_file);
            }
            _file = tmp;
        }

    private:
        static string defaultLogDir() {
            const char* dir = std::getenv("LEASEMAP_LOG_DIR");
            if (dir && *dir) {
                return dir;
            }
            return (boost::filesystem::temp_directory_path() / "leasemap").string();
        }

        void start() {
            if (boost::filesystem::is_directory(_path)) {
                throw std::runtime_error("LogManager: logpath [" + _path +
                                         "] should be a file name not a directory");
            }
            bool exists = boost::filesystem::exists(_path);
            rotate(); // _file is still null, so nothing is moved aside
            if (_append && exists) {
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), _file) != msg.size()) {
                    cerr << "can't write restart banner to " << _path << endl;
                }
                fflush(_file);
            }
        }

        bool _append;
        string _path;
        FILE* _file;
        FILE* _previous;
    };
}
