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
#include "logmanager.h"

namespace leasemap {

    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;
    std::atomic<int> logLevel(LOG_WARNING);

    const char* logLevelToString( LogLevel l ) {
        switch(l) {
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
        string msg = ss.str();

        ostringstream oss;
        oss << time_t_to_String();
        oss << " [" << getThreadName() << "] ";

        for ( int i=0; i<indent; i++ )
            oss << '\t';

        oss << '[' << logLevelToString(logLevel) << "] ";
        oss << msg;

        boost::mutex::scoped_lock lk(sm);
        string out = oss.str();

        FILE* f = logfile ? logfile : stderr;
        if(fprintf(f, "%s", out.c_str())>=0) {
            fflush(f);
        }
        else {
            int x = errno;
            cerr << "Failed to write to logfile: " << errnoWithDescription(x) << ": " << out << endl;
        }
        _init();
    }

    void Logger::setLogFile( FILE* f ) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }

    FILE* Logger::getLogFile() {
        boost::mutex::scoped_lock lk(sm);
        return logfile ? logfile : stderr;
    }
}
