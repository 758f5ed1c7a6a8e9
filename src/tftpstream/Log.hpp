/*
 * Copyright (C) 2026 The libtftpstream developers
 *
 * This file is part of libtftpstream
 *
 * libtftpstream is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef TFTPSTREAM_LOG_HPP
#define TFTPSTREAM_LOG_HPP

#include <functional>
#include <atomic>
#include <string>
#include <mutex>
#include <cstdlib>
#include <cstdarg>
#include <syslog.h>


namespace tftpstream {


    /**
     * Callback for log messages.
     * Called for every message logged with one of the methods in class Log
     * that passes the current priority threshold.
     *
     * <b>NOTE:</b> Do not call Log::set_callback from inside
     *              the callback since it will cause a deadlock!
     *
     * @param priority A syslog priority (LOG_EMERG ... LOG_DEBUG).
     * @param message A null terminated string containing the log message.
     */
    using log_callback_t = std::function<void (unsigned int priority,
                                               const char* message)>;


    /**
     * The default log callback.
     * Sends the message to the system logger using <code>syslog()</code>.
     * <code>openlog()</code> is not called, that is up to the application.
     */
    void default_log_callback (unsigned int priority, const char* message);


    /**
     * Log messages produced by libtftpstream.
     * Messages are logged with the syslog priority values. Messages with
     * a lower priority than the current threshold are discarded before
     * they are formatted. The default threshold is LOG_EMERG, so nothing
     * but emergencies are logged until the application raises it.
     *
     * All methods are static.
     */
    class Log {
    public:
        static constexpr unsigned int default_prio_level = LOG_EMERG;

        Log () = delete;

        /**
         * Get the current log priority threshold.
         */
        static unsigned int priority () {
            return prio_level;
        }

        /**
         * Set the log priority threshold.
         * @param priority_threshold Messages with a lower priority
         *                           (higher numerical value) are not logged.
         */
        static void priority (unsigned int priority_threshold) {
            prio_level = priority_threshold;
        }

        static void emerg (const char* format, ...) {
            if (prio_level >= LOG_EMERG) {
                va_list args;
                va_start (args, format);
                log (LOG_EMERG, format, args);
                va_end (args);
            }
        }

        static void alert (const char* format, ...) {
            if (prio_level >= LOG_ALERT) {
                va_list args;
                va_start (args, format);
                log (LOG_ALERT, format, args);
                va_end (args);
            }
        }

        static void critical (const char* format, ...) {
            if (prio_level >= LOG_CRIT) {
                va_list args;
                va_start (args, format);
                log (LOG_CRIT, format, args);
                va_end (args);
            }
        }

        static void error (const char* format, ...) {
            if (prio_level >= LOG_ERR) {
                va_list args;
                va_start (args, format);
                log (LOG_ERR, format, args);
                va_end (args);
            }
        }

        static void warning (const char* format, ...) {
            if (prio_level >= LOG_WARNING) {
                va_list args;
                va_start (args, format);
                log (LOG_WARNING, format, args);
                va_end (args);
            }
        }

        static void notice (const char* format, ...) {
            if (prio_level >= LOG_NOTICE) {
                va_list args;
                va_start (args, format);
                log (LOG_NOTICE, format, args);
                va_end (args);
            }
        }

        static void info (const char* format, ...) {
            if (prio_level >= LOG_INFO) {
                va_list args;
                va_start (args, format);
                log (LOG_INFO, format, args);
                va_end (args);
            }
        }

        static void debug (const char* format, ...) {
            if (prio_level >= LOG_DEBUG) {
                va_list args;
                va_start (args, format);
                log (LOG_DEBUG, format, args);
                va_end (args);
            }
        }

        /**
         * Replace the function that receives the formatted log messages.
         *
         * <b>NOTE:</b> Do not call this method from inside the
         *              log callback, it will cause a deadlock!
         *
         * @param callback The new log callback. If <code>nullptr</code>,
         *                 log messages are discarded.
         * @see default_log_callback
         */
        static void set_callback (log_callback_t callback);


    private:
        static void log (unsigned int priority, const char* format, va_list& args);

        static std::mutex log_mutex;
        static std::atomic_uint prio_level;
        static log_callback_t cb;
    };

}
#endif
