/*
 * MIT License
 * 
 * Copyright (c) 2022 Robin E. R. Davies
 * 
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <stdexcept>
#ifdef __linux__
#include <syslog.h>
#endif

namespace cotask
{

    enum class LogLevel
    {
        Debug,
        Info,
        Warning,
        Error
    };

    /**
     * @brief Parse a log level name.
     *
     * @param name One of "debug", "info", "warning" or "error".
     * @throws std::invalid_argument if the name is not recognized.
     */
    LogLevel ParseLogLevel(const std::string &name);

    class ILog
    {
    public:
        virtual ~ILog() {}

        virtual void SetLogLevel(LogLevel logLevel) { this->logLevel = logLevel; }

        virtual LogLevel GetLogLevel() const { return this->logLevel; }

        void Debug(const std::string &message)
        {
            if (logLevel <= LogLevel::Debug)
            {
                OnDebug(message);
            }
        }
        void Info(const std::string &message)
        {
            if (logLevel <= LogLevel::Info)
            {
                OnInfo(message);
            }
        }
        void Warning(const std::string &message)
        {
            if (logLevel <= LogLevel::Warning)
            {
                OnWarning(message);
            }
        }
        void Error(const std::string &message)
        {
            if (logLevel <= LogLevel::Error)
            {
                OnError(message);
            }
        }

    protected:
        virtual void OnDebug(const std::string &message) = 0;
        virtual void OnInfo(const std::string &message) = 0;
        virtual void OnWarning(const std::string &message) = 0;
        virtual void OnError(const std::string &message) = 0;

    private:
        LogLevel logLevel = LogLevel::Warning;
    };

    /**
     * @brief Writes log messages to stdout.
     *
     * The default logger.
     */
    class ConsoleLog : public ILog
    {
    private:
        std::mutex mutex;

        static std::string now();

        void Write(const char *level, const std::string &message)
        {
            std::lock_guard lock{mutex};
            std::cout << now() << " " << level << ": " << message << std::endl;
        }

    protected:
        virtual void OnDebug(const std::string &message) { Write("Debug", message); }
        virtual void OnInfo(const std::string &message) { Write("Info", message); }
        virtual void OnWarning(const std::string &message) { Write("Warning", message); }
        virtual void OnError(const std::string &message) { Write("Error", message); }
    };

#ifdef __linux__
    /**
     * @brief Write log messages to the systemd journal. (Linux only)
     *
     * Must be running under systemd for this to work. The configured
     * log level still controls which messages reach the journal.
     */
    class SystemdLog : public ILog
    {
    private:
        std::mutex mutex_;

        void Write(int priority, const std::string &message)
        {
            std::lock_guard lock{mutex_};
            syslog(priority, "%s", message.c_str());
        }

    protected:
        virtual void OnDebug(const std::string &message) { Write(LOG_DEBUG, message); }
        virtual void OnInfo(const std::string &message) { Write(LOG_NOTICE, message); }
        virtual void OnWarning(const std::string &message) { Write(LOG_WARNING, message); }
        virtual void OnError(const std::string &message) { Write(LOG_ERR, message); }
    };
#endif

} // namespace
