// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <stdint.h>

// Severity, higher is more severe. 0 turns a sink off

#define LOG_SINK_DISABLED  0
#define LOG_LEVEL_VERBOSE  1
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_CRITICAL 6

#ifndef LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE_ENABLED 0
#endif

#ifndef LOG_DEBUG_ENABLED
    #ifdef NDEBUG
        #define LOG_DEBUG_ENABLED 0
    #else
        #define LOG_DEBUG_ENABLED 1
    #endif
#endif

// Compiled-out levels stream into this and vanish
struct LogMessageStub {
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

#define LOG_MESSAGE(LEVEL) if (!warden::Logger::will_log(LEVEL)) {} else warden::LogMessage(LEVEL)

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR()    LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING()  LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO()     LOG_MESSAGE(LOG_LEVEL_INFO)

#if LOG_DEBUG_ENABLED
    #define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
    #define LOG_DEBUG() LogMessageStub()
#endif

#if LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE() LOG_MESSAGE(LOG_LEVEL_VERBOSE)
#else
    #define LOG_VERBOSE() LogMessageStub()
#endif

namespace warden {

/// Single-letter tag of a level: V D I W E C, '~' when out of range
char loglevel_tag(int level);

/// Process-wide logger with a console sink and an optional file sink.
/// At most one exists at a time, messages are dropped while there is none
class Logger {
public:
    struct Settings {
        int flushLevel = LOG_LEVEL_WARNING;   // sinks are flushed for messages at or above
        int consoleLevel = LOG_LEVEL_DEBUG;   // stdout threshold
        int fileLevel = LOG_SINK_DISABLED;    // file threshold
        std::string filePrefix;               // file name is <prefix><timestamp>.log
        std::string filePath;                 // directory, created when missing
    };

    /// Installs the global logger, throws if one is already installed or no sink is enabled.
    /// The logger is uninstalled when the last reference goes away
    static std::shared_ptr<Logger> create(const Settings& s);

    static std::shared_ptr<Logger> create(
        int flushLevel=LOG_LEVEL_WARNING,
        int consoleLevel=LOG_LEVEL_DEBUG,
        int fileLevel=LOG_SINK_DISABLED,
        const std::string& filePrefix=std::string(),
        const std::string& filePath=std::string()
    );

    virtual ~Logger() {}

    /// strftime() pattern for the header timestamp, empty to omit it
    virtual void set_time_format(const std::string& format, bool printMilliseconds) = 0;

    /// Empty unless the file sink is on
    virtual const std::string& get_current_file_name() const = 0;

    static bool will_log(int level) {
        return s_pLogger && s_pLogger->level_accepted(level);
    }

protected:
    friend class LogMessage;

    virtual bool level_accepted(int level) const = 0;
    virtual void write_message(int level, uint64_t timestamp, const std::string& text) = 0;

    static Logger* s_pLogger;
};

/// Collects one line, hands it to the logger on destruction
class LogMessage {
public:
    explicit LogMessage(int level);
    ~LogMessage();

    LogMessage(const LogMessage&) = delete;
    LogMessage& operator=(const LogMessage&) = delete;

    template <class T> LogMessage& operator<<(const T& x) {
        _os << x;
        return *this;
    }

private:
    int _level;
    uint64_t _timestamp;
    std::ostream& _os;
};

/// Milliseconds since the Epoch
uint64_t local_timestamp_msec();

/// Local time per strftime() pattern, optionally followed by ".mmm"
std::string format_timestamp(const std::string& format, uint64_t timestamp, bool formatMsec=true);

} //namespace
