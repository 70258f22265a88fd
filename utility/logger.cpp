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

#include "logger.h"
#include "common.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>

#if defined(__clang__)
#  pragma clang diagnostic push
#  pragma clang diagnostic ignored "-Wunknown-warning-option"
#  pragma clang diagnostic ignored "-Wtautological-constant-compare"
#endif

#include <boost/iostreams/filtering_stream.hpp>

#if defined(__clang__)
#  pragma clang diagnostic pop
#endif

#include <stdexcept>
#include <chrono>
#include <mutex>
#include <vector>
#include <stdio.h>
#include <time.h>

namespace warden {

Logger* Logger::s_pLogger = nullptr;

char loglevel_tag(int level) {
    static const char tags[] = "~VDIWEC";
    return ((level > 0) && (level < int(sizeof(tags) - 1))) ? tags[level] : tags[0];
}

namespace {

struct Sink {
    FILE* file = nullptr;
    int minLevel = LOG_SINK_DISABLED;
    bool owned = false;

    bool accepts(int level) const {
        return file && (minLevel > LOG_SINK_DISABLED) && (level >= minLevel);
    }

    void write(const std::string& header, const std::string& text, bool flush) {
        fwrite(header.data(), 1, header.size(), file);
        fwrite(text.data(), 1, text.size(), file);
        if (flush) fflush(file);
    }

    void close() {
        if (file && owned) fclose(file);
        file = nullptr;
    }
};

class SinkLogger : public Logger {
    std::mutex _mutex;
    Sink _console;
    Sink _file;
    int _flushLevel;
    std::string _timeFormat = "%Y-%m-%d.%T";
    bool _printMilliseconds = true;
    std::string _fileName;

public:
    explicit SinkLogger(const Settings& s) :
        _flushLevel(s.flushLevel)
    {
        if (s.consoleLevel > LOG_SINK_DISABLED) {
            _console.file = stdout;
            _console.minLevel = s.consoleLevel;
        }
        if (s.fileLevel > LOG_SINK_DISABLED) {
            open_file(s.filePrefix, s.filePath);
            _file.minLevel = s.fileLevel;
        }
        if (!_console.file && !_file.file) {
            throw std::runtime_error("no logger sink configured");
        }
    }

    ~SinkLogger() override {
        _file.close();
        if (s_pLogger == this) {
            s_pLogger = nullptr;
        }
    }

    void set_time_format(const std::string& format, bool printMilliseconds) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _timeFormat = format;
        _printMilliseconds = printMilliseconds && !format.empty();
    }

    const std::string& get_current_file_name() const override {
        return _fileName;
    }

protected:
    bool level_accepted(int level) const override {
        return _console.accepts(level) || _file.accepts(level);
    }

    void write_message(int level, uint64_t timestamp, const std::string& text) override {
        std::lock_guard<std::mutex> lock(_mutex);

        std::string header(1, loglevel_tag(level));
        header += ' ';
        if (!_timeFormat.empty()) {
            header += format_timestamp(_timeFormat, timestamp, _printMilliseconds);
            header += ' ';
        }

        bool flush = (level >= _flushLevel);
        if (_console.accepts(level)) {
            _console.write(header, text, flush);
        }
        if (_file.accepts(level)) {
            _file.write(header, text, flush);
        }
    }

private:
    void open_file(const std::string& prefix, const std::string& dir) {
        boost::filesystem::path path(prefix + format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false) + ".log");

        if (!dir.empty()) {
            boost::filesystem::path pathDir(dir);
            boost::filesystem::create_directories(pathDir);
            path = pathDir / path;
        }

        _fileName = path.string();
        _file.file = fopen(_fileName.c_str(), "ab");
        if (!_file.file) throw std::runtime_error("cannot open log file " + _fileName);
        _file.owned = true;
    }
};

const size_t MAX_RETAINED_BUFFER = 10000;

// A message under construction. Streaming an object that logs by itself nests a second one
struct MessageBuffer {
    std::string text;
    boost::iostreams::filtering_ostream os;

    MessageBuffer() {
        os.push(boost::iostreams::back_inserter(text));
    }
};

struct ThreadBuffers {
    std::vector<std::unique_ptr<MessageBuffer>> pool;
    size_t depth = 0;

    MessageBuffer& acquire() {
        if (depth == pool.size()) {
            pool.push_back(std::make_unique<MessageBuffer>());
        }
        return *pool[depth++];
    }

    void release() {
        MessageBuffer& mb = *pool[--depth];
        if (mb.text.capacity() > MAX_RETAINED_BUFFER) {
            pool[depth] = std::make_unique<MessageBuffer>();
        } else {
            mb.text.clear();
        }
    }
};

ThreadBuffers& get_buffers() {
    static thread_local ThreadBuffers tb;
    return tb;
}

} //namespace

std::shared_ptr<Logger> Logger::create(const Settings& s) {
    if (s_pLogger) {
        throw std::runtime_error("logger already initialized");
    }

    auto logger = std::make_shared<SinkLogger>(s);
    s_pLogger = logger.get();
    return logger;
}

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& filePrefix,
    const std::string& filePath
) {
    Settings s;
    s.flushLevel = flushLevel;
    s.consoleLevel = consoleLevel;
    s.fileLevel = fileLevel;
    s.filePrefix = filePrefix;
    s.filePath = filePath;
    return create(s);
}

LogMessage::LogMessage(int level) :
    _level(level),
    _timestamp(local_timestamp_msec()),
    _os(get_buffers().acquire().os)
{}

LogMessage::~LogMessage() {
    ThreadBuffers& tb = get_buffers();
    MessageBuffer& mb = *tb.pool[tb.depth - 1];

    _os << '\n';
    _os.flush();
    if (Logger::s_pLogger) {
        Logger::s_pLogger->write_message(_level, _timestamp, mb.text);
    }

    tb.release();
}

uint64_t local_timestamp_msec() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_timestamp(const std::string& format, uint64_t timestamp, bool formatMsec) {
    time_t seconds = (time_t)(timestamp / 1000);
    struct tm tm;
    localtime_r(&seconds, &tm);

    char buf[128];
    size_t n = strftime(buf, sizeof(buf), format.c_str(), &tm);
    std::string res(buf, n);

    if (formatMsec) {
        snprintf(buf, sizeof(buf), ".%03d", int(timestamp % 1000));
        res += buf;
    }
    return res;
}

} //namespace
