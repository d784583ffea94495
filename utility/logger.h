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
#include <stdint.h>
#include <stdio.h>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#define LOG_LEVEL_CRITICAL 6
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_VERBOSE  1

#ifndef LOG_VERBOSE_ENABLED
#   define LOG_VERBOSE_ENABLED 0
#endif

#ifndef LOG_DEBUG_ENABLED
#   if defined(NDEBUG) && !defined(DEBUG_MESSAGES_IN_RELEASE_MODE)
#       define LOG_DEBUG_ENABLED 0
#   else
#       define LOG_DEBUG_ENABLED 1
#   endif
#endif

// Message at a level chosen at runtime. Nothing is formatted unless the logger accepts the level
#define LOG_MESSAGE(LEVEL) if (srcverify::Logger::will_log(LEVEL)) srcverify::LogMessage(LEVEL, __FILE__, __LINE__)

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR() LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING() LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO() LOG_MESSAGE(LOG_LEVEL_INFO)

#if LOG_DEBUG_ENABLED
#   define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
#   define LOG_DEBUG() srcverify::LogMessageStub()
#endif

#if LOG_VERBOSE_ENABLED
#   define LOG_VERBOSE() LOG_MESSAGE(LOG_LEVEL_VERBOSE)
#else
#   define LOG_VERBOSE() srcverify::LogMessageStub()
#endif

namespace srcverify {

// compiled-out message
struct LogMessageStub {
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

struct LogMessageHeader {
    uint64_t m_Timestamp; // msec since the Epoch
    uint64_t m_Thread;
    const char* m_szFile; // relative to the source root if known
    int m_Line;
    int m_Level;
};

char loglevel_tag(int level);

/// Writes the line prefix into buf, returns bytes written (less than maxSize)
typedef size_t (*LogHeaderFormatter)(char* buf, size_t maxSize, const char* szTime, const LogMessageHeader&);

/// "D 2024-01-31.12:00:00.123 [tid] "
size_t def_header_formatter(char* buf, size_t maxSize, const char* szTime, const LogMessageHeader&);

/// "D 12:00:00.123 verifier/source_verifier.cpp:42 "
size_t location_header_formatter(char* buf, size_t maxSize, const char* szTime, const LogMessageHeader&);

/// Process-wide console logger. Only one may exist at a time, it unregisters itself when destroyed
class Logger {
public:
    /// Throws if a logger already exists. sink defaults to stdout, the caller keeps ownership
    static std::shared_ptr<Logger> create(int minLevel = LOG_LEVEL_INFO, int flushLevel = LOG_LEVEL_WARNING, FILE* sink = nullptr);

    ~Logger();

    static bool will_log(int level) {
        return s_pInstance && (level >= s_pInstance->m_MinLevel);
    }

    static Logger* get() { return s_pInstance; }

    void set_level(int minLevel);
    int get_level() const { return m_MinLevel; }

    void set_header_formatter(LogHeaderFormatter);

    /// strftime() format, nullptr for no timestamp
    void set_time_format(const char* szFormat, bool bMilliseconds);

    /// Returns the previous sink
    FILE* set_sink(FILE*);

    void write(const LogMessageHeader&, const char* szMsg, size_t nSize);

private:
    Logger(int minLevel, int flushLevel, FILE* sink);

    static Logger* s_pInstance;

    std::mutex m_Mutex;
    int m_MinLevel;
    int m_FlushLevel;
    FILE* m_pSink;
    LogHeaderFormatter m_pFormatter;
    std::string m_TimeFormat;
    bool m_Milliseconds;
};

/// Collects the text via operator<< and hands it to the logger on destruction
class LogMessage {
public:
    LogMessage(int level, const char* szFile, int line);
    ~LogMessage();

    template <class T> LogMessage& operator<<(const T& x) {
        *m_pStream << x;
        return *this;
    }

private:
    LogMessageHeader m_Header;
    std::ostream* m_pStream;
};

} // namespace srcverify
