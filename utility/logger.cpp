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
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string.h>
#include <time.h>

#if defined __linux__
    #include <unistd.h>
    #include <sys/syscall.h>
#elif defined _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <pthread.h>
#endif

namespace srcverify {

namespace {

constexpr size_t MAX_HEADER_SIZE = 256;
constexpr size_t MAX_TIMESTAMP_SIZE = 80;
constexpr size_t MAX_MSG_SIZE = 10000;

uint64_t now_msec() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

uint64_t current_thread_id() {
#if defined __linux__
    return syscall(__NR_gettid);
#elif defined _WIN32
    return GetCurrentThreadId();
#else
    uint64_t tid;
    pthread_threadid_np(NULL, &tid);
    return tid;
#endif
}

size_t format_time(char* buf, size_t maxSize, const char* szFormat, uint64_t timestamp, bool bMilliseconds) {
    time_t seconds = (time_t)(timestamp / 1000);
    struct tm tm;
#ifdef _WIN32
    localtime_s(&tm, &seconds);
    size_t n = strftime(buf, maxSize, szFormat, &tm);
#else
    size_t n = strftime(buf, maxSize, szFormat, localtime_r(&seconds, &tm));
#endif
    if (bMilliseconds && maxSize - n > 4) {
        snprintf(buf + n, 5, ".%03d", int(timestamp % 1000));
        n += 4;
    }
    buf[n] = 0;
    return n;
}

const char* strip_source_root(const char* szFile) {
    if (!szFile) return "";
#ifdef PROJECT_SOURCE_DIR
    static const size_t offset = strlen(PROJECT_SOURCE_DIR) + 1;
    if (strlen(szFile) > offset && !strncmp(szFile, PROJECT_SOURCE_DIR, offset - 1))
        return szFile + offset;
#endif
    return szFile;
}

struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string m_Buffer;
    std::unique_ptr<Formatter> m_pFormatter;

    LogThreadContext() { reset(); }

    void reset() {
        m_Buffer = std::string();
        m_Buffer.reserve(MAX_MSG_SIZE);
        m_pFormatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(m_Buffer));
    }
};

LogThreadContext& get_context() {
    static thread_local LogThreadContext ctx;
    return ctx;
}

} // namespace

char loglevel_tag(int level) {
    static const char tags[] = "?VDIWEC";
    return (level >= LOG_LEVEL_VERBOSE && level <= LOG_LEVEL_CRITICAL) ? tags[level] : '?';
}

size_t def_header_formatter(char* buf, size_t maxSize, const char* szTime, const LogMessageHeader& h) {
    if (*szTime)
        return snprintf(buf, maxSize, "%c %s [%llu] ", loglevel_tag(h.m_Level), szTime, (unsigned long long) h.m_Thread);
    return snprintf(buf, maxSize, "%c [%llu] ", loglevel_tag(h.m_Level), (unsigned long long) h.m_Thread);
}

size_t location_header_formatter(char* buf, size_t maxSize, const char* szTime, const LogMessageHeader& h) {
    if (*szTime)
        return snprintf(buf, maxSize, "%c %s %s:%d ", loglevel_tag(h.m_Level), szTime, h.m_szFile, h.m_Line);
    return snprintf(buf, maxSize, "%c %s:%d ", loglevel_tag(h.m_Level), h.m_szFile, h.m_Line);
}

Logger* Logger::s_pInstance = nullptr;

std::shared_ptr<Logger> Logger::create(int minLevel, int flushLevel, FILE* sink) {
    if (s_pInstance)
        throw std::runtime_error("logger already initialized");

    std::shared_ptr<Logger> pLogger(new Logger(minLevel, flushLevel, sink ? sink : stdout));
    s_pInstance = pLogger.get();
    return pLogger;
}

Logger::Logger(int minLevel, int flushLevel, FILE* sink)
    : m_MinLevel(minLevel)
    , m_FlushLevel(flushLevel)
    , m_pSink(sink)
    , m_pFormatter(def_header_formatter)
    , m_TimeFormat("%Y-%m-%d.%T")
    , m_Milliseconds(true)
{
    if (minLevel < LOG_LEVEL_VERBOSE)
        throw std::runtime_error("logger: minimal level out of range");
}

Logger::~Logger() {
    if (this == s_pInstance)
        s_pInstance = nullptr;
}

void Logger::set_level(int minLevel) {
    if (minLevel < LOG_LEVEL_VERBOSE)
        throw std::runtime_error("logger: minimal level out of range");
    m_MinLevel = minLevel;
}

void Logger::set_header_formatter(LogHeaderFormatter pFormatter) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_pFormatter = pFormatter ? pFormatter : def_header_formatter;
}

void Logger::set_time_format(const char* szFormat, bool bMilliseconds) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (szFormat) {
        m_TimeFormat = szFormat;
        m_Milliseconds = bMilliseconds;
    } else {
        m_TimeFormat.clear();
        m_Milliseconds = false;
    }
}

FILE* Logger::set_sink(FILE* sink) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_pSink) fflush(m_pSink);
    std::swap(m_pSink, sink);
    return sink;
}

void Logger::write(const LogMessageHeader& h, const char* szMsg, size_t nSize) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_pSink) return;

    char szTime[MAX_TIMESTAMP_SIZE];
    szTime[0] = 0;
    if (!m_TimeFormat.empty())
        format_time(szTime, sizeof(szTime), m_TimeFormat.c_str(), h.m_Timestamp, m_Milliseconds);

    char szHeader[MAX_HEADER_SIZE];
    size_t nHeader = std::min(m_pFormatter(szHeader, sizeof(szHeader), szTime, h), MAX_HEADER_SIZE - 1);

    fwrite(szHeader, 1, nHeader, m_pSink);
    fwrite(szMsg, 1, nSize, m_pSink);
    if (h.m_Level >= m_FlushLevel)
        fflush(m_pSink);
}

LogMessage::LogMessage(int level, const char* szFile, int line) {
    m_Header.m_Timestamp = now_msec();
    m_Header.m_Thread = current_thread_id();
    m_Header.m_szFile = strip_source_root(szFile);
    m_Header.m_Line = line;
    m_Header.m_Level = level;
    m_pStream = get_context().m_pFormatter.get();
}

LogMessage::~LogMessage() {
    LogThreadContext& ctx = get_context();
    *m_pStream << '\n';
    m_pStream->flush();

    // the logger may be gone if the message outlived it
    if (Logger* pLogger = Logger::get())
        pLogger->write(m_Header, ctx.m_Buffer.data(), ctx.m_Buffer.size());

    if (ctx.m_Buffer.size() > MAX_MSG_SIZE)
        ctx.reset();
    else
        ctx.m_Buffer.clear();
}

} // namespace srcverify
