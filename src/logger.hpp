#pragma once

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace kushn {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

// Process-wide logger. Writes to stderr so stdout stays free for the
// command's own output, and optionally mirrors every line into a file.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Returns false if `filename` was given but could not be opened; stderr
    // logging still works in that case.
    bool init(const std::string& filename = "", LogLevel minLevel = LogLevel::Warn) {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = minLevel;
        if (file_.is_open()) file_.close();
        file_.clear();
        if (filename.empty()) return true;
        file_.open(filename, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    void setMinLevel(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = lvl;
    }

    LogLevel minLevel() const { return minLevel_; }

    bool enabled(LogLevel lvl) const { return lvl >= minLevel_ && lvl != LogLevel::Off; }

    void log(LogLevel lvl, const char* file, int line, const char* func, const char* fmt, ...) {
        if (!enabled(lvl)) return;

        va_list args;
        va_start(args, fmt);
        va_list measure;
        va_copy(measure, args);
        int len = std::vsnprintf(nullptr, 0, fmt, measure);
        va_end(measure);
        std::vector<char> buffer(len > 0 ? static_cast<std::size_t>(len) + 1 : 1, '\0');
        if (len > 0) std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        va_end(args);

        std::ostringstream oss;
        oss << nowString() << " [" << levelToString(lvl) << "] "
            << baseName(file) << ":" << line << " (" << func << ") - " << buffer.data() << "\n";
        std::string out = oss.str();

        std::lock_guard<std::mutex> lk(mutex_);
        std::fwrite(out.data(), 1, out.size(), stderr);
        std::fflush(stderr);

        if (file_.is_open()) {
            file_ << out;
            file_.flush();
        }
    }

private:
    Logger() : minLevel_(LogLevel::Warn) {}
    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* baseName(const char* path) {
        const char* base = path;
        for (const char* p = path; *p; ++p) {
            if (*p == '/' || *p == '\\') base = p + 1;
        }
        return base;
    }

    static std::string nowString() {
        using namespace std::chrono;
        auto t = system_clock::now();
        auto tt = system_clock::to_time_t(t);
        auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

        std::tm tm_buf;
#if defined(_WIN32)
        localtime_s(&tm_buf, &tt);
#else
        localtime_r(&tt, &tm_buf);
#endif
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
        return std::string(buf);
    }

    static const char* levelToString(LogLevel l) {
        switch (l) {
        case LogLevel::Debug: return "DBG";
        case LogLevel::Info:  return "INF";
        case LogLevel::Warn:  return "WRN";
        case LogLevel::Error: return "ERR";
        default: return "UNK";
        }
    }

    std::mutex mutex_;
    std::ofstream file_;
    LogLevel minLevel_;
};

} // namespace kushn

#define KUSHN_LOG(level, fmt, ...) \
    do { ::kushn::Logger::instance().log(::kushn::LogLevel::level, __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); } while (0)
