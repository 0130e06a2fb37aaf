#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace b2h5
{

// Process logger with "{}" placeholders, writing to stderr and optional files
class SimpleLogger {
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    SimpleLogger();
    ~SimpleLogger();

    void setLevel(Level level) { currentLevel_.store(level, std::memory_order_relaxed); }
    Level level() const { return currentLevel_.load(std::memory_order_relaxed); }
    void addFile(const std::filesystem::path& path);

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args) {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }

    // Exposed for tests
    template<typename... Args>
    static std::string format(const std::string& fmt, Args&&... args) {
        return formatMessage(fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args) {
        if (level < currentLevel_.load(std::memory_order_relaxed)) return;

        std::string msg = formatMessage(fmt, std::forward<Args>(args)...);
        std::string line = levelPrefix(level) + msg;
        write(line);
    }

    template<typename T>
    static std::string toString(T&& val) {
        std::ostringstream oss;
        oss << std::forward<T>(val);
        return oss.str();
    }

    template<typename T, typename... Args>
    static std::string formatMessage(const std::string& fmt, T&& first, Args&&... rest) {
        std::string result = fmt;
        size_t pos = result.find("{}");
        if (pos == std::string::npos) {
            return result;
        }
        auto head = result.substr(0, pos) + toString(std::forward<T>(first));
        auto tail = result.substr(pos + 2);
        if constexpr (sizeof...(rest) > 0) {
            return head + formatMessage(tail, std::forward<Args>(rest)...);
        }
        return head + tail;
    }

    static std::string formatMessage(const std::string& fmt) {
        return fmt;
    }

    static std::string levelPrefix(Level level);
    void write(const std::string& line);

    std::atomic<Level> currentLevel_{Level::Warn};
    std::mutex mutex_;
    std::vector<std::ofstream> files_;
};

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
std::shared_ptr<SimpleLogger> Logger();

}  // namespace b2h5
