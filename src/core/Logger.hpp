#pragma once
#include <QObject>
#include <string>
#include <vector>
#include <memory>

namespace percent_tray {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

// Maps the 0-4 command line verbosity onto a level; anything else is Info
LogLevel logLevelFromVerbosity(int verbosity);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setMaxFileSize(size_t bytes);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    void debug(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void info(const std::string& message,
             const std::string& source = "",
             const std::string& function = "");
    void warning(const std::string& message,
                const std::string& source = "",
                const std::string& function = "");
    void error(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void critical(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");

    void flush();
    void clear();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;

signals:
    void logAdded(percent_tray::LogLevel level, const std::string& message);
    void logFileRotated(const std::string& oldFile, const std::string& newFile);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);
    std::string formatLogMessage(LogLevel level,
                               const std::string& message,
                               const std::string& source,
                               const std::string& function) const;
    std::string getLevelString(LogLevel level) const;

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::percent_tray::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::percent_tray::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::percent_tray::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::percent_tray::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::percent_tray::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace percent_tray
