#ifndef ERROR_HANDLER_HH
#define ERROR_HANDLER_HH

#include <iostream>
#include <string>
#include <exception>
#include <stdexcept>
#include <chrono>
#include <fstream>
#include <array>
#include <cstddef>

// Fatal configuration problem. Raised before any timestamp is produced.
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& subject, const std::string& message)
        : std::runtime_error("[" + subject + "] " + message), subject_(subject) {}

    // Setting key or phase name the error refers to
    const std::string& subject() const { return subject_; }

private:
    std::string subject_;
};

class ErrorHandler {
public:
    enum class ErrorLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    static void Log(ErrorLevel level, const std::string& component,
                   const std::string& message, const std::string& file = "",
                   int line = -1);

    static void LogException(const std::exception& e, const std::string& component,
                            const std::string& context = "");

    static void SetLogFile(const std::string& log_file_path);
    static void SetMinLevel(ErrorLevel level);

    static bool HasCriticalErrors();
    static size_t GetCount(ErrorLevel level);
    static void ResetErrorState();

private:
    static std::string GetTimestamp();
    static std::string LevelToString(ErrorLevel level);

    static std::string log_file_path_;
    static ErrorLevel min_level_;
    static bool has_critical_errors_;
    static std::array<size_t, 5> level_counts_;
};

// Convenience macros
#define LOG_DEBUG(component, message) \
    ErrorHandler::Log(ErrorHandler::ErrorLevel::DEBUG, component, message, __FILE__, __LINE__)

#define LOG_INFO(component, message) \
    ErrorHandler::Log(ErrorHandler::ErrorLevel::INFO, component, message, __FILE__, __LINE__)

#define LOG_WARNING(component, message) \
    ErrorHandler::Log(ErrorHandler::ErrorLevel::WARNING, component, message, __FILE__, __LINE__)

#define LOG_ERROR(component, message) \
    ErrorHandler::Log(ErrorHandler::ErrorLevel::ERROR, component, message, __FILE__, __LINE__)

#define LOG_CRITICAL(component, message) \
    ErrorHandler::Log(ErrorHandler::ErrorLevel::CRITICAL, component, message, __FILE__, __LINE__)

#define LOG_EXCEPTION(e, component, context) \
    ErrorHandler::LogException(e, component, context)

#endif // ERROR_HANDLER_HH
