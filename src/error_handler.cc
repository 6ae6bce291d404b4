#include "error_handler.hh"
#include <iomanip>
#include <mutex>
#include <sstream>

// Static member definitions
std::string ErrorHandler::log_file_path_;
ErrorHandler::ErrorLevel ErrorHandler::min_level_ = ErrorHandler::ErrorLevel::INFO;
bool ErrorHandler::has_critical_errors_ = false;
std::array<size_t, 5> ErrorHandler::level_counts_ = {0, 0, 0, 0, 0};

namespace {
std::mutex& LogMutex() {
    static std::mutex log_mutex;
    return log_mutex;
}
}

void ErrorHandler::Log(ErrorLevel level, const std::string& component,
                      const std::string& message, const std::string& file, int line) {

    std::lock_guard<std::mutex> lock(LogMutex());

    // Counters track everything, the filter only affects output
    level_counts_[static_cast<size_t>(level)]++;
    if (level == ErrorLevel::CRITICAL) {
        has_critical_errors_ = true;
    }
    if (level < min_level_) {
        return;
    }

    std::ostringstream log_stream;
    log_stream << "[" << GetTimestamp() << "] [" << LevelToString(level) << "] ["
               << component << "] " << message;

    if (!file.empty() && line > 0) {
        std::string filename = file.substr(file.find_last_of("/\\") + 1);
        log_stream << " (" << filename << ":" << line << ")";
    }

    std::string log_line = log_stream.str();

    if (level == ErrorLevel::ERROR || level == ErrorLevel::CRITICAL) {
        std::cerr << log_line << std::endl;
    } else {
        std::cout << log_line << std::endl;
    }

    if (!log_file_path_.empty()) {
        std::ofstream log_file(log_file_path_, std::ios::app);
        if (log_file.is_open()) {
            log_file << log_line << std::endl;
        }
    }
}

void ErrorHandler::LogException(const std::exception& e, const std::string& component,
                               const std::string& context) {
    std::string message = "Exception caught: " + std::string(e.what());
    if (!context.empty()) {
        message += " (Context: " + context + ")";
    }

    Log(ErrorLevel::ERROR, component, message);
}

void ErrorHandler::SetLogFile(const std::string& log_file_path) {
    {
        std::lock_guard<std::mutex> lock(LogMutex());
        log_file_path_ = log_file_path;
    }
    if (!log_file_path.empty()) {
        Log(ErrorLevel::INFO, "ErrorHandler", "Log file initialized: " + log_file_path);
    }
}

void ErrorHandler::SetMinLevel(ErrorLevel level) {
    std::lock_guard<std::mutex> lock(LogMutex());
    min_level_ = level;
}

bool ErrorHandler::HasCriticalErrors() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return has_critical_errors_;
}

size_t ErrorHandler::GetCount(ErrorLevel level) {
    std::lock_guard<std::mutex> lock(LogMutex());
    return level_counts_[static_cast<size_t>(level)];
}

void ErrorHandler::ResetErrorState() {
    std::lock_guard<std::mutex> lock(LogMutex());
    has_critical_errors_ = false;
    level_counts_.fill(0);
}

std::string ErrorHandler::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string ErrorHandler::LevelToString(ErrorLevel level) {
    switch (level) {
        case ErrorLevel::DEBUG:    return "DEBUG";
        case ErrorLevel::INFO:     return "INFO";
        case ErrorLevel::WARNING:  return "WARN";
        case ErrorLevel::ERROR:    return "ERROR";
        case ErrorLevel::CRITICAL: return "CRITICAL";
        default:                   return "UNKNOWN";
    }
}
