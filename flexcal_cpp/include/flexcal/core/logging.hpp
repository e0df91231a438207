#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace flexcal::core {

namespace fs = std::filesystem;

inline constexpr const char* FLEXCAL_VERSION = "1.0.0";

/**
 * Leveled message sink for console and optional log file.
 *
 * Verbosity: 0 = no console output, 1 = normal, 2 = also emit work()
 * messages. The log file, when open, receives every message regardless of
 * verbosity.
 */
class Logger {
public:
    explicit Logger(int verbosity = 1, bool colors = false);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void info(const std::string& msg);
    void warn(const std::string& msg);
    void work(const std::string& msg);
    void bug(const std::string& msg);

    // Logs and throws FlexcalError, terminating the current operation
    [[noreturn]] void error(const std::string& msg);

    void set_verbosity(int verbosity);
    int verbosity() const { return verbosity_; }

    void open_log_file(const fs::path& path);
    void close_log_file();

private:
    void print(const std::string& prefix, const std::string& color,
               const std::string& msg, int min_verbosity);

    int verbosity_;
    bool colors_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Process-wide logger used when no explicit one is handed in
Logger& default_logger();

} // namespace flexcal::core
