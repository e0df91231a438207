#include "flexcal/core/logging.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

#include <iostream>

namespace flexcal::core {

namespace {
const char* COLOR_END = "\033[0m";
const char* COLOR_GREEN = "\033[1;32m";
const char* COLOR_YELLOW = "\033[1;33m";
const char* COLOR_RED = "\033[1;31m";
const char* COLOR_BLUE = "\033[1;34m";
} // namespace

Logger::Logger(int verbosity, bool colors)
    : verbosity_(verbosity), colors_(colors) {}

Logger::~Logger() {
    close_log_file();
}

void Logger::set_verbosity(int verbosity) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbosity_ = verbosity;
}

void Logger::open_log_file(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.open(path, std::ios::trunc);
    if (!log_file_) {
        throw IOError("Cannot open log file: " + path.string());
    }
    log_file_ << "------------------------------------------------------\n\n";
    log_file_ << "This log was generated with version " << FLEXCAL_VERSION
              << " of flexcal\n";
    log_file_ << "Started " << get_iso_timestamp() << "\n\n";
    log_file_ << "------------------------------------------------------\n\n";
    log_file_.flush();
}

void Logger::close_log_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::print(const std::string& prefix, const std::string& color,
                   const std::string& msg, int min_verbosity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (verbosity_ >= min_verbosity) {
        if (colors_) {
            std::cerr << color << prefix << COLOR_END << " :: " << msg << std::endl;
        } else {
            std::cerr << prefix << " :: " << msg << std::endl;
        }
    }
    if (log_file_.is_open()) {
        log_file_ << prefix << " :: " << msg << '\n';
        log_file_.flush();
    }
}

void Logger::info(const std::string& msg) {
    print("[INFO]   ", COLOR_GREEN, msg, 1);
}

void Logger::warn(const std::string& msg) {
    print("[WARNING]", COLOR_YELLOW, msg, 1);
}

void Logger::work(const std::string& msg) {
    print("[WORK IN ]", COLOR_BLUE, msg, 2);
}

void Logger::bug(const std::string& msg) {
    print("[BUG]    ", COLOR_RED, msg, 1);
}

void Logger::error(const std::string& msg) {
    print("[ERROR]  ", COLOR_RED, msg, 1);
    throw FlexcalError(msg);
}

Logger& default_logger() {
    static Logger logger;
    return logger;
}

} // namespace flexcal::core
