#include "flexcal/core/utils.hpp"
#include "flexcal/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace flexcal::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

void write_text(const fs::path& path, const std::string& text, bool append) {
    std::ofstream file(path, append ? std::ios::app : std::ios::trunc);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

double compute_median(const VectorXd& data) {
    return compute_median(std::vector<double>(data.data(), data.data() + data.size()));
}

double compute_median(std::vector<double> data) {
    if (data.empty()) return std::numeric_limits<double>::quiet_NaN();

    std::sort(data.begin(), data.end());

    size_t n = data.size();
    if (n % 2 == 0) {
        return (data[n/2 - 1] + data[n/2]) / 2.0;
    } else {
        return data[n/2];
    }
}

double compute_mad(const VectorXd& data) {
    double median = compute_median(data);

    VectorXd deviations(data.size());
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        deviations[i] = std::abs(data[i] - median);
    }

    return compute_median(deviations);
}

double compute_robust_sigma(const VectorXd& data) {
    return 1.4826 * compute_mad(data);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::vector<std::string> wrap_text(const std::string& text, std::size_t width) {
    std::vector<std::string> lines;
    if (width == 0) width = 1;

    std::istringstream iss(text);
    std::string word;
    std::string current;
    while (iss >> word) {
        // Break words that cannot fit on a line of their own
        while (word.size() > width) {
            if (!current.empty()) {
                std::size_t room = width - std::min(width, current.size() + 1);
                if (room == 0) {
                    lines.push_back(current);
                    current.clear();
                    continue;
                }
                lines.push_back(current + " " + word.substr(0, room));
                current.clear();
                word = word.substr(room);
                continue;
            }
            lines.push_back(word.substr(0, width));
            word = word.substr(width);
        }
        if (word.empty()) continue;

        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= width) {
            current += " " + word;
        } else {
            lines.push_back(current);
            current = word;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string zero_pad(std::size_t value, std::size_t width) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(static_cast<int>(width)) << value;
    return oss.str();
}

std::size_t decimal_width(std::size_t count) {
    std::size_t ndig = 1;
    while (count >= 10) {
        count /= 10;
        ++ndig;
    }
    return ndig;
}

std::string format_double(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    std::string out;
    for (int precision = 1; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << value;
        out = oss.str();
        if (std::strtod(out.c_str(), nullptr) == value) break;
    }
    // Keep the text recognisable as floating point
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

} // namespace flexcal::core
