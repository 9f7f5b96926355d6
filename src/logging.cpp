#include "vscore/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "vscore/common.hpp"

namespace vscore {

namespace {

// Append-only file that moves itself to <path>.1 once it reaches max_bytes,
// shifting older backups up to <path>.<backups>.
class RotatingFile {
public:
    RotatingFile(std::filesystem::path path, std::uintmax_t max_bytes, int backups)
        : path_(std::move(path)), max_bytes_(max_bytes), backups_(backups) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path_, ec);
        written_ = ec ? 0 : size;
        open();
    }

    void write(const std::string& line) {
        if (max_bytes_ > 0 && backups_ > 0 && written_ > 0 && written_ + line.size() > max_bytes_) {
            rotate();
        }
        out_ << line;
        out_.flush();
        written_ += line.size();
    }

private:
    void open() {
        out_.open(path_, std::ios::app);
        if (!out_.is_open()) {
            throw std::runtime_error("unable to open log file: " + path_.string());
        }
    }

    std::filesystem::path backup(int index) const {
        auto name = path_;
        name += "." + std::to_string(index);
        return name;
    }

    void rotate() {
        out_.close();
        std::error_code ec;
        std::filesystem::remove(backup(backups_), ec);
        for (int index = backups_ - 1; index >= 1; --index) {
            if (std::filesystem::exists(backup(index), ec)) {
                std::filesystem::rename(backup(index), backup(index + 1), ec);
            }
        }
        std::filesystem::rename(path_, backup(1), ec);
        written_ = 0;
        open();
    }

    std::filesystem::path path_;
    std::uintmax_t max_bytes_;
    int backups_;
    std::uintmax_t written_ = 0;
    std::ofstream out_;
};

struct Sink {
    LogLevel level = LogLevel::kInfo;
    bool json = false;
    std::unique_ptr<RotatingFile> file;
    std::mutex mutex;
};

Sink& sink() {
    static Sink instance;
    return instance;
}

std::string format_record(bool json, LogLevel level, const std::string& name, const std::string& message,
                          const LogFields& extra) {
    std::ostringstream line;
    if (json) {
        line << "{\"level\":\"" << log_level_name(level) << "\",\"name\":\"" << json_escape(name)
             << "\",\"message\":\"" << json_escape(message) << "\"";
        for (const auto& [key, value] : extra) {
            line << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
        }
        line << "}";
    } else {
        line << log_level_name(level) << " " << name << " " << message;
        for (const auto& [key, value] : extra) {
            line << " " << key << "=" << value;
        }
    }
    line << '\n';
    return line.str();
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

bool Logger::enabled(LogLevel level) const {
    auto& target = sink();
    std::lock_guard<std::mutex> guard(target.mutex);
    return static_cast<int>(level) >= static_cast<int>(target.level);
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& extra) const {
    auto& target = sink();
    std::lock_guard<std::mutex> guard(target.mutex);
    if (static_cast<int>(level) < static_cast<int>(target.level)) {
        return;
    }
    const auto line = format_record(target.json, level, name_, message, extra);
    if (target.file) {
        target.file->write(line);
        return;
    }
    // stdout carries reports.
    std::cerr << line;
    std::cerr.flush();
}

void Logger::debug(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kDebug, message, extra);
}

void Logger::info(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kInfo, message, extra);
}

void Logger::warn(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kWarn, message, extra);
}

void Logger::error(const std::string& message, const LogFields& extra) const {
    log(LogLevel::kError, message, extra);
}

LogLevel parse_log_level(const std::string& level) {
    const auto lowered = to_lower(trim(level));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    throw std::runtime_error("unknown log level: " + level);
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

void configure_logging(const LoggingConfig& config) {
    const auto level = parse_log_level(config.level);
    std::unique_ptr<RotatingFile> file;
    if (config.log_file.has_value()) {
        file = std::make_unique<RotatingFile>(*config.log_file,
                                              static_cast<std::uintmax_t>(std::max(config.max_bytes, 0)),
                                              config.backup_count);
    }

    auto& target = sink();
    std::lock_guard<std::mutex> guard(target.mutex);
    target.level = level;
    target.json = config.json;
    target.file = std::move(file);
}

Logger get_logger(const std::string& name) {
    return Logger(name);
}

}  // namespace vscore
