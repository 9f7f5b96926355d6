#ifndef VSCORE_LOGGING_HPP
#define VSCORE_LOGGING_HPP

#include <map>
#include <string>

#include "vscore/config.hpp"

namespace vscore {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

// Named handle onto the process-wide sink set up by configure_logging.
class Logger {
public:
    explicit Logger(std::string name);

    const std::string& name() const { return name_; }

    // Lets callers skip building fields for records that would be dropped.
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message, const LogFields& extra = {}) const;

    void debug(const std::string& message, const LogFields& extra = {}) const;
    void info(const std::string& message, const LogFields& extra = {}) const;
    void warn(const std::string& message, const LogFields& extra = {}) const;
    void error(const std::string& message, const LogFields& extra = {}) const;

private:
    std::string name_;
};

LogLevel parse_log_level(const std::string& level);
std::string log_level_name(LogLevel level);

// Replaces the sink; throws std::runtime_error for an unknown level or a log
// file that cannot be opened.
void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace vscore

#endif  // VSCORE_LOGGING_HPP
