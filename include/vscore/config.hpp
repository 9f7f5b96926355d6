#ifndef VSCORE_CONFIG_HPP
#define VSCORE_CONFIG_HPP

#include <optional>
#include <string>

namespace vscore {

enum class OutputFormat {
    kText,
    kJson,
    kCsv,
};

struct LoggingConfig {
    std::string level = "INFO";
    bool json = false;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct OutputConfig {
    OutputFormat format = OutputFormat::kText;
    int precision = 4;
};

struct BatchConfig {
    int workers = 1;
    bool fail_fast = false;
};

struct Settings {
    LoggingConfig logging{};
    OutputConfig output{};
    BatchConfig batch{};

    static Settings from_toml(const std::string& path);
};

OutputFormat parse_output_format(const std::string& value);
std::string output_format_name(OutputFormat format);

}  // namespace vscore

#endif  // VSCORE_CONFIG_HPP
