#include "vscore/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "vscore/common.hpp"

namespace vscore {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

int parse_int(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
    return parsed;
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

}  // namespace

OutputFormat parse_output_format(const std::string& value) {
    const auto lowered = to_lower(value);
    if (lowered == "text") {
        return OutputFormat::kText;
    }
    if (lowered == "json") {
        return OutputFormat::kJson;
    }
    if (lowered == "csv") {
        return OutputFormat::kCsv;
    }
    throw std::runtime_error("unknown output format: " + value);
}

std::string output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::kText:
            return "text";
        case OutputFormat::kJson:
            return "json";
        case OutputFormat::kCsv:
            return "csv";
    }
    return "text";
}

Settings Settings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }

    Settings settings;
    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "output") {
            if (key == "format") {
                settings.output.format = parse_output_format(strip_quotes(value));
            } else if (key == "precision") {
                settings.output.precision = parse_int(key, value);
                if (settings.output.precision < 0 || settings.output.precision > 12) {
                    throw std::runtime_error("precision must be between 0 and 12");
                }
            }
        } else if (current_section == "batch") {
            if (key == "workers") {
                settings.batch.workers = parse_int(key, value);
                if (settings.batch.workers < 1) {
                    throw std::runtime_error("workers must be at least 1");
                }
            } else if (key == "fail_fast") {
                settings.batch.fail_fast = parse_bool(value);
            }
        }
    }

    return settings;
}

}  // namespace vscore
