#include "vscore/batch.hpp"
#include "vscore/common.hpp"
#include "vscore/config.hpp"
#include "vscore/logging.hpp"
#include "vscore/report.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config <path>] [--format text|json|csv] [--input <file>|-] [--workers N]"
                 " [--fail-fast] [--log-level LEVEL] [vector ...]\n";
}

std::vector<std::string> read_vectors(std::istream& input) {
    std::vector<std::string> vectors;
    std::string line;
    while (std::getline(input, line)) {
        auto trimmed = vscore::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        vectors.push_back(trimmed);
    }
    return vectors;
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string input_path;
    std::string format;
    std::string log_level;
    int workers = 0;
    bool fail_fast = false;
    std::vector<std::string> vectors;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool takes_value =
            arg == "--config" || arg == "--format" || arg == "--input" || arg == "--workers" || arg == "--log-level";
        if (takes_value && i + 1 >= argc) {
            print_usage(argv[0]);
            return 1;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--format") {
            format = argv[++i];
        } else if (arg == "--input") {
            input_path = argv[++i];
        } else if (arg == "--workers") {
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                print_usage(argv[0]);
                return 1;
            }
            if (workers < 1) {
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--log-level") {
            log_level = argv[++i];
        } else if (arg == "--fail-fast") {
            fail_fast = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            print_usage(argv[0]);
            return 1;
        } else {
            vectors.push_back(arg);
        }
    }

    if (vectors.empty() && input_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto settings = config_path.empty() ? vscore::Settings{} : vscore::Settings::from_toml(config_path);
        if (!format.empty()) {
            settings.output.format = vscore::parse_output_format(format);
        }
        if (!log_level.empty()) {
            settings.logging.level = log_level;
        }
        if (workers > 0) {
            settings.batch.workers = workers;
        }
        if (fail_fast) {
            settings.batch.fail_fast = true;
        }
        vscore::configure_logging(settings.logging);

        if (input_path == "-") {
            auto from_stdin = read_vectors(std::cin);
            vectors.insert(vectors.end(), from_stdin.begin(), from_stdin.end());
        } else if (!input_path.empty()) {
            std::ifstream file(input_path);
            if (!file) {
                throw std::runtime_error("unable to open input file: " + input_path);
            }
            auto from_file = read_vectors(file);
            vectors.insert(vectors.end(), from_file.begin(), from_file.end());
        }

        const auto logger = vscore::get_logger("vscore");
        logger.info("scoring", {{"rows", std::to_string(vectors.size())},
                                {"format", vscore::output_format_name(settings.output.format)}});

        vscore::BatchScorer scorer(settings.batch);
        const auto outcomes = scorer.score_all(vectors);

        if (settings.output.format == vscore::OutputFormat::kCsv) {
            std::cout << vscore::csv_header() << "\n";
        }
        for (const auto& outcome : outcomes) {
            std::cout << vscore::format_outcome(outcome, settings.output) << "\n";
        }

        const auto summary = vscore::summarize(outcomes);
        if (summary.failed > 0 || summary.rows < vectors.size()) {
            return 2;
        }
    } catch (const std::exception& exc) {
        std::cerr << "vscore error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
