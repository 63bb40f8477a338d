#ifndef CONVOY_REPORT_GENERATOR_HPP
#define CONVOY_REPORT_GENERATOR_HPP

#include <filesystem>
#include <string>
#include <vector>

struct Result {
    std::filesystem::path path;  // input file
    bool success{};
    std::string error;           // error category when !success
    std::string message;         // message of the terminal event
    double seconds{};            // processing time
};

struct BatchTotals {
    std::size_t succeeded{};
    std::size_t failed{};
    std::size_t cancelled{};
    unsigned workers{};
    double seconds{};
};

void print_console_report(const std::vector<Result>& results, const BatchTotals& totals);

bool export_csv_report(const std::vector<Result>& results,
                       const BatchTotals& totals,
                       const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif // CONVOY_REPORT_GENERATOR_HPP
