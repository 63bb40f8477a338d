#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string truncate(const std::string& s, const std::size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(0, width);
    return s.substr(0, width - 3) + "...";
}

static std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

void print_console_report(const std::vector<Result>& results, const BatchTotals& totals) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    constexpr std::size_t time_col = 10;
    constexpr std::size_t result_col = 8;
    const std::size_t file_col = std::clamp<std::size_t>(term_width / 2, 20, 60);
    const std::size_t message_col = term_width > file_col + time_col + result_col + 4
                                    ? term_width - file_col - time_col - result_col - 4 : 20;

    std::cerr << "\n=== Results ===\n";
    std::cerr << std::left << std::setw(static_cast<int>(file_col)) << "File"
              << std::setw(time_col) << "Time(s)"
              << std::setw(result_col) << "Result"
              << "Message\n";

    for (const auto& r : results) {
        const std::string outcome = r.success ? "OK" : "FAIL";
        std::cerr << std::left << std::setw(static_cast<int>(file_col))
                  << truncate(r.path.filename().string(), file_col - 1)
                  << std::setw(time_col) << fixed2(r.seconds);
        if (use_colors) std::cerr << (r.success ? GREEN : RED);
        std::cerr << std::setw(result_col) << outcome;
        if (use_colors) std::cerr << RESET;
        std::string message = r.success ? r.message : "[" + r.error + "] " + r.message;
        std::cerr << truncate(message, message_col) << "\n";
    }

    std::cerr << "\nSucceeded: " << totals.succeeded
              << "  Failed: " << totals.failed
              << "  Cancelled: " << totals.cancelled << "\n";
    std::cerr << "Total time: " << fixed2(totals.seconds)
              << " s (" << totals.workers << " worker"
              << (totals.workers > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const BatchTotals& totals,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Path,Time(s),Result,Error,Message\n";
    for (const auto& r : results) {
        out << csv_escape(r.path.filename().string()) << ","
            << csv_escape(r.path.string()) << ","
            << fixed2(r.seconds) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << csv_escape(r.success ? "" : r.error) << ","
            << csv_escape(r.message) << "\n";
    }

    out << "\n\nSucceeded,Failed,Cancelled,Workers,Total time\n";
    out << totals.succeeded << "," << totals.failed << "," << totals.cancelled << ","
        << totals.workers << "," << fixed2(totals.seconds) << " seconds\n";
    return static_cast<bool>(out);
}
