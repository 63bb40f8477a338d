#include <atomic>
#include <chrono>
#include <csignal>
#include <clocale>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../../libconvoy/include/conversion_registry.hpp"
#include "../../libconvoy/include/coordinator.hpp"
#include "../../libconvoy/include/event_bus.hpp"
#include "../../libconvoy/include/events.hpp"
#include "../../libconvoy/include/logger.hpp"
#include "../../libconvoy/include/media_profiles.hpp"
#include "../../libconvoy/include/subprocess.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace convoy;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (!interrupted.exchange(true)) {
            constexpr char msg[] = "\n[INTERRUPT] Stop detected. Dropping queued jobs, waiting for running ones...\n";
            [[maybe_unused]] const auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        }
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void print_profiles() {
    std::cout << std::left << std::setw(10) << "Job" << std::setw(10) << "Media"
              << std::setw(28) << "Description" << std::setw(36) << "Inputs" << "Outputs\n";
    for (const auto& p : media_profiles()) {
        std::string in, out;
        for (const auto& e : p.input_exts) in += (in.empty() ? "" : " ") + e;
        for (const auto& e : p.output_exts) out += (out.empty() ? "" : " ") + e;
        std::cout << std::left << std::setw(10) << p.job << std::setw(10) << p.media
                  << std::setw(28) << p.label << std::setw(36) << in << (out.empty() ? "-" : out) << "\n";
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"convoy: batch conversion of disc images and archives."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    if (settings.list_profiles) {
        print_profiles();
        return 0;
    }

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }
    {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    const MediaProfile* profile = find_profile(settings.job, settings.media);
    if (!profile) {
        Logger::log(LogLevel::Error, "No profile for " + settings.job + " " + settings.media, "main");
        return 1;
    }

    const ConversionRegistry registry = ConversionRegistry::with_builtin_routines();
    const IConversionRoutine* routine = registry.find(profile->routine_id);
    if (!routine) {
        Logger::log(LogLevel::Error, "Routine not available: " + profile->routine_id, "main");
        return 1;
    }
    const std::string tool = routine->tool(settings.engine);
    if (!find_executable(tool)) {
        std::cerr << RED << "Required tool not found: '" << tool << "'. Install it or pass its path." << RESET
                  << std::endl;
        return 1;
    }

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, *profile, settings.recursive);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    EventBus bus;
    Coordinator coordinator(registry, settings.engine, settings.num_workers, bus);

    std::vector<Result> results;
    std::map<JobId, std::chrono::steady_clock::time_point> started_at;
    std::map<JobId, fs::path> paths;
    const auto start_total = std::chrono::steady_clock::now();

    for (const auto& input : inputs) {
        try {
            const JobRequest request = make_job_request(*profile, input, settings.format,
                                                        settings.output_dir, settings.overwrite);
            paths[coordinator.submit(request)] = input;
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, input.string() + ": " + e.what(), "main");
        }
    }
    if (paths.empty()) {
        return 1;
    }

    bus.subscribe<JobStartedEvent>([&](const JobStartedEvent& e) {
        started_at[e.job_id] = std::chrono::steady_clock::now();
    });

    bus.subscribe<JobCompletedEvent>([&](const JobCompletedEvent& e) {
        const auto now = std::chrono::steady_clock::now();
        Result r;
        r.path = paths[e.job_id];
        r.success = e.success;
        r.error = job_error_to_string(e.error);
        r.message = e.message;
        if (const auto it = started_at.find(e.job_id); it != started_at.end()) {
            r.seconds = std::chrono::duration<double>(now - it->second).count();
        }
        results.push_back(std::move(r));

        if (!settings.quiet) {
            std::cerr << (e.success ? GREEN : RED)
                      << "\n[" << (e.success ? "DONE" : "FAIL") << "] "
                      << paths[e.job_id].filename().string() << " " << e.message
                      << RESET << std::endl;
            const auto summary = coordinator.summary();
            print_progress_bar(summary.succeeded + summary.failed,
                               summary.total - summary.cancelled,
                               std::chrono::duration<double>(now - start_total).count());
        }
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    BatchSummary summary;
    try {
        summary = coordinator.run_until_complete(&interrupted);
        coordinator.shutdown();
        summary = coordinator.summary();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Batch aborted: ") + e.what(), "main");
        return 1;
    }
    std::cerr << std::endl;

    BatchTotals totals;
    totals.succeeded = summary.succeeded;
    totals.failed = summary.failed;
    totals.cancelled = summary.cancelled;
    totals.workers = settings.num_workers;
    totals.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, totals);
    }

    // export CSV if requested
    if (!settings.report_path.empty() && !export_csv_report(results, totals, settings.report_path)) {
        Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return summary.failed > 0 ? 1 : 0;
}
