#include "cli_parser.hpp"
#include "../../../libconvoy/include/media_profiles.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace {

std::string profile_keys(const std::string& job) {
    std::string keys;
    for (const auto& p : convoy::media_profiles()) {
        if (p.job != job) continue;
        if (!keys.empty()) keys += ", ";
        keys += p.media;
    }
    return keys;
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI or TOML file.");

    // --- What to do ---
    app.add_option("--job", settings.job, "Job type: compress, extract, verify, info, archive.")
        ->default_val("compress")
        ->check(CLI::IsMember({"compress", "extract", "verify", "info", "archive"}, CLI::ignore_case));

    app.add_option("--media", settings.media,
                   "Media type (compress/extract: cd, dvd, gamecube, hd, ld, raw, psp; "
                   "verify/info: chd; archive: 7z, folder).");

    app.add_option("--format", settings.format,
                   "Target extension when the media type offers several (e.g. rvz, gcz, wia, cue, gdi).");

    app.add_flag("--list-profiles", settings.list_profiles,
                 "List every job/media combination and exit.");

    // --- Where ---
    app.add_option("-o,--output", settings.output_dir,
                   "Write outputs to DIR instead of next to each input.");

    app.add_flag("--overwrite", settings.overwrite,
                 "Replace existing outputs instead of adding a numeric suffix.");

    app.add_flag("--copy-locally", settings.engine.copy_locally,
                 "Copy each input into a local temp folder before converting.");

    app.add_option("--temp-dir", settings.engine.main_temp_dir,
                   "Base folder for temporary files when --copy-locally is set.");

    app.add_flag("--delete-source", settings.engine.delete_source_on_success,
                 "Move inputs to the trash after a successful conversion.");

    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    // --- How ---
    settings.num_workers = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("-j,--workers", settings.num_workers,
                   "Worker processes running jobs in parallel.")
                   ->default_val(settings.num_workers)
                   ->check(CLI::PositiveNumber);

    app.add_option("--timeout", settings.timeout_seconds,
                   "Seconds an external tool may run before it is killed.")
                   ->default_val(settings.timeout_seconds)
                   ->check(CLI::PositiveNumber);

    app.add_option("--chdman", settings.engine.tool_chdman, "chdman executable.")
        ->default_val(settings.engine.tool_chdman);
    app.add_option("--dolphin-tool", settings.engine.tool_dolphin, "dolphin-tool executable.")
        ->default_val(settings.engine.tool_dolphin);
    app.add_option("--maxcso", settings.engine.tool_maxcso, "maxcso executable.")
        ->default_val(settings.engine.tool_maxcso);
    app.add_option("--7z", settings.engine.tool_7z, "7z executable.")
        ->default_val(settings.engine.tool_7z);

    app.add_option("--chdman-processors", settings.engine.chdman_num_processors,
                   "Threads chdman may use (0: chdman default).")
                   ->check(CLI::NonNegativeNumber);
    app.add_flag("--no-verify", settings.no_verify,
                 "Skip 'chdman verify' before extracting a CHD.");
    app.add_flag("--verify-fix", settings.engine.chdman_verify_fix,
                 "Let 'chdman verify' fix SHA1 mismatches.");
    app.add_option("--dolphin-compression", settings.engine.dolphin_compression,
                   "RVZ/WIA compression method.")
                   ->default_val(settings.engine.dolphin_compression)
                   ->check(CLI::IsMember({"none", "zstd", "bzip2", "lzma", "lzma2"}, CLI::ignore_case));
    app.add_option("--dolphin-level", settings.engine.dolphin_compression_level,
                   "RVZ/WIA compression level.")
                   ->default_val(settings.engine.dolphin_compression_level)
                   ->check(CLI::Range(1, 22));
    app.add_option("--dolphin-block-size", settings.engine.dolphin_block_size,
                   "RVZ/WIA/GCZ block size in bytes.")
                   ->default_val(settings.engine.dolphin_block_size)
                   ->check(CLI::PositiveNumber);
    app.add_option("--7z-level", settings.engine.sevenzip_level, "7z compression level.")
        ->default_val(settings.engine.sevenzip_level)
        ->check(CLI::Range(0, 9));
    app.add_flag("--no-validate", settings.no_validate,
                 "Skip testing archives after creating them.");

    app.add_option("--set", settings.extra_settings,
                   "Extra KEY=VALUE setting passed to the routines. (Can be used multiple times).")
                   ->check([](const std::string& str) {
                       const auto eq = str.find('=');
                       if (eq == std::string::npos || eq == 0) return "Expected KEY=VALUE, got '" + str + "'";
                       if (convoy::EngineConfig::is_known_key(str.substr(0, eq))) {
                           return "'" + str.substr(0, eq) + "' is an engine setting, use its own option";
                       }
                       return std::string();
                   });

    // --- Reporting ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more files or directories.")
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        std::ranges::transform(settings.job, settings.job.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (settings.list_profiles) return;

        if (settings.inputs.empty()) {
            throw CLI::ValidationError("inputs", "At least one input file or folder is required.");
        }
        if (settings.media.empty()) {
            throw CLI::ValidationError("--media", "Required for --job " + settings.job +
                                       " (one of: " + profile_keys(settings.job) + ").");
        }
        const auto* profile = convoy::find_profile(settings.job, settings.media);
        if (!profile) {
            throw CLI::ValidationError("--media", "'" + settings.media + "' is not available for --job " +
                                       settings.job + " (one of: " + profile_keys(settings.job) + ").");
        }
        if (!settings.format.empty()) {
            std::string format = settings.format;
            if (!format.empty() && format.front() == '.') format.erase(0, 1);
            std::ranges::transform(format, format.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (std::ranges::find(profile->output_exts, format) == profile->output_exts.end()) {
                throw CLI::ValidationError("--format", "'" + settings.format + "' is not a target of " +
                                           settings.job + " " + settings.media + ".");
            }
            settings.format = format;
        }

        settings.engine.subprocess_timeout = std::chrono::seconds(settings.timeout_seconds);
        if (settings.no_verify) settings.engine.chdman_verify_before_extract = false;
        if (settings.no_validate) settings.engine.validate_output = false;
        for (const auto& kv : settings.extra_settings) {
            const auto eq = kv.find('=');
            settings.engine.extra[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    });
}
