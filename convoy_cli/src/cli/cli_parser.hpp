#ifndef CONVOY_CLI_PARSER_HPP
#define CONVOY_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "../../../libconvoy/include/engine_config.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::string job = "compress";
    std::string media;
    std::string format;                      ///< Empty: profile default

    bool overwrite = false;
    bool recursive = false;
    bool quiet = false;
    bool list_profiles = false;

    unsigned num_workers = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_dir;
    std::filesystem::path report_path;

    convoy::EngineConfig engine;             ///< Options that travel with every job
    unsigned timeout_seconds = 3600;
    bool no_verify = false;
    bool no_validate = false;
    std::vector<std::string> extra_settings; ///< KEY=VALUE pairs for routine tuning

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // CONVOY_CLI_PARSER_HPP
