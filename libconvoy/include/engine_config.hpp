/**
 * @file engine_config.hpp
 * @brief Engine settings: tool paths, temp storage policy and tool tuning.
 */

#ifndef CONVOY_ENGINE_CONFIG_HPP
#define CONVOY_ENGINE_CONFIG_HPP

#include "settings_snapshot.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace convoy {

    /**
     * @brief Settings of the conversion engine.
     *
     * The coordinator keeps a live, mutable instance and calls snapshot()
     * once per submitted job. Workers rebuild a private copy with
     * from_snapshot(), so later edits never affect jobs already queued.
     */
    struct EngineConfig {
        // storage policy
        bool copy_locally = false;                 ///< Stage inputs into the workspace
        std::filesystem::path main_temp_dir;       ///< Workspace base when copy_locally is on
        bool delete_source_on_success = false;     ///< Trash the input after a successful job
        std::chrono::seconds subprocess_timeout{3600};

        // external tools
        std::string tool_chdman = "chdman";
        std::string tool_dolphin = "dolphin-tool";
        std::string tool_maxcso = "maxcso";
        std::string tool_7z = "7z";

        // chdman
        int chdman_num_processors = 0;             ///< 0: let chdman decide
        int chdman_cd_hunks = 0;                   ///< 0: chdman default
        std::string chdman_cd_compression;         ///< Empty: chdman default
        int chdman_dvd_hunks = 0;
        std::string chdman_dvd_compression;
        int chdman_hd_hunks = 0;
        std::string chdman_hd_compression;
        std::string chdman_ld_compression;
        int chdman_raw_hunks = 4096;
        int chdman_raw_unit_size = 2048;
        bool chdman_verify_before_extract = true;
        bool chdman_verify_fix = false;

        // dolphin-tool
        std::string dolphin_compression = "zstd";  ///< rvz/wia compression method
        int dolphin_compression_level = 5;
        int dolphin_block_size = 131072;

        // 7z
        int sevenzip_level = 9;
        bool validate_output = true;               ///< Test archives after creation

        ///< Settings not known to the engine, kept verbatim (routine specific).
        ///< Entries named like an engine setting are never snapshotted.
        std::map<std::string, std::string> extra;

        /**
         * @brief Default temp base: <system temp>/convoy.
         */
        static std::filesystem::path default_temp_dir();

        /// True for the snapshot keys backed by a field of this struct.
        static bool is_known_key(const std::string& key);

        /**
         * @brief Serializes every field into a flat snapshot.
         */
        [[nodiscard]] SettingsSnapshot snapshot() const;

        /**
         * @brief Rebuilds settings from a snapshot.
         * Missing keys keep their defaults; unknown keys land in @ref extra.
         * @throws SettingsError on type mismatches or invalid values.
         */
        static EngineConfig from_snapshot(const SettingsSnapshot& snap);
    };

} // namespace convoy

#endif // CONVOY_ENGINE_CONFIG_HPP
