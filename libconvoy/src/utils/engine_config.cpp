#include "../../include/engine_config.hpp"
#include "../../include/logger.hpp"
#include <set>
#include <stdexcept>

namespace convoy {

    namespace {
        const std::set<std::string>& known_keys() {
            static const std::set<std::string> keys = {
                "copy_locally", "main_temp_dir", "delete_source_on_success", "subprocess_timeout",
                "tool_chdman", "tool_dolphin", "tool_maxcso", "tool_7z",
                "chdman_num_processors", "chdman_cd_hunks", "chdman_cd_compression",
                "chdman_dvd_hunks", "chdman_dvd_compression", "chdman_hd_hunks",
                "chdman_hd_compression", "chdman_ld_compression", "chdman_raw_hunks",
                "chdman_raw_unit_size", "chdman_verify_before_extract", "chdman_verify_fix",
                "dolphin_compression", "dolphin_compression_level", "dolphin_block_size",
                "sevenzip_level", "validate_output"
            };
            return keys;
        }

        int get_non_negative(const SettingsSnapshot& snap, const std::string& key, const int fallback) {
            const auto v = snap.get_int(key, fallback);
            if (v < 0 || v > 0x7fffffff) {
                throw SettingsError("setting '" + key + "' out of range");
            }
            return static_cast<int>(v);
        }
    }

    bool EngineConfig::is_known_key(const std::string& key) {
        return known_keys().count(key) > 0;
    }

    std::filesystem::path EngineConfig::default_temp_dir() {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) base = "/tmp";
        return base / "convoy";
    }

    SettingsSnapshot EngineConfig::snapshot() const {
        SettingsSnapshot s;
        for (const auto& [key, value] : extra) {
            if (is_known_key(key)) {
                Logger::log(LogLevel::Warning, "Extra setting '" + key + "' ignored: it is an engine setting",
                            "settings");
                continue;
            }
            s.set(key, value);
        }
        s.set("copy_locally", copy_locally);
        s.set("main_temp_dir", (main_temp_dir.empty() ? default_temp_dir() : main_temp_dir).string());
        s.set("delete_source_on_success", delete_source_on_success);
        s.set("subprocess_timeout", static_cast<std::int64_t>(subprocess_timeout.count()));
        s.set("tool_chdman", tool_chdman);
        s.set("tool_dolphin", tool_dolphin);
        s.set("tool_maxcso", tool_maxcso);
        s.set("tool_7z", tool_7z);
        s.set("chdman_num_processors", chdman_num_processors);
        s.set("chdman_cd_hunks", chdman_cd_hunks);
        s.set("chdman_cd_compression", chdman_cd_compression);
        s.set("chdman_dvd_hunks", chdman_dvd_hunks);
        s.set("chdman_dvd_compression", chdman_dvd_compression);
        s.set("chdman_hd_hunks", chdman_hd_hunks);
        s.set("chdman_hd_compression", chdman_hd_compression);
        s.set("chdman_ld_compression", chdman_ld_compression);
        s.set("chdman_raw_hunks", chdman_raw_hunks);
        s.set("chdman_raw_unit_size", chdman_raw_unit_size);
        s.set("chdman_verify_before_extract", chdman_verify_before_extract);
        s.set("chdman_verify_fix", chdman_verify_fix);
        s.set("dolphin_compression", dolphin_compression);
        s.set("dolphin_compression_level", dolphin_compression_level);
        s.set("dolphin_block_size", dolphin_block_size);
        s.set("sevenzip_level", sevenzip_level);
        s.set("validate_output", validate_output);
        return s;
    }

    EngineConfig EngineConfig::from_snapshot(const SettingsSnapshot& snap) {
        EngineConfig c;
        c.copy_locally = snap.get_bool("copy_locally", c.copy_locally);
        c.main_temp_dir = snap.get_string("main_temp_dir", default_temp_dir().string());
        c.delete_source_on_success = snap.get_bool("delete_source_on_success", c.delete_source_on_success);

        const auto timeout = snap.get_int("subprocess_timeout", c.subprocess_timeout.count());
        if (timeout <= 0) {
            throw SettingsError("setting 'subprocess_timeout' must be positive");
        }
        c.subprocess_timeout = std::chrono::seconds(timeout);

        c.tool_chdman = snap.get_string("tool_chdman", c.tool_chdman);
        c.tool_dolphin = snap.get_string("tool_dolphin", c.tool_dolphin);
        c.tool_maxcso = snap.get_string("tool_maxcso", c.tool_maxcso);
        c.tool_7z = snap.get_string("tool_7z", c.tool_7z);

        c.chdman_num_processors = get_non_negative(snap, "chdman_num_processors", c.chdman_num_processors);
        c.chdman_cd_hunks = get_non_negative(snap, "chdman_cd_hunks", c.chdman_cd_hunks);
        c.chdman_cd_compression = snap.get_string("chdman_cd_compression", c.chdman_cd_compression);
        c.chdman_dvd_hunks = get_non_negative(snap, "chdman_dvd_hunks", c.chdman_dvd_hunks);
        c.chdman_dvd_compression = snap.get_string("chdman_dvd_compression", c.chdman_dvd_compression);
        c.chdman_hd_hunks = get_non_negative(snap, "chdman_hd_hunks", c.chdman_hd_hunks);
        c.chdman_hd_compression = snap.get_string("chdman_hd_compression", c.chdman_hd_compression);
        c.chdman_ld_compression = snap.get_string("chdman_ld_compression", c.chdman_ld_compression);
        c.chdman_raw_hunks = get_non_negative(snap, "chdman_raw_hunks", c.chdman_raw_hunks);
        c.chdman_raw_unit_size = get_non_negative(snap, "chdman_raw_unit_size", c.chdman_raw_unit_size);
        c.chdman_verify_before_extract = snap.get_bool("chdman_verify_before_extract", c.chdman_verify_before_extract);
        c.chdman_verify_fix = snap.get_bool("chdman_verify_fix", c.chdman_verify_fix);

        c.dolphin_compression = snap.get_string("dolphin_compression", c.dolphin_compression);
        c.dolphin_compression_level = get_non_negative(snap, "dolphin_compression_level", c.dolphin_compression_level);
        c.dolphin_block_size = get_non_negative(snap, "dolphin_block_size", c.dolphin_block_size);

        c.sevenzip_level = get_non_negative(snap, "sevenzip_level", c.sevenzip_level);
        c.validate_output = snap.get_bool("validate_output", c.validate_output);

        for (const auto& [key, value] : snap.to_json().items()) {
            if (is_known_key(key)) continue;
            c.extra[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
        return c;
    }

} // namespace convoy
