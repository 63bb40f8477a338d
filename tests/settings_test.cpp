#include <gtest/gtest.h>

#include "engine_config.hpp"
#include "settings_snapshot.hpp"

using namespace convoy;

TEST(SettingsSnapshot, StoresScalars) {
    SettingsSnapshot s;
    s.set("flag", true);
    s.set("count", 42);
    s.set("name", "chdman");
    s.set("nothing", nullptr);

    EXPECT_EQ(s.size(), 4u);
    EXPECT_TRUE(s.get_bool("flag", false));
    EXPECT_EQ(s.get_int("count", 0), 42);
    EXPECT_EQ(s.get_string("name", ""), "chdman");
    EXPECT_EQ(s.get_int("nothing", 7), 7);
    EXPECT_EQ(s.get_string("missing", "fallback"), "fallback");
}

TEST(SettingsSnapshot, RejectsNestedValues) {
    SettingsSnapshot s;
    EXPECT_THROW(s.set("obj", nlohmann::json{{"a", 1}}), SettingsError);
    EXPECT_THROW(s.set("arr", nlohmann::json::array({1, 2})), SettingsError);
    EXPECT_FALSE(s.contains("obj"));

    EXPECT_THROW(SettingsSnapshot::from_json(nlohmann::json::array()), SettingsError);
    EXPECT_THROW(SettingsSnapshot::from_json({{"ok", 1}, {"nested", {{"x", 2}}}}), SettingsError);
}

TEST(SettingsSnapshot, TypeMismatchThrows) {
    SettingsSnapshot s;
    s.set("count", "many");
    EXPECT_THROW((void)s.get_int("count", 0), SettingsError);
    EXPECT_THROW((void)s.get_bool("count", false), SettingsError);
}

TEST(EngineConfig, SnapshotRestoresEveryField) {
    EngineConfig cfg;
    cfg.copy_locally = true;
    cfg.main_temp_dir = "/var/tmp/convoy-test";
    cfg.delete_source_on_success = true;
    cfg.subprocess_timeout = std::chrono::seconds(90);
    cfg.tool_chdman = "/opt/mame/chdman";
    cfg.chdman_num_processors = 4;
    cfg.chdman_cd_compression = "cdlz,cdzl";
    cfg.chdman_verify_before_extract = false;
    cfg.dolphin_compression = "lzma2";
    cfg.dolphin_compression_level = 9;
    cfg.sevenzip_level = 5;
    cfg.validate_output = false;
    cfg.extra["gate"] = "/tmp/gate";

    const EngineConfig back = EngineConfig::from_snapshot(cfg.snapshot());
    EXPECT_TRUE(back.copy_locally);
    EXPECT_EQ(back.main_temp_dir, cfg.main_temp_dir);
    EXPECT_TRUE(back.delete_source_on_success);
    EXPECT_EQ(back.subprocess_timeout.count(), 90);
    EXPECT_EQ(back.tool_chdman, "/opt/mame/chdman");
    EXPECT_EQ(back.chdman_num_processors, 4);
    EXPECT_EQ(back.chdman_cd_compression, "cdlz,cdzl");
    EXPECT_FALSE(back.chdman_verify_before_extract);
    EXPECT_EQ(back.dolphin_compression, "lzma2");
    EXPECT_EQ(back.dolphin_compression_level, 9);
    EXPECT_EQ(back.sevenzip_level, 5);
    EXPECT_FALSE(back.validate_output);
    ASSERT_EQ(back.extra.count("gate"), 1u);
    EXPECT_EQ(back.extra.at("gate"), "/tmp/gate");
}

TEST(EngineConfig, SnapshotFillsDefaultTempDir) {
    const EngineConfig cfg;
    const auto snap = cfg.snapshot();
    EXPECT_EQ(snap.get_string("main_temp_dir", ""), EngineConfig::default_temp_dir().string());
}

TEST(EngineConfig, SnapshotIsDetachedFromLaterEdits) {
    EngineConfig cfg;
    cfg.sevenzip_level = 3;
    const auto snap = cfg.snapshot();
    cfg.sevenzip_level = 7;
    EXPECT_EQ(EngineConfig::from_snapshot(snap).sevenzip_level, 3);
}

TEST(EngineConfig, MissingKeysKeepDefaults) {
    const EngineConfig back = EngineConfig::from_snapshot(SettingsSnapshot{});
    const EngineConfig defaults;
    EXPECT_EQ(back.tool_7z, defaults.tool_7z);
    EXPECT_EQ(back.chdman_raw_hunks, defaults.chdman_raw_hunks);
    EXPECT_EQ(back.subprocess_timeout, defaults.subprocess_timeout);
    EXPECT_TRUE(back.extra.empty());
}

TEST(EngineConfig, UnknownNonStringValuesAreKeptAsJson) {
    SettingsSnapshot snap;
    snap.set("custom_number", 12);
    snap.set("custom_flag", true);
    const EngineConfig back = EngineConfig::from_snapshot(snap);
    EXPECT_EQ(back.extra.at("custom_number"), "12");
    EXPECT_EQ(back.extra.at("custom_flag"), "true");
}

TEST(EngineConfig, InvalidValuesAreRejected) {
    SettingsSnapshot zero_timeout;
    zero_timeout.set("subprocess_timeout", 0);
    EXPECT_THROW(EngineConfig::from_snapshot(zero_timeout), SettingsError);

    SettingsSnapshot negative;
    negative.set("chdman_num_processors", -2);
    EXPECT_THROW(EngineConfig::from_snapshot(negative), SettingsError);

    SettingsSnapshot wrong_type;
    wrong_type.set("copy_locally", "yes");
    EXPECT_THROW(EngineConfig::from_snapshot(wrong_type), SettingsError);
}

TEST(EngineConfig, ExtraNeverShadowsEngineSettings) {
    EXPECT_TRUE(EngineConfig::is_known_key("subprocess_timeout"));
    EXPECT_FALSE(EngineConfig::is_known_key("gate"));

    EngineConfig cfg;
    cfg.subprocess_timeout = std::chrono::seconds(60);
    cfg.extra["subprocess_timeout"] = "10";
    cfg.extra["gate"] = "/tmp/gate";

    const auto snap = cfg.snapshot();
    EXPECT_EQ(snap.get_int("subprocess_timeout", 0), 60);

    const EngineConfig back = EngineConfig::from_snapshot(snap);
    EXPECT_EQ(back.subprocess_timeout, std::chrono::seconds(60));
    EXPECT_EQ(back.extra.count("subprocess_timeout"), 0u);
    EXPECT_EQ(back.extra.at("gate"), "/tmp/gate");
}
