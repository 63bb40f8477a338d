#include <gtest/gtest.h>

#include "engine_config.hpp"
#include "test_helpers.hpp"
#include "workspace.hpp"

using namespace convoy;
namespace fs = std::filesystem;

TEST(Workspace, CreatesLayoutAndCleansUp) {
    test::TempDir dir;
    std::error_code ec;
    auto ws = Workspace::create(dir / "temps", dir / "Game (USA).iso", ec);
    ASSERT_TRUE(ws.has_value()) << ec.message();

    const fs::path root = ws->root();
    EXPECT_TRUE(fs::is_directory(ws->staging_dir()));
    EXPECT_TRUE(fs::is_directory(ws->output_dir()));
    EXPECT_EQ(root.parent_path(), dir / "temps");
    EXPECT_TRUE(root.filename().string().starts_with("Game (USA)_temp_"));

    test::write_file(ws->output_dir() / "x.bin", "data");
    EXPECT_TRUE(ws->cleanup());
    EXPECT_FALSE(fs::exists(root));
    EXPECT_TRUE(ws->cleanup());
    // a configured temp dir is not removed
    EXPECT_TRUE(fs::exists(dir / "temps"));
}

TEST(Workspace, SameInputNameGetsDistinctDirectories) {
    test::TempDir dir;
    std::error_code ec;
    auto a = Workspace::create(dir.path(), "/x/game.iso", ec);
    auto b = Workspace::create(dir.path(), "/y/game.iso", ec);
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->root(), b->root());
}

TEST(Workspace, DestructorRemovesDirectory) {
    test::TempDir dir;
    fs::path root;
    {
        std::error_code ec;
        auto ws = Workspace::create(dir.path(), "in.iso", ec);
        ASSERT_TRUE(ws);
        root = ws->root();
        EXPECT_TRUE(fs::exists(root));
    }
    EXPECT_FALSE(fs::exists(root));
}

TEST(Workspace, InPlaceBaseIsRemovedWhenEmpty) {
    test::TempDir dir;
    const fs::path input = dir / "game.iso";
    const EngineConfig cfg;
    const fs::path base = Workspace::base_dir_for(cfg, input);
    EXPECT_EQ(base, dir / "_processing_temps_");

    std::error_code ec;
    auto first = Workspace::create(base, input, ec);
    auto second = Workspace::create(base, input, ec);
    ASSERT_TRUE(first && second);

    first->cleanup();
    EXPECT_TRUE(fs::exists(base));
    second->cleanup();
    EXPECT_FALSE(fs::exists(base));
}

TEST(Workspace, CopyLocallyUsesTempDir) {
    EngineConfig cfg;
    cfg.copy_locally = true;
    EXPECT_EQ(Workspace::base_dir_for(cfg, "/games/a.iso"), EngineConfig::default_temp_dir());
    cfg.main_temp_dir = "/scratch";
    EXPECT_EQ(Workspace::base_dir_for(cfg, "/games/a.iso"), fs::path("/scratch"));
}

TEST(Workspace, CreateFailsUnderAFile) {
    test::TempDir dir;
    test::write_file(dir / "blocker", "x");
    std::error_code ec;
    const auto ws = Workspace::create(dir / "blocker", "a.iso", ec);
    EXPECT_FALSE(ws.has_value());
    EXPECT_TRUE(ec);
}

TEST(Workspace, RemoveWithRetriesTreatsMissingAsRemoved) {
    test::TempDir dir;
    EXPECT_TRUE(remove_dir_with_retries(dir / "never-created", 1, std::chrono::milliseconds(1)));
}
