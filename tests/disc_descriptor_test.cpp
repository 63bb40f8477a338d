#include <gtest/gtest.h>

#include "disc_descriptor.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace convoy;
namespace fs = std::filesystem;

TEST(DiscDescriptor, ParsesCueFileLines) {
    test::TempDir dir;
    test::write_file(dir / "game.cue",
                     "FILE \"Game (Track 1).bin\" BINARY\r\n"
                     "  TRACK 01 MODE2/2352\r\n"
                     "    INDEX 01 00:00:00\r\n"
                     "FILE track2.bin BINARY\n"
                     "  TRACK 02 AUDIO\n");

    const auto deps = cue_dependencies(dir / "game.cue");
    ASSERT_TRUE(deps.has_value());
    ASSERT_EQ(deps->size(), 2u);
    EXPECT_EQ((*deps)[0], dir / "Game (Track 1).bin");
    EXPECT_EQ((*deps)[1], dir / "track2.bin");
}

TEST(DiscDescriptor, ParsesGdiTracks) {
    test::TempDir dir;
    test::write_file(dir / "game.gdi",
                     "3\n"
                     "1 0 4 2352 track01.bin 0\n"
                     "2 756 0 2352 \"track 02.raw\" 0\n"
                     "3 45000 4 2352 track03.bin 0\n");

    const auto deps = gdi_dependencies(dir / "game.gdi");
    ASSERT_TRUE(deps.has_value());
    ASSERT_EQ(deps->size(), 3u);
    EXPECT_EQ((*deps)[0], dir / "track01.bin");
    EXPECT_EQ((*deps)[1], dir / "track 02.raw");
    EXPECT_EQ((*deps)[2], dir / "track03.bin");
}

TEST(DiscDescriptor, UnreadableDescriptor) {
    test::TempDir dir;
    EXPECT_FALSE(cue_dependencies(dir / "missing.cue").has_value());
    EXPECT_FALSE(descriptor_dependencies(dir / "missing.gdi").has_value());
}

TEST(DiscDescriptor, ExtensionDispatch) {
    EXPECT_TRUE(is_disc_descriptor("a.CUE"));
    EXPECT_TRUE(is_disc_descriptor("a.gdi"));
    EXPECT_FALSE(is_disc_descriptor("a.iso"));

    const auto none = descriptor_dependencies("whatever.iso");
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->empty());
}

TEST(DiscDescriptor, CompanionFilesOfCue) {
    test::TempDir dir;
    test::write_file(dir / "game.cue", "FILE \"game (Track 1).bin\" BINARY\n");
    test::write_file(dir / "game (Track 1).bin", "t1");
    test::write_file(dir / "game (Track 2).bin", "t2");
    test::write_file(dir / "other.bin", "x");

    auto files = companion_files(dir / "game.cue");
    std::sort(files.begin(), files.end());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], dir / "game (Track 1).bin");
    EXPECT_EQ(files[1], dir / "game (Track 2).bin");

    EXPECT_TRUE(companion_files(dir / "other.bin").empty());
}
