#include <gtest/gtest.h>

#include "subprocess.hpp"
#include "test_helpers.hpp"

using namespace convoy;

namespace {

    struct Captured {
        std::vector<std::string> out;
        std::vector<std::string> err;

        LineHandler out_handler() {
            return [this](std::string_view l) { out.emplace_back(l); };
        }
        LineHandler err_handler() {
            return [this](std::string_view l) { err.emplace_back(l); };
        }
    };

} // namespace

TEST(Subprocess, StreamsLinesFromBothPipes) {
    Captured c;
    const auto r = run_command({"sh", "-c", "echo one; echo two 1>&2; printf 'three'"}, {},
                               std::chrono::seconds(10), c.out_handler(), c.err_handler());
    ASSERT_TRUE(r.launched);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(c.out, (std::vector<std::string>{"one", "three"}));
    EXPECT_EQ(c.err, (std::vector<std::string>{"two"}));
}

TEST(Subprocess, SplitsCarriageReturnProgress) {
    Captured c;
    const auto r = run_command({"sh", "-c", "printf '10%%\\r50%%\\r100%%\\n\\n'"}, {},
                               std::chrono::seconds(10), c.out_handler(), c.err_handler());
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(c.out, (std::vector<std::string>{"10%", "50%", "100%"}));
}

TEST(Subprocess, ReportsExitCode) {
    Captured c;
    const auto r = run_command({"sh", "-c", "exit 4"}, {}, std::chrono::seconds(10),
                               c.out_handler(), c.err_handler());
    EXPECT_TRUE(r.launched);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.exit_code, 4);
}

TEST(Subprocess, RunsInWorkingDirectory) {
    test::TempDir dir;
    Captured c;
    const auto r = run_command({"pwd"}, dir.path(), std::chrono::seconds(10), c.out_handler(), {});
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(c.out.size(), 1u);
    EXPECT_TRUE(std::filesystem::equivalent(c.out.front(), dir.path()));
}

TEST(Subprocess, KillsOnTimeout) {
    const auto start = std::chrono::steady_clock::now();
    const auto r = run_command({"sh", "-c", "sleep 30"}, {}, std::chrono::seconds(1), {}, {});
    EXPECT_TRUE(r.launched);
    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(15));
}

TEST(Subprocess, MissingProgramIsNotLaunched) {
    const auto r = run_command({"convoy-no-such-tool-xyz"}, {}, std::chrono::seconds(5), {}, {});
    EXPECT_FALSE(r.launched);
    EXPECT_FALSE(r.error.empty());

    const auto empty = run_command({}, {}, std::chrono::seconds(5), {}, {});
    EXPECT_FALSE(empty.launched);
}

TEST(Subprocess, StripsAnsiEscapes) {
    EXPECT_EQ(strip_ansi_codes("\x1b[1;32mOK\x1b[0m done"), "OK done");
    EXPECT_EQ(strip_ansi_codes("plain"), "plain");
}

TEST(Subprocess, FindsExecutables) {
    EXPECT_TRUE(find_executable("sh").has_value());
    EXPECT_FALSE(find_executable("convoy-no-such-tool-xyz").has_value());
    EXPECT_FALSE(find_executable("").has_value());
}
