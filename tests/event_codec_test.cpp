#include <gtest/gtest.h>

#include "event_codec.hpp"

#include <nlohmann/json.hpp>

using namespace convoy;

TEST(EventCodec, StageProgressUsesStatusUpdate) {
    StageProgressEvent stage;
    stage.job_id = 7;
    stage.description = "Converted";
    stage.stages_done = 2;
    stage.percentage = 66.5;

    const auto j = nlohmann::json::parse(encode_event(stage));
    EXPECT_EQ(j.at("job_id").get<JobId>(), 7);
    EXPECT_EQ(j.at("type").get<std::string>(), "status_update");
    EXPECT_EQ(j.at("data").at("current_step").get<int>(), 2);
    EXPECT_EQ(j.at("data").at("total_steps").get<int>(), kStageCount);

    const auto back = std::get<StageProgressEvent>(decode_event(encode_event(stage)));
    EXPECT_EQ(back.description, "Converted");
    EXPECT_EQ(back.stages_done, 2);
    EXPECT_DOUBLE_EQ(back.percentage, 66.5);
}

TEST(EventCodec, CompletedCarriesErrorCategory) {
    const JobCompletedEvent done{3, false, JobError::Staging, "Input not found"};
    const auto back = std::get<JobCompletedEvent>(decode_event(encode_event(done)));
    EXPECT_EQ(back.job_id, 3);
    EXPECT_FALSE(back.success);
    EXPECT_EQ(back.error, JobError::Staging);
    EXPECT_EQ(back.message, "Input not found");
}

TEST(EventCodec, FailureWithoutCategoryBecomesUnhandled) {
    const auto e = decode_event(R"({"job_id": 4, "type": "job_completed", "data": {"success": false}})");
    EXPECT_EQ(std::get<JobCompletedEvent>(e).error, JobError::Unhandled);
}

TEST(EventCodec, FileProgressUsesItsOwnType) {
    const auto j = nlohmann::json::parse(encode_event(FileProgressEvent{5, 12.5}));
    EXPECT_EQ(j.at("type").get<std::string>(), "file_progress_update");
    EXPECT_DOUBLE_EQ(j.at("data").at("percentage").get<double>(), 12.5);

    const auto e = decode_event(R"({"job_id": 5, "type": "file_progress_update", "data": {"percentage": 12.5}})");
    const auto& progress = std::get<FileProgressEvent>(e);
    EXPECT_EQ(progress.job_id, 5);
    EXPECT_DOUBLE_EQ(progress.percentage, 12.5);
}

TEST(EventCodec, InvalidUtf8IsReplaced) {
    const OutputLineEvent line{1, std::string("bad \xff byte")};
    std::string wire;
    ASSERT_NO_THROW(wire = encode_event(line));
    EXPECT_NO_THROW((void)decode_event(wire));
}

TEST(EventCodec, RejectsUnknownAndMalformedMessages) {
    EXPECT_THROW((void)decode_event(R"({"job_id": 1, "type": "teleport", "data": {}})"), std::invalid_argument);
    EXPECT_THROW((void)decode_event("not json"), nlohmann::json::exception);
    EXPECT_THROW((void)decode_event(R"({"type": "output_update"})"), nlohmann::json::exception);
}

TEST(EventCodec, JobDescriptorTravelsWhole) {
    JobDescriptor job;
    job.job_id = 12;
    job.input_path = "/games/Some Game (USA).cue";
    job.routine_id = "chdman.createcd";
    job.output_dir = "/out";
    job.primary_output_ext = "chd";
    job.overwrite_allowed = true;
    job.multi_file_input = true;
    job.archive_media_exts = {"cue", "iso"};
    job.settings.set("sevenzip_level", 3);

    const std::string wire = encode_job(job);
    EXPECT_EQ(peek_job_id(wire), 12);
    EXPECT_FALSE(is_shutdown(wire));

    const JobDescriptor back = decode_job(wire);
    EXPECT_EQ(back.job_id, 12);
    EXPECT_EQ(back.input_path, job.input_path);
    EXPECT_EQ(back.routine_id, "chdman.createcd");
    EXPECT_EQ(back.output_dir, job.output_dir);
    EXPECT_TRUE(back.overwrite_allowed);
    EXPECT_TRUE(back.multi_file_input);
    EXPECT_EQ(back.archive_media_exts, job.archive_media_exts);
    EXPECT_EQ(back.settings.get_int("sevenzip_level", 0), 3);
    EXPECT_TRUE(back.settings_error.empty());
}

TEST(EventCodec, NonUtf8PathsArriveUnchanged) {
    JobDescriptor job;
    job.job_id = 13;
    job.input_path = std::string("/data/caf\xe9.iso");
    job.output_dir = std::string("/out/\xff\xfe");
    job.routine_id = "test.copy";

    const std::string wire = encode_job(job);
    EXPECT_TRUE(nlohmann::json::parse(wire).at("job").at("input_path").is_array());
    EXPECT_EQ(peek_job_id(wire), 13);

    const JobDescriptor back = decode_job(wire);
    EXPECT_EQ(back.input_path.native(), job.input_path.native());
    EXPECT_EQ(back.output_dir.native(), job.output_dir.native());
}

TEST(EventCodec, NonUtf8OutsidePathsIsRejected) {
    JobDescriptor job;
    job.job_id = 14;
    job.input_path = "/data/game.iso";
    job.routine_id = std::string("bad\xff");
    EXPECT_THROW((void)encode_job(job), std::invalid_argument);
}

TEST(EventCodec, NestedSettingsAreReportedNotThrown) {
    const std::string wire = R"({"type": "job", "job": {"job_id": 9, "input_path": "/a.iso",
        "routine_id": "x", "settings": {"bad": {"nested": true}}}})";
    const JobDescriptor job = decode_job(wire);
    EXPECT_EQ(job.job_id, 9);
    EXPECT_FALSE(job.settings_error.empty());
}

TEST(EventCodec, ShutdownSentinel) {
    const std::string sentinel = encode_shutdown();
    EXPECT_TRUE(is_shutdown(sentinel));
    EXPECT_EQ(peek_job_id(sentinel), 0);
    EXPECT_THROW((void)decode_job(sentinel), std::invalid_argument);
    EXPECT_FALSE(is_shutdown("{broken"));
    EXPECT_EQ(peek_job_id("{broken"), 0);
}
