#include <gtest/gtest.h>

#include "job_context.hpp"
#include "test_helpers.hpp"

using namespace convoy;

namespace {

    JobDescriptor sample_job() {
        JobDescriptor job;
        job.job_id = 11;
        job.input_path = "/games/game.iso";
        job.routine_id = "test.copy";
        job.primary_output_ext = "chd";
        return job;
    }

} // namespace

TEST(JobContext, EmitsExactlyThreeStages) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);

    ctx.started();
    ctx.report_stage("Staged");
    ctx.report_stage("Converted");
    ctx.report_stage("Finalized");
    ctx.report_stage("Extra");
    ctx.completed(true, JobError::None, "ok");

    const auto started = log.of<JobStartedEvent>();
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].filename, "game.iso");
    EXPECT_EQ(started[0].worker_pid, ::getpid());

    const auto stages = log.of<StageProgressEvent>();
    ASSERT_EQ(stages.size(), static_cast<std::size_t>(kStageCount));
    EXPECT_EQ(stages[2].description, "Finalized");
    EXPECT_EQ(stages[2].stages_done, 3);
    EXPECT_DOUBLE_EQ(stages[2].percentage, 100.0);
    EXPECT_TRUE(std::holds_alternative<JobCompletedEvent>(log.events.back()));
}

TEST(JobContext, FileProgressFollowsEveryStage) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);

    ctx.report_stage("Staged");
    ctx.completed(false, JobError::Conversion, "tool failed");

    const auto progress = log.of<FileProgressEvent>();
    ASSERT_EQ(progress.size(), static_cast<std::size_t>(kStageCount));
    EXPECT_DOUBLE_EQ(progress.back().percentage, 100.0);

    for (std::size_t i = 0; i + 1 < log.events.size(); ++i) {
        if (const auto* stage = std::get_if<StageProgressEvent>(&log.events[i])) {
            const auto* next = std::get_if<FileProgressEvent>(&log.events[i + 1]);
            ASSERT_NE(next, nullptr) << "after stage " << stage->stages_done;
            EXPECT_DOUBLE_EQ(next->percentage, stage->percentage);
        }
    }
}

TEST(JobContext, FailureFillsMissingStages) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);

    ctx.report_stage("Staged");
    ctx.completed(false, JobError::Conversion, "tool failed");
    ctx.completed(true, JobError::None, "ignored");

    const auto stages = log.of<StageProgressEvent>();
    ASSERT_EQ(stages.size(), 3u);
    EXPECT_EQ(stages[0].description, "Staged");
    EXPECT_EQ(stages[1].description, "Failed");
    EXPECT_EQ(stages[2].description, "Failed");

    const auto done = log.of<JobCompletedEvent>();
    ASSERT_EQ(done.size(), 1u);
    EXPECT_FALSE(done[0].success);
    EXPECT_EQ(done[0].error, JobError::Conversion);
    EXPECT_TRUE(ctx.is_completed());
}

TEST(JobContext, SuccessNeverCarriesAnError) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);
    ctx.completed(true, JobError::Finalize, "fine");
    EXPECT_EQ(log.of<JobCompletedEvent>().at(0).error, JobError::None);
}

TEST(JobContext, ClipsLongLines) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);
    ctx.output(std::string(JobContext::kMaxMessageLength + 100, 'o'));
    const auto lines = log.of<OutputLineEvent>();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_LT(lines[0].message.size(), JobContext::kMaxMessageLength + 100);
}

TEST(JobContext, RunToolStreamsOutput) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);

    const auto ok = ctx.run_tool({"sh", "-c", "echo progress; echo warn 1>&2"});
    EXPECT_TRUE(ok.ok());

    const auto failed = ctx.run_tool({"sh", "-c", "exit 2"});
    EXPECT_EQ(failed.exit_code, 2);

    const auto out = log.of<OutputLineEvent>();
    const auto err = log.of<ErrorLineEvent>();
    ASSERT_GE(out.size(), 2u);
    EXPECT_EQ(out[0].message.rfind(">> Running: sh -c", 0), 0u);
    EXPECT_EQ(out[1].message, "progress");
    ASSERT_EQ(err.size(), 2u);
    EXPECT_EQ(err[0].message, "warn");
    EXPECT_NE(err[1].message.find("exited with code 2"), std::string::npos);
}

TEST(JobContext, RunToolHonoursTimeoutSetting) {
    test::EventLog log;
    test::DirectoryStager stager;
    JobContext ctx(sample_job(), log.sink(), stager);
    EngineConfig settings;
    settings.subprocess_timeout = std::chrono::seconds(1);
    ctx.set_settings(settings);

    const auto r = ctx.run_tool({"sleep", "20"});
    EXPECT_TRUE(r.timed_out);
    const auto err = log.of<ErrorLineEvent>();
    ASSERT_FALSE(err.empty());
    EXPECT_NE(err.back().message.find("timed out"), std::string::npos);
}
