#include <gtest/gtest.h>

#include "coordinator.hpp"
#include "event_bus.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>

using namespace convoy;
namespace fs = std::filesystem;

namespace {

    /// Records everything the coordinator publishes, in publication order.
    struct BusRecorder {
        std::vector<Event> events;

        explicit BusRecorder(EventBus& bus) {
            bus.subscribe<JobStartedEvent>([this](const JobStartedEvent& e) { events.emplace_back(e); });
            bus.subscribe<StageProgressEvent>([this](const StageProgressEvent& e) { events.emplace_back(e); });
            bus.subscribe<FileProgressEvent>([this](const FileProgressEvent& e) { events.emplace_back(e); });
            bus.subscribe<OutputLineEvent>([this](const OutputLineEvent& e) { events.emplace_back(e); });
            bus.subscribe<ErrorLineEvent>([this](const ErrorLineEvent& e) { events.emplace_back(e); });
            bus.subscribe<JobCompletedEvent>([this](const JobCompletedEvent& e) { events.emplace_back(e); });
        }

        std::vector<Event> for_job(const JobId id) const {
            std::vector<Event> out;
            std::copy_if(events.begin(), events.end(), std::back_inserter(out),
                         [id](const Event& e) { return event_job_id(e) == id; });
            return out;
        }

        template <typename T>
        std::size_t count(const JobId id) const {
            const auto mine = for_job(id);
            return static_cast<std::size_t>(std::count_if(mine.begin(), mine.end(),
                [](const Event& e) { return std::holds_alternative<T>(e); }));
        }
    };

    class CoordinatorTest : public ::testing::Test {
    protected:
        JobRequest request(const fs::path& input, const std::string& routine, const bool overwrite = false) const {
            JobRequest r;
            r.input_path = input;
            r.routine_id = routine;
            r.output_dir = dir / "out";
            r.primary_output_ext = "out";
            r.overwrite_allowed = overwrite;
            return r;
        }

        static std::size_t running(const Coordinator& c) {
            const auto& jobs = c.jobs();
            return static_cast<std::size_t>(std::count_if(jobs.begin(), jobs.end(), [](const auto& entry) {
                return entry.second.status == JobStatus::Running;
            }));
        }

        /// Every job gets started, kStageCount stages, then exactly one completion, last.
        void expect_well_formed(const BusRecorder& rec, const JobId id) const {
            const auto mine = rec.for_job(id);
            ASSERT_FALSE(mine.empty()) << "job " << id;
            EXPECT_TRUE(std::holds_alternative<JobStartedEvent>(mine.front())) << "job " << id;
            EXPECT_TRUE(std::holds_alternative<JobCompletedEvent>(mine.back())) << "job " << id;
            EXPECT_EQ(rec.count<StageProgressEvent>(id), static_cast<std::size_t>(kStageCount)) << "job " << id;
            EXPECT_EQ(rec.count<FileProgressEvent>(id), static_cast<std::size_t>(kStageCount)) << "job " << id;
            EXPECT_EQ(rec.count<JobCompletedEvent>(id), 1u) << "job " << id;
        }

        test::TempDir dir;
        EngineConfig config;
        ConversionRegistry registry = test::make_test_registry();
        EventBus bus;
        BusRecorder rec{bus};
    };

} // namespace

TEST_F(CoordinatorTest, EmptyBatch) {
    Coordinator c(registry, config, 2, bus);
    const auto s = c.run_until_complete();
    EXPECT_EQ(s.total, 0u);
    EXPECT_EQ(s.succeeded, 0u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_EQ(c.live_workers(), 2u);
    c.shutdown();
    EXPECT_EQ(c.live_workers(), 0u);
    EXPECT_TRUE(rec.events.empty());
}

TEST_F(CoordinatorTest, SingleJob) {
    test::write_file(dir / "in/game.iso", "image");
    Coordinator c(registry, config, 1, bus);
    const JobId id = c.submit(request(dir / "in/game.iso", "test.copy"));
    EXPECT_EQ(c.jobs().at(id).status, JobStatus::Queued);

    const auto s = c.run_until_complete();
    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(s.total, 1u);

    const auto& state = c.jobs().at(id);
    EXPECT_EQ(state.status, JobStatus::CompletedSuccess);
    EXPECT_EQ(state.stages_done, kStageCount);
    EXPECT_NE(state.worker_pid, ::getpid());
    EXPECT_EQ(test::read_file(dir / "out/game.out"), "image");
    expect_well_formed(rec, id);
}

TEST_F(CoordinatorTest, NonUtf8FileNameKeepsItsBytes) {
    const std::string name = std::string("caf\xe9");
    const fs::path input = dir / "in" / (name + ".iso");
    const fs::path output_dir = dir / ("out_\xff");
    test::write_file(input, "latin1");

    Coordinator c(registry, config, 1, bus);
    JobRequest r = request(input, "test.copy");
    r.output_dir = output_dir;
    const JobId id = c.submit(r);
    const auto s = c.run_until_complete();

    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(c.jobs().at(id).status, JobStatus::CompletedSuccess);
    EXPECT_EQ(c.jobs().at(id).filename, name + ".iso");
    EXPECT_EQ(test::read_file(output_dir / (name + ".out")), "latin1");
    EXPECT_TRUE(fs::exists(input));
    expect_well_formed(rec, id);

    // only the two directories created by the test exist at the top
    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 2u);
}

TEST_F(CoordinatorTest, FileProgressTracksThePercentage) {
    test::write_file(dir / "in/game.iso", "image");
    Coordinator c(registry, config, 1, bus);
    const JobId id = c.submit(request(dir / "in/game.iso", "test.copy"));
    c.run_until_complete();

    EXPECT_DOUBLE_EQ(c.jobs().at(id).percentage, 100.0);
    double last = 0.0;
    for (const auto& e : rec.for_job(id)) {
        if (const auto* p = std::get_if<FileProgressEvent>(&e)) {
            EXPECT_GE(p->percentage, last);
            last = p->percentage;
        }
    }
    EXPECT_DOUBLE_EQ(last, 100.0);
}

TEST_F(CoordinatorTest, EventsOfForeignJobsAreDropped) {
    test::write_file(dir / "in/game.iso", "image");
    Coordinator c(registry, config, 1, bus);
    const JobId id = c.submit(request(dir / "in/game.iso", "test.stray"));
    const auto s = c.run_until_complete();
    c.shutdown();

    const JobId foreign = id + test::StrayEventRoutine::kIdOffset;
    EXPECT_EQ(c.jobs().count(foreign), 0u);
    EXPECT_TRUE(rec.for_job(foreign).empty());
    EXPECT_EQ(c.jobs().size(), 1u);
    EXPECT_EQ(s.total, 1u);
    EXPECT_EQ(s.succeeded, 1u);
    expect_well_formed(rec, id);
}

TEST_F(CoordinatorTest, EventsAfterCompletionAreDropped) {
    test::write_file(dir / "in/game.iso", "image");
    Coordinator c(registry, config, 1, bus);
    const JobId id = c.submit(request(dir / "in/game.iso", "test.late"));
    c.run_until_complete();
    c.shutdown();

    EXPECT_EQ(c.jobs().at(id).status, JobStatus::CompletedSuccess);
    EXPECT_EQ(c.jobs().at(id).message, "completed early");
    expect_well_formed(rec, id);
    for (const auto& e : rec.for_job(id)) {
        if (const auto* line = std::get_if<OutputLineEvent>(&e)) {
            EXPECT_NE(line->message, "line after completion");
        }
    }
    EXPECT_EQ(c.summary().succeeded, 1u);
}

TEST_F(CoordinatorTest, JobLostByDyingWorkerFails) {
    test::write_file(dir / "in/swallow.iso", "s");
    test::write_file(dir / "in/lost.iso", "l");

    Coordinator c(registry, config, 1, bus);
    const JobId swallow = c.submit(request(dir / "in/swallow.iso", "test.swallow"));
    const JobId lost = c.submit(request(dir / "in/lost.iso", "test.copy"));
    const auto s = c.run_until_complete();

    EXPECT_EQ(s.failed, 2u);
    EXPECT_EQ(s.succeeded, 0u);
    EXPECT_EQ(c.jobs().at(swallow).error, JobError::Unhandled);
    EXPECT_EQ(c.jobs().at(lost).status, JobStatus::CompletedFailure);
    EXPECT_EQ(c.jobs().at(lost).error, JobError::Unhandled);
    EXPECT_NE(c.jobs().at(lost).message.find("before starting it"), std::string::npos);
    EXPECT_EQ(rec.count<StageProgressEvent>(lost), static_cast<std::size_t>(kStageCount));
    EXPECT_EQ(rec.count<JobCompletedEvent>(lost), 1u);
    EXPECT_TRUE(std::holds_alternative<JobCompletedEvent>(rec.for_job(lost).back()));
    EXPECT_EQ(c.live_workers(), 1u);
    EXPECT_FALSE(fs::exists(dir / "out/lost.out"));
}

TEST_F(CoordinatorTest, MixedBatchTalliesAndCleansUp) {
    ::setenv("XDG_DATA_HOME", (dir / "xdg").c_str(), 1);
    config.delete_source_on_success = true;
    test::write_file(dir / "a/good.iso", "good");
    test::write_file(dir / "b/bad.iso", "bad");

    Coordinator c(registry, config, 3, bus);
    const JobId a = c.submit(request(dir / "a/good.iso", "test.copy"));
    const JobId b = c.submit(request(dir / "b/bad.iso", "test.fail"));
    const JobId missing = c.submit(request(dir / "c/missing.iso", "test.copy"));
    const auto s = c.run_until_complete();
    c.shutdown();
    ::unsetenv("XDG_DATA_HOME");

    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(s.failed, 2u);
    EXPECT_EQ(c.jobs().at(a).status, JobStatus::CompletedSuccess);
    EXPECT_EQ(c.jobs().at(b).error, JobError::Conversion);
    EXPECT_EQ(c.jobs().at(missing).error, JobError::Staging);
    for (const JobId id : {a, b, missing}) expect_well_formed(rec, id);

    EXPECT_TRUE(fs::exists(dir / "out/good.out"));
    EXPECT_FALSE(fs::exists(dir / "a/good.iso"));
    EXPECT_TRUE(fs::exists(dir / "xdg/Trash/files/good.iso"));
    EXPECT_TRUE(fs::exists(dir / "b/bad.iso"));
    for (const char* sub : {"a", "b", "c"}) {
        EXPECT_FALSE(fs::exists(dir / sub / "_processing_temps_")) << sub;
    }
}

TEST_F(CoordinatorTest, IdenticalOutputsKeptWithoutOverwrite) {
    test::write_file(dir / "x/game.iso", "first");
    test::write_file(dir / "y/game.iso", "second");

    Coordinator c(registry, config, 2, bus);
    c.submit(request(dir / "x/game.iso", "test.copy"));
    c.submit(request(dir / "y/game.iso", "test.copy"));
    EXPECT_EQ(c.run_until_complete().succeeded, 2u);

    std::set<std::string> contents = {test::read_file(dir / "out/game.out"),
                                      test::read_file(dir / "out/game_1.out")};
    EXPECT_EQ(contents, (std::set<std::string>{"first", "second"}));
}

TEST_F(CoordinatorTest, IdenticalOutputsReplacedWithOverwrite) {
    test::write_file(dir / "x/game.iso", "first");
    test::write_file(dir / "y/game.iso", "second");

    Coordinator c(registry, config, 2, bus);
    c.submit(request(dir / "x/game.iso", "test.copy", true));
    c.submit(request(dir / "y/game.iso", "test.copy", true));
    EXPECT_EQ(c.run_until_complete().succeeded, 2u);

    EXPECT_TRUE(fs::exists(dir / "out/game.out"));
    EXPECT_FALSE(fs::exists(dir / "out/game_1.out"));
}

TEST_F(CoordinatorTest, CancelDropsOnlyQueuedJobs) {
    config.extra["gate"] = (dir / "gate").string();
    for (int i = 0; i < 5; ++i) {
        test::write_file(dir / ("in/g" + std::to_string(i) + ".iso"), "g");
    }

    Coordinator c(registry, config, 2, bus);
    std::vector<JobId> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(c.submit(request(dir / ("in/g" + std::to_string(i) + ".iso"), "test.gate")));
    }
    c.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (running(c) < 2 && std::chrono::steady_clock::now() < deadline) {
        c.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(running(c), 2u);

    EXPECT_EQ(c.cancel(), 3u);
    EXPECT_TRUE(c.cancelled());
    test::write_file(dir / "gate", "open");

    const auto s = c.run_until_complete();
    EXPECT_EQ(s.succeeded, 2u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_EQ(s.cancelled, 3u);
    EXPECT_EQ(s.total, 5u);

    std::size_t started = 0;
    for (const JobId id : ids) {
        if (rec.count<JobStartedEvent>(id) > 0) {
            ++started;
            expect_well_formed(rec, id);
        } else {
            EXPECT_TRUE(rec.for_job(id).empty());
            EXPECT_EQ(c.jobs().count(id), 0u);
        }
    }
    EXPECT_EQ(started, 2u);
}

TEST_F(CoordinatorTest, InterruptFlagCancelsQueuedJobs) {
    test::write_file(dir / "in/game.iso", "image");
    const std::atomic<bool> stop{true};

    Coordinator c(registry, config, 1, bus);
    for (int i = 0; i < 20; ++i) c.submit(request(dir / "in/game.iso", "test.copy"));
    const auto s = c.run_until_complete(&stop);

    EXPECT_TRUE(c.cancelled());
    EXPECT_EQ(s.total, 20u);
    EXPECT_EQ(s.succeeded + s.failed + s.cancelled, 20u);
    EXPECT_GT(s.cancelled, 0u);
}

TEST_F(CoordinatorTest, WorkerCrashFailsJobAndIsReplaced) {
    test::write_file(dir / "in/crash.iso", "c");
    test::write_file(dir / "in/fine.iso", "f");

    Coordinator c(registry, config, 1, bus);
    const JobId crash = c.submit(request(dir / "in/crash.iso", "test.crash"));
    const JobId fine = c.submit(request(dir / "in/fine.iso", "test.copy"));
    const auto s = c.run_until_complete();

    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(c.jobs().at(crash).error, JobError::Unhandled);
    EXPECT_EQ(c.jobs().at(fine).status, JobStatus::CompletedSuccess);
    EXPECT_EQ(c.live_workers(), 1u);
    expect_well_formed(rec, crash);
    expect_well_formed(rec, fine);
}

TEST_F(CoordinatorTest, ThrowingRoutineDoesNotKillTheWorker) {
    test::write_file(dir / "in/boom.iso", "b");
    test::write_file(dir / "in/fine.iso", "f");

    Coordinator c(registry, config, 1, bus);
    const JobId boom = c.submit(request(dir / "in/boom.iso", "test.throw"));
    const JobId fine = c.submit(request(dir / "in/fine.iso", "test.copy"));
    c.start();
    const auto workers = c.live_workers();
    c.run_until_complete();

    EXPECT_EQ(c.jobs().at(boom).error, JobError::Unhandled);
    EXPECT_NE(c.jobs().at(boom).message.find("routine exploded"), std::string::npos);
    EXPECT_EQ(c.jobs().at(fine).status, JobStatus::CompletedSuccess);
    EXPECT_EQ(c.jobs().at(boom).worker_pid, c.jobs().at(fine).worker_pid);
    EXPECT_EQ(c.live_workers(), workers);
    expect_well_formed(rec, boom);
}

TEST_F(CoordinatorTest, SettingsAreSnapshottedAtSubmit) {
    ::setenv("XDG_DATA_HOME", (dir / "xdg").c_str(), 1);
    test::write_file(dir / "in/keep.iso", "k");
    test::write_file(dir / "in/drop.iso", "d");

    Coordinator c(registry, config, 1, bus);
    c.submit(request(dir / "in/keep.iso", "test.copy"));
    c.config().delete_source_on_success = true;
    c.submit(request(dir / "in/drop.iso", "test.copy"));
    c.run_until_complete();
    c.shutdown();
    ::unsetenv("XDG_DATA_HOME");

    EXPECT_TRUE(fs::exists(dir / "in/keep.iso"));
    EXPECT_FALSE(fs::exists(dir / "in/drop.iso"));
}

TEST_F(CoordinatorTest, SubmitValidation) {
    Coordinator c(registry, config, 1, bus);
    EXPECT_THROW(c.submit(request(dir / "in/a.iso", "test.nope")), std::invalid_argument);

    const JobId first = c.submit(request(dir / "in/a.iso", "test.inspect"));
    const JobId second = c.submit(request(dir / "in/b.iso", "test.inspect"));
    EXPECT_LT(first, second);

    c.run_until_complete();
    c.shutdown();
    EXPECT_THROW(c.submit(request(dir / "in/c.iso", "test.copy")), std::logic_error);
}
