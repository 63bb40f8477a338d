#include <gtest/gtest.h>

#include "channel.hpp"
#include "event_codec.hpp"
#include "job_queue.hpp"

#include <string>
#include <sys/wait.h>
#include <unistd.h>

using namespace convoy;

namespace {

    std::string job_payload(const JobId id) {
        JobDescriptor job;
        job.job_id = id;
        job.input_path = "/in/game" + std::to_string(id) + ".iso";
        job.routine_id = "test.copy";
        return encode_job(job);
    }

} // namespace

TEST(MessageChannel, PreservesMessageBoundaries) {
    MessageChannel ch;
    ASSERT_EQ(ch.send("first"), MessageChannel::SendStatus::Sent);
    ASSERT_EQ(ch.try_send("second message"), MessageChannel::SendStatus::Sent);

    EXPECT_EQ(ch.receive().value_or(""), "first");
    EXPECT_EQ(ch.try_receive().value_or(""), "second message");
    EXPECT_FALSE(ch.try_receive().has_value());
}

TEST(MessageChannel, PeekingLeavesMessagesQueued) {
    MessageChannel ch;
    EXPECT_FALSE(ch.has_pending());
    ASSERT_EQ(ch.send("only"), MessageChannel::SendStatus::Sent);
    EXPECT_TRUE(ch.has_pending());
    EXPECT_TRUE(ch.has_pending());
    EXPECT_EQ(ch.try_receive().value_or(""), "only");
    EXPECT_FALSE(ch.has_pending());
}

TEST(JobQueue, EmptyCoversBacklogAndSocket) {
    JobQueue queue;
    EXPECT_TRUE(queue.empty());
    queue.push(job_payload(1));
    EXPECT_FALSE(queue.empty());

    const auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE(item->is_sentinel);
    EXPECT_TRUE(queue.empty());
}

TEST(MessageChannel, RejectsOversizedMessages) {
    MessageChannel ch;
    const std::string big(MessageChannel::kMaxMessage + 1, 'x');
    EXPECT_THROW(ch.send(big), std::length_error);
    EXPECT_THROW(ch.try_send(big), std::length_error);
}

TEST(MessageChannel, ReportsClosedPeers) {
    MessageChannel ch;
    ch.close_read_end();
    EXPECT_EQ(ch.send("lost"), MessageChannel::SendStatus::Closed);

    MessageChannel other;
    other.close_write_end();
    EXPECT_FALSE(other.receive().has_value());
}

TEST(MessageChannel, WorksAcrossFork) {
    MessageChannel ch;
    const pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ch.close_read_end();
        const bool sent = ch.send("from child") == MessageChannel::SendStatus::Sent;
        ::_exit(sent ? 0 : 1);
    }
    ch.close_write_end();
    EXPECT_EQ(ch.receive().value_or(""), "from child");
    // every writer is gone now
    EXPECT_FALSE(ch.receive().has_value());

    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(JobQueue, FifoWithSentinel) {
    JobQueue q;
    q.push(job_payload(1));
    q.push(job_payload(2));
    q.push_sentinel();

    auto item = q.pop();
    ASSERT_TRUE(item);
    EXPECT_FALSE(item->is_sentinel);
    EXPECT_EQ(peek_job_id(item->payload), 1);

    item = q.pop();
    ASSERT_TRUE(item);
    EXPECT_EQ(peek_job_id(item->payload), 2);

    item = q.pop();
    ASSERT_TRUE(item);
    EXPECT_TRUE(item->is_sentinel);
}

TEST(JobQueue, BacklogHoldsWhatTheSocketCannot) {
    JobQueue q;
    constexpr JobId kJobs = 2000;
    for (JobId id = 1; id <= kJobs; ++id) {
        q.push(job_payload(id));
    }
    // a socket pair buffers far fewer messages than that
    EXPECT_FALSE(q.backlog_empty());

    for (JobId id = 1; id <= kJobs; ++id) {
        if (q.backlog_size() > 0) q.flush();
        const auto item = q.pop();
        ASSERT_TRUE(item);
        ASSERT_EQ(peek_job_id(item->payload), id);
    }
    EXPECT_TRUE(q.backlog_empty());
}

TEST(JobQueue, DrainRemovesJobsButKeepsSentinels) {
    JobQueue q;
    for (JobId id = 1; id <= 300; ++id) q.push(job_payload(id));
    q.push_sentinel();

    const auto removed = q.drain();
    ASSERT_EQ(removed.size(), 300u);
    EXPECT_EQ(removed.front(), 1);
    EXPECT_EQ(removed.back(), 300);

    const auto item = q.pop();
    ASSERT_TRUE(item);
    EXPECT_TRUE(item->is_sentinel);
    EXPECT_TRUE(q.drain().empty());
}

TEST(JobQueue, OversizedPayloadIsRejected) {
    JobQueue q;
    EXPECT_THROW(q.push(std::string(MessageChannel::kMaxMessage + 1, 'x')), std::length_error);
    EXPECT_TRUE(q.backlog_empty());
}

TEST(ResultChannel, DeliversEventsInOrder) {
    ResultChannel results;
    ASSERT_TRUE(results.publish(JobStartedEvent{4, "game.iso", kStageCount, 123}));
    ASSERT_TRUE(results.publish(OutputLineEvent{4, "working"}));
    ASSERT_TRUE(results.publish(JobCompletedEvent{4, true, JobError::None, "done"}));

    const auto first = results.drain(1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<JobStartedEvent>(first[0]));

    const auto rest = results.drain();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<OutputLineEvent>(rest[0]));
    EXPECT_TRUE(std::holds_alternative<JobCompletedEvent>(rest[1]));
    EXPECT_TRUE(results.drain().empty());
}

TEST(ResultChannel, ClipsHugeMessages) {
    ResultChannel results;
    ASSERT_TRUE(results.publish(ErrorLineEvent{8, std::string(MessageChannel::kMaxMessage * 2, 'e')}));
    const auto events = results.drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<ErrorLineEvent>(events[0]).message.size(), 1024u);
}
