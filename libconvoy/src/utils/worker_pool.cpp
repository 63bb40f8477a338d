#include "../../include/worker_pool.hpp"
#include "../../include/archive_stager.hpp"
#include "../../include/event_codec.hpp"
#include "../../include/job_context.hpp"
#include "../../include/job_pipeline.hpp"
#include "../../include/job_queue.hpp"
#include "../../include/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <system_error>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

namespace convoy {

    namespace {

        constexpr auto kReapInterval = std::chrono::milliseconds(50);
        constexpr auto kTerminateGrace = std::chrono::seconds(5);

        std::string worker_tag() {
            return "worker " + std::to_string(::getpid());
        }

        void fail_job(JobContext& ctx, const std::string& what) {
            ctx.error("ERROR: unhandled exception: " + what);
            Logger::log(LogLevel::Error, "Unhandled exception: " + what, "job " + std::to_string(ctx.job_id()));
            ctx.completed(false, JobError::Unhandled, what);
        }

        void process_payload(const std::string& payload, const JobPipeline& pipeline,
                             ResultChannel& results, IArchiveStager& stager) {
            const EventSink sink = [&results](const Event& e) {
                if (!results.publish(e)) {
                    Logger::log(LogLevel::Error, "Results channel closed, event lost", worker_tag());
                }
            };

            JobDescriptor job;
            try {
                job = decode_job(payload);
            } catch (const std::exception& e) {
                job.job_id = peek_job_id(payload);
                Logger::log(LogLevel::Error, std::string("Malformed job payload: ") + e.what(), worker_tag());
                if (job.job_id == 0) return;
                JobContext ctx(job, sink, stager);
                ctx.started();
                fail_job(ctx, std::string("malformed job payload: ") + e.what());
                return;
            }

            JobContext ctx(job, sink, stager);
            try {
                pipeline.run(ctx);
            } catch (const std::exception& e) {
                fail_job(ctx, e.what());
            } catch (...) {
                fail_job(ctx, "unknown exception");
            }
        }

    } // namespace

    int run_worker_loop(JobQueue& queue, ResultChannel& results, const ConversionRegistry& registry) {
        queue.detach_producer();
        results.detach_consumer();

        LibArchiveStager stager;
        const JobPipeline pipeline(registry);
        Logger::log(LogLevel::Debug, "Worker started", worker_tag());

        while (true) {
            const auto item = queue.pop();
            if (!item) {
                Logger::log(LogLevel::Warning, "Job queue closed, exiting", worker_tag());
                return 1;
            }
            if (item->is_sentinel) break;
            process_payload(item->payload, pipeline, results, stager);
        }

        Logger::log(LogLevel::Debug, "Shutdown sentinel received", worker_tag());
        return 0;
    }

    std::string WorkerPool::Exit::describe() const {
        if (WIFEXITED(status)) return "exited with code " + std::to_string(WEXITSTATUS(status));
        if (WIFSIGNALED(status)) {
            const int sig = WTERMSIG(status);
            const char* name = ::strsignal(sig);
            return "killed by signal " + std::to_string(sig) + (name ? std::string(" (") + name + ")" : "");
        }
        return "ended with status " + std::to_string(status);
    }

    WorkerPool::~WorkerPool() {
        if (live_.empty()) return;
        Logger::log(LogLevel::Warning, "Terminating " + std::to_string(live_.size()) + " worker(s)", "worker_pool");
        for (const pid_t pid : live_) ::kill(pid, SIGTERM);
        join(std::chrono::duration_cast<std::chrono::milliseconds>(kTerminateGrace));
        for (const pid_t pid : live_) {
            ::kill(pid, SIGKILL);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
        live_.clear();
    }

    void WorkerPool::start(const std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            spawn_one();
        }
        Logger::log(LogLevel::Info, "Started " + std::to_string(count) + " worker(s)", "worker_pool");
    }

    pid_t WorkerPool::spawn_one() {
        // buffered output would otherwise be written twice
        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) {
            throw std::system_error(errno, std::generic_category(), "fork");
        }
        if (pid == 0) {
            std::signal(SIGINT, SIG_IGN);
            std::signal(SIGTERM, SIG_DFL);
            int code = 1;
            try {
                code = worker_main_();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, std::string("Worker loop failed: ") + e.what(), worker_tag());
                code = 2;
            }
            std::cout.flush();
            std::cerr.flush();
            std::fflush(nullptr);
            ::_exit(code);
        }

        live_.insert(pid);
        Logger::log(LogLevel::Debug, "Spawned worker " + std::to_string(pid), "worker_pool");
        return pid;
    }

    std::vector<WorkerPool::Exit> WorkerPool::reap() {
        std::vector<Exit> exits;
        for (auto it = live_.begin(); it != live_.end();) {
            int status = 0;
            const pid_t r = ::waitpid(*it, &status, WNOHANG);
            if (r == 0 || (r < 0 && errno == EINTR)) {
                ++it;
                continue;
            }
            Exit exit;
            exit.pid = *it;
            if (r < 0) {
                // ECHILD: somebody else reaped it
                exit.status = -1;
                exit.clean = false;
            } else {
                exit.status = status;
                exit.clean = WIFEXITED(status) && WEXITSTATUS(status) == 0;
            }
            Logger::log(exit.clean ? LogLevel::Debug : LogLevel::Warning,
                        "Worker " + std::to_string(exit.pid) + " " + exit.describe(), "worker_pool");
            exits.push_back(exit);
            it = live_.erase(it);
        }
        return exits;
    }

    std::vector<WorkerPool::Exit> WorkerPool::join(const std::chrono::milliseconds timeout) {
        std::vector<Exit> exits;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!live_.empty()) {
            auto reaped = reap();
            exits.insert(exits.end(), reaped.begin(), reaped.end());
            if (live_.empty() || std::chrono::steady_clock::now() >= deadline) break;
            std::this_thread::sleep_for(kReapInterval);
        }
        return exits;
    }

} // namespace convoy
