#pragma once

#include <dufs_mcp/core/time.hpp>
#include <dufs_mcp/jobs/job_store.hpp>
#include <dufs_mcp/storage/i_storage_client.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dufs_mcp {

struct JobRunnerOptions {
    std::string upload_dir = "uploads";
    int workers = 2;
};

// ---------------------------------------------------------------------------
// JobRunner: background worker pool executing upload jobs.
//
// Submit() queues a job id and returns at once; a worker picks it up and
// runs its tasks in order, writing every state change through
// JobStore::Mutate(). The first failing task fails the whole job and the
// remaining tasks are left Pending.
//
// Each job runs inside its own error boundary: an exception escaping a job
// marks that job Failed and the worker carries on with the next one.
// ---------------------------------------------------------------------------
class JobRunner {
public:
    JobRunner(JobStore& store,
              IStorageClient& client,
              JobRunnerOptions options = {},
              Clock clock = SystemClock());
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    /// Queue a job for execution. Ignored once Stop() has been called.
    void Submit(const std::string& job_id);

    /// Block until the queue is empty and no job is running, or the
    /// timeout elapses. Returns true when idle.
    bool WaitIdle(std::chrono::milliseconds timeout);

    /// Let running jobs finish, drop queued ones, join the workers.
    void Stop();

    /// Execute one job on the calling thread.
    void RunJob(const std::string& job_id);

    [[nodiscard]] int WorkerCount() const noexcept {
        return static_cast<int>(threads_.size());
    }

private:
    void WorkerLoop(int worker_id);
    void RunTasks(const std::string& job_id);
    void FailJob(const std::string& job_id, const std::string& error);

    JobStore& store_;
    IStorageClient& client_;
    JobRunnerOptions options_;
    Clock clock_;

    std::mutex queue_mutex_;
    std::condition_variable job_available_;
    std::condition_variable idle_;
    std::deque<std::string> queue_;
    int active_ = 0;
    std::atomic<bool> shutdown_{false};
    std::vector<std::thread> threads_;
};

} // namespace dufs_mcp
