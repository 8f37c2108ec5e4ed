#include <dufs_mcp/jobs/job_runner.hpp>

#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/storage/remote_path.hpp>
#include <dufs_mcp/storage/transfer.hpp>

#include <stdexcept>

namespace dufs_mcp {

namespace {

void LogMutateFailure(const Result<void, Error>& res) {
    if (res.IsErr()) {
        LogError("jobs", res.Error().ToString());
    }
}

} // anonymous namespace

JobRunner::JobRunner(JobStore& store,
                     IStorageClient& client,
                     JobRunnerOptions options,
                     Clock clock)
    : store_(store),
      client_(client),
      options_(std::move(options)),
      clock_(std::move(clock)) {
    const int workers = options_.workers < 1 ? 1 : options_.workers;
    threads_.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        threads_.emplace_back(&JobRunner::WorkerLoop, this, i);
    }
    LogDebug("jobs", "Started " + std::to_string(workers) + " upload worker(s)");
}

JobRunner::~JobRunner() {
    Stop();
}

void JobRunner::Submit(const std::string& job_id) {
    if (shutdown_.load()) {
        LogWarn("jobs", "Runner stopped, not queueing " + job_id);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(job_id);
    }
    job_available_.notify_one();
    LogDebug("jobs", "Queued " + job_id);
}

bool JobRunner::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_.wait_for(lock, timeout,
                          [this] { return queue_.empty() && active_ == 0; });
}

void JobRunner::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_.exchange(true)) {
            return;
        }
    }
    job_available_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!queue_.empty()) {
        LogWarn("jobs", "Discarding " + std::to_string(queue_.size()) +
                            " queued job(s) at shutdown");
        queue_.clear();
    }
    idle_.notify_all();
}

void JobRunner::WorkerLoop(int worker_id) {
    for (;;) {
        std::string job_id;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            job_available_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });
            if (shutdown_.load()) {
                break;
            }
            job_id = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        LogDebug("jobs", "Worker " + std::to_string(worker_id) + " claimed " + job_id);
        RunJob(job_id);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
        }
        idle_.notify_all();
    }
}

void JobRunner::RunJob(const std::string& job_id) {
    try {
        RunTasks(job_id);
    } catch (const std::exception& e) {
        LogError("jobs", job_id + " aborted: " + e.what());
        FailJob(job_id, std::string("internal error: ") + e.what());
    } catch (...) {
        LogError("jobs", job_id + " aborted by a non-standard exception");
        FailJob(job_id, "internal error: unknown exception");
    }
}

void JobRunner::FailJob(const std::string& job_id, const std::string& error) {
    const auto now = clock_();
    LogMutateFailure(store_.Mutate(job_id, [&](UploadJob& job) {
        // The task that was in flight ends with its job.
        for (auto& task : job.tasks) {
            if (task.status == TaskStatus::Running) {
                task.status = TaskStatus::Failed;
                task.error = error;
                task.completed_at = now;
            }
        }
        job.status = JobStatus::Failed;
        job.error = error;
        job.completed_at = now;
    }));
}

void JobRunner::RunTasks(const std::string& job_id) {
    auto snapshot = store_.Get(job_id);
    if (snapshot.IsErr()) {
        LogError("jobs", snapshot.Error().ToString());
        return;
    }
    const auto tasks = std::move(snapshot).Value().tasks;

    LogMutateFailure(store_.Mutate(job_id, [](UploadJob& job) {
        job.status = JobStatus::Running;
    }));
    LogInfo("jobs", "Running " + job_id + " (" + std::to_string(tasks.size()) +
                        " task(s))");

    for (size_t i = 0; i < tasks.size(); ++i) {
        const auto& task = tasks[i];
        const auto started = clock_();
        const auto remote = ResolveRemotePath(task.local_path,
                                              task.requested_remote_path,
                                              options_.upload_dir, started);
        LogMutateFailure(store_.Mutate(job_id, [&](UploadJob& job) {
            auto& t = job.tasks.at(i);
            t.status = TaskStatus::Running;
            t.started_at = started;
            t.resolved_remote_path = remote;
        }));

        auto uploaded = UploadFile(client_, task.local_path, remote);

        const auto finished = clock_();
        if (uploaded.IsErr()) {
            const auto& error = uploaded.Error();
            const auto text = error.ToString();
            LogMutateFailure(store_.Mutate(job_id, [&](UploadJob& job) {
                auto& t = job.tasks.at(i);
                t.status = TaskStatus::Failed;
                t.error = text;
                t.http_status = error.http_status;
                t.completed_at = finished;
                job.status = JobStatus::Failed;
                job.error = text;
                job.completed_at = finished;
            }));
            LogWarn("jobs", job_id + " failed at task " + std::to_string(i) + ": " + text);
            return;
        }

        const auto& result = uploaded.Value();
        LogMutateFailure(store_.Mutate(job_id, [&](UploadJob& job) {
            auto& t = job.tasks.at(i);
            t.status = TaskStatus::Succeeded;
            t.resolved_remote_path = result.remote_path;
            t.message = "uploaded to " + result.remote_path;
            t.http_status = result.status_code;
            t.completed_at = finished;
        }));
    }

    const auto done = clock_();
    LogMutateFailure(store_.Mutate(job_id, [&](UploadJob& job) {
        job.status = JobStatus::Completed;
        job.completed_at = done;
    }));
    LogInfo("jobs", job_id + " completed");
}

} // namespace dufs_mcp
