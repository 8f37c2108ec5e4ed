#include <dufs_mcp/jobs/job_store.hpp>

#include <dufs_mcp/core/log.hpp>

#include <cstdint>

namespace dufs_mcp {

namespace {

// Process-wide, so ids stay distinct across stores and within one clock tick.
std::atomic<uint64_t> g_job_sequence{0};

Error JobNotFound(const std::string& operation, const std::string& job_id) {
    return Error{operation, job_id, std::nullopt,
                 "Job not found: " + job_id, ErrorCategory::NotFound};
}

} // anonymous namespace

JobStore::JobStore(Clock clock) : clock_(std::move(clock)) {}

std::string JobStore::NextId() {
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        clock_().time_since_epoch()).count();
    const auto seq = g_job_sequence.fetch_add(1) + 1;
    return "job-" + std::to_string(nanos) + "-" + std::to_string(seq);
}

std::string JobStore::Create(std::vector<UploadTask> tasks) {
    auto entry = std::make_shared<Entry>();
    entry->job.id = NextId();
    entry->job.status = JobStatus::Pending;
    entry->job.created_at = clock_();
    entry->job.tasks = std::move(tasks);
    const auto id = entry->job.id;
    const auto count = entry->job.tasks.size();

    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        jobs_.emplace(id, std::move(entry));
    }
    LogDebug("jobs", "Created " + id + " with " + std::to_string(count) + " task(s)");
    return id;
}

std::shared_ptr<JobStore::Entry> JobStore::Find(const std::string& job_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<UploadJob, Error> JobStore::Get(const std::string& job_id) const {
    auto entry = Find(job_id);
    if (!entry) {
        return Result<UploadJob, Error>::Err(JobNotFound("GetJob", job_id));
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return Result<UploadJob, Error>::Ok(entry->job);
}

Result<void, Error> JobStore::Mutate(const std::string& job_id, const Mutation& fn) {
    auto entry = Find(job_id);
    if (!entry) {
        return Result<void, Error>::Err(JobNotFound("MutateJob", job_id));
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    fn(entry->job);
    return Result<void, Error>::Ok();
}

size_t JobStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return jobs_.size();
}

} // namespace dufs_mcp
