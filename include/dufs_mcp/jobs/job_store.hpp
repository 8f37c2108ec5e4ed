#pragma once

#include <dufs_mcp/core/result.hpp>
#include <dufs_mcp/core/time.hpp>
#include <dufs_mcp/jobs/upload_job.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// JobStore: the in-memory table of upload jobs.
//
// The map is guarded by a shared mutex that is only taken exclusively to
// insert. Each job carries its own mutex: Mutate() and Get() on one job
// serialise, while jobs never contend with each other. Get() hands out a
// deep copy taken under the job's lock, so a reader never sees a
// half-applied mutation.
//
// Jobs live until the process exits.
// ---------------------------------------------------------------------------
class JobStore {
public:
    using Mutation = std::function<void(UploadJob&)>;

    explicit JobStore(Clock clock = SystemClock());

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /// Store a new Pending job and return its id.
    std::string Create(std::vector<UploadTask> tasks);

    /// Snapshot of a job, or NotFound.
    [[nodiscard]] Result<UploadJob, Error> Get(const std::string& job_id) const;

    /// Apply `fn` to a job under that job's lock.
    [[nodiscard]] Result<void, Error> Mutate(const std::string& job_id,
                                             const Mutation& fn);

    [[nodiscard]] size_t Size() const;

    [[nodiscard]] Timestamp Now() const { return clock_(); }

private:
    struct Entry {
        mutable std::mutex mutex;
        UploadJob job;
    };

    std::string NextId();
    std::shared_ptr<Entry> Find(const std::string& job_id) const;

    Clock clock_;
    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> jobs_;
};

} // namespace dufs_mcp
