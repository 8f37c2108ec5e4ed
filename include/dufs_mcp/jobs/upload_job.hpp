#pragma once

#include <dufs_mcp/core/time.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dufs_mcp {

enum class TaskStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
};

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

const char* ToString(TaskStatus status);
const char* ToString(JobStatus status);

// ---------------------------------------------------------------------------
// UploadTask: one file of an upload job.
//
// Status only moves forward: Pending -> Running -> Succeeded | Failed.
// Fields filled in by the runner stay unset until the step that sets them.
// ---------------------------------------------------------------------------
struct UploadTask {
    std::string local_path;
    std::string requested_remote_path;
    std::string resolved_remote_path;
    TaskStatus status = TaskStatus::Pending;
    std::string message;
    std::string error;
    std::optional<int> http_status;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
};

// ---------------------------------------------------------------------------
// UploadJob: an ordered set of tasks run in the background.
//
// A job reaches Completed when every task succeeded, or Failed with the
// error of the first failing task; tasks after it stay Pending.
// ---------------------------------------------------------------------------
struct UploadJob {
    std::string id;
    JobStatus status = JobStatus::Pending;
    std::string error;
    Timestamp created_at;
    std::optional<Timestamp> completed_at;
    std::vector<UploadTask> tasks;
};

nlohmann::json ToJson(const UploadTask& task);
nlohmann::json ToJson(const UploadJob& job);

} // namespace dufs_mcp
