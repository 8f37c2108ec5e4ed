#include <dufs_mcp/jobs/upload_job.hpp>

namespace dufs_mcp {

namespace {

nlohmann::json TextOrNull(const std::string& text) {
    if (text.empty()) {
        return nullptr;
    }
    return text;
}

nlohmann::json TimeOrNull(const std::optional<Timestamp>& ts) {
    if (!ts.has_value()) {
        return nullptr;
    }
    return FormatRfc3339(*ts);
}

} // anonymous namespace

const char* ToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed:    return "failed";
    }
    return "pending";
}

const char* ToString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
    }
    return "pending";
}

nlohmann::json ToJson(const UploadTask& task) {
    nlohmann::json j;
    j["local_path"] = task.local_path;
    j["requested_remote_path"] = TextOrNull(task.requested_remote_path);
    j["resolved_remote_path"] = TextOrNull(task.resolved_remote_path);
    j["status"] = ToString(task.status);
    j["message"] = TextOrNull(task.message);
    j["error"] = TextOrNull(task.error);
    j["http_status"] = task.http_status.has_value()
                           ? nlohmann::json(*task.http_status)
                           : nlohmann::json(nullptr);
    j["started_at"] = TimeOrNull(task.started_at);
    j["completed_at"] = TimeOrNull(task.completed_at);
    return j;
}

nlohmann::json ToJson(const UploadJob& job) {
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& task : job.tasks) {
        tasks.push_back(ToJson(task));
    }

    nlohmann::json j;
    j["id"] = job.id;
    j["status"] = ToString(job.status);
    j["error"] = TextOrNull(job.error);
    j["created_at"] = FormatRfc3339(job.created_at);
    j["completed_at"] = TimeOrNull(job.completed_at);
    j["tasks"] = std::move(tasks);
    return j;
}

} // namespace dufs_mcp
