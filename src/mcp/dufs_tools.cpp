#include <dufs_mcp/mcp/dufs_tools.hpp>

#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/mcp/tool_args.hpp>
#include <dufs_mcp/storage/entries.hpp>
#include <dufs_mcp/storage/remote_path.hpp>
#include <dufs_mcp/storage/transfer.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace dufs_mcp {

namespace {

using JsonResult = Result<nlohmann::json, Error>;

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

JsonResult Ok(nlohmann::json payload) {
    return JsonResult::Ok(std::move(payload));
}

// Argument errors are reported against the tool that received them.
JsonResult ArgsError(const std::string& tool, Error error) {
    error.operation = tool;
    return JsonResult::Err(std::move(error));
}

JsonResult ToolError(Error error) {
    return JsonResult::Err(std::move(error));
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc, bool default_value) {
    return {{"type", "boolean"}, {"description", desc}, {"default", default_value}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

// ---------------------------------------------------------------------------
// Uploads
// ---------------------------------------------------------------------------

nlohmann::json Acceptance(const std::string& job_id, size_t task_count) {
    return {
        {"success", true},
        {"job_id", job_id},
        {"status", ToString(JobStatus::Pending)},
        {"task_count", task_count}
    };
}

std::string StartJob(const DufsToolContext& ctx, std::vector<UploadTask> tasks) {
    const auto id = ctx.jobs.Create(std::move(tasks));
    ctx.runner.Submit(id);
    return id;
}

UploadTask MakeTask(const std::string& local_path, const std::string& remote_path) {
    UploadTask task;
    task.local_path = local_path;
    task.requested_remote_path = remote_path;
    return task;
}

// dufs_upload
JsonResult HandleUpload(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseUploadArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_upload", std::move(parsed).Error());
    const auto& args = parsed.Value();

    if (args.async) {
        const auto id = StartJob(ctx, {MakeTask(args.local_path, args.remote_path)});
        return Ok(Acceptance(id, 1));
    }

    const auto remote = ResolveRemotePath(args.local_path, args.remote_path,
                                          ctx.upload_dir, ctx.clock());
    auto uploaded = UploadFile(ctx.client, args.local_path, remote);
    if (uploaded.IsErr()) return ToolError(std::move(uploaded).Error());
    const auto& result = uploaded.Value();

    return Ok({
        {"success", true},
        {"message", "File uploaded successfully to " + result.remote_path},
        {"remote_path", result.remote_path},
        {"status", result.status_code}
    });
}

// dufs_upload_batch
JsonResult HandleUploadBatch(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseBatchUploadArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_upload_batch", std::move(parsed).Error());
    const auto& args = parsed.Value();

    if (args.async) {
        std::vector<UploadTask> tasks;
        tasks.reserve(args.files.size());
        for (const auto& file : args.files) {
            tasks.push_back(MakeTask(file.local_path, file.remote_path));
        }
        const auto id = StartJob(ctx, std::move(tasks));
        return Ok(Acceptance(id, args.files.size()));
    }

    // Synchronous batch: every file is attempted, failures are reported
    // per entry.
    nlohmann::json results = nlohmann::json::array();
    bool all_ok = true;
    for (const auto& file : args.files) {
        const auto remote = ResolveRemotePath(file.local_path, file.remote_path,
                                              ctx.upload_dir, ctx.clock());
        auto uploaded = UploadFile(ctx.client, file.local_path, remote);
        if (uploaded.IsOk()) {
            results.push_back({
                {"local_path", file.local_path},
                {"remote_path", uploaded.Value().remote_path},
                {"success", true},
                {"status", uploaded.Value().status_code}
            });
            continue;
        }
        all_ok = false;
        const auto& error = uploaded.Error();
        results.push_back({
            {"local_path", file.local_path},
            {"remote_path", file.remote_path},
            {"success", false},
            {"status", error.http_status.value_or(0)},
            {"error", error.ToString()}
        });
    }

    const auto count = results.size();
    return Ok({
        {"success", all_ok},
        {"results", std::move(results)},
        {"count", count}
    });
}

// dufs_upload_status
JsonResult HandleUploadStatus(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseUploadStatusArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_upload_status", std::move(parsed).Error());

    auto job = ctx.jobs.Get(parsed.Value().job_id);
    if (job.IsErr()) return ToolError(std::move(job).Error());

    return Ok({{"success", true}, {"job", ToJson(job.Value())}});
}

// ---------------------------------------------------------------------------
// Downloads
// ---------------------------------------------------------------------------

nlohmann::json DownloadPayload(const std::string& what, const DownloadResult& result) {
    return {
        {"success", true},
        {"message", what + " downloaded successfully to " + result.local_path},
        {"local_path", result.local_path},
        {"size_bytes", result.size_bytes},
        {"status", result.status_code}
    };
}

// dufs_download
JsonResult HandleDownload(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseDownloadArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_download", std::move(parsed).Error());
    const auto& args = parsed.Value();

    auto result = DownloadFile(ctx.client, args.remote_path, args.local_path);
    if (result.IsErr()) return ToolError(std::move(result).Error());
    return Ok(DownloadPayload("File", result.Value()));
}

// dufs_download_folder
JsonResult HandleDownloadFolder(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseDownloadArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_download_folder", std::move(parsed).Error());
    const auto& args = parsed.Value();

    auto result = DownloadFolder(ctx.client, args.remote_path, args.local_path);
    if (result.IsErr()) return ToolError(std::move(result).Error());
    return Ok(DownloadPayload("Folder", result.Value()));
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

// dufs_delete
JsonResult HandleDelete(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParsePathArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_delete", std::move(parsed).Error());
    const auto& path = parsed.Value().path;

    auto status = DeleteEntry(ctx.client, path);
    if (status.IsErr()) return ToolError(std::move(status).Error());
    return Ok({
        {"success", true},
        {"message", "Deleted " + path + " successfully"},
        {"status", status.Value()}
    });
}

// dufs_list
JsonResult HandleList(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseListArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_list", std::move(parsed).Error());
    const auto& args = parsed.Value();

    auto listing = ListDirectory(ctx.client, args.path, args.query, args.format);
    if (listing.IsErr()) return ToolError(std::move(listing).Error());
    return Ok({
        {"success", true},
        {"data", listing.Value().data},
        {"status", listing.Value().status_code}
    });
}

// dufs_create_dir
JsonResult HandleCreateDir(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParsePathArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_create_dir", std::move(parsed).Error());
    const auto& path = parsed.Value().path;

    auto created = CreateDirectory(ctx.client, path);
    if (created.IsErr()) return ToolError(std::move(created).Error());
    const auto& result = created.Value();
    return Ok({
        {"success", true},
        {"message", result.already_existed
                        ? "Directory " + path + " already exists"
                        : "Directory " + path + " created successfully"},
        {"status", result.status_code}
    });
}

// dufs_move
JsonResult HandleMove(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParseMoveArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_move", std::move(parsed).Error());
    const auto& args = parsed.Value();

    auto status = MoveEntry(ctx.client, args.source, args.destination);
    if (status.IsErr()) return ToolError(std::move(status).Error());
    return Ok({
        {"success", true},
        {"message", "Moved " + args.source + " to " + args.destination + " successfully"},
        {"status", status.Value()}
    });
}

// dufs_get_hash
JsonResult HandleGetHash(const DufsToolContext& ctx, const nlohmann::json& params) {
    auto parsed = ParsePathArgs(params);
    if (parsed.IsErr()) return ArgsError("dufs_get_hash", std::move(parsed).Error());
    const auto& path = parsed.Value().path;

    auto hash = GetHash(ctx.client, path);
    if (hash.IsErr()) return ToolError(std::move(hash).Error());
    return Ok({{"success", true}, {"hash", hash.Value()}, {"path", path}});
}

// dufs_health
JsonResult HandleHealth(const DufsToolContext& ctx, const nlohmann::json& /*params*/) {
    auto health = CheckHealth(ctx.client);
    if (health.IsErr()) return ToolError(std::move(health).Error());
    const auto& result = health.Value();
    return Ok({
        {"success", result.healthy},
        {"status", result.status_code},
        {"healthy", result.healthy}
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterDufsTools
// ---------------------------------------------------------------------------
void RegisterDufsTools(ToolRegistry& registry, const DufsToolContext& context) {
    // Handlers copy the context; it only holds references and small values.
    const auto bind = [context](JsonResult (*fn)(const DufsToolContext&,
                                                 const nlohmann::json&)) {
        return [context, fn](const nlohmann::json& params) { return fn(context, params); };
    };

    registry.Register(
        "dufs_upload",
        "Upload a file to the dufs server. Runs synchronously by default; with "
        "async=true the upload runs in the background and a job_id is returned.",
        MakeSchema({
            {"local_path", StringProp("Local file path")},
            {"remote_path", StringProp(
                "Remote file path (optional). Defaults to "
                "<upload_dir>/<YYYYMMDD>/<file name>, e.g. uploads/20251125/file.txt")},
            {"async", BoolProp("Upload in the background and return a job_id", false)}
        }, {"local_path"}),
        bind(&HandleUpload));

    registry.Register(
        "dufs_upload_batch",
        "Upload several files to the dufs server. Runs in the background by "
        "default and returns a job_id; with async=false all files are uploaded "
        "before answering.",
        MakeSchema({
            {"files", {
                {"type", "array"},
                {"description", "Files to upload"},
                {"items", MakeSchema({
                    {"local_path", StringProp("Local file path")},
                    {"remote_path", StringProp("Remote file path (optional)")}
                }, {"local_path"})}
            }},
            {"async", BoolProp("Upload in the background and return a job_id", true)}
        }, {"files"}),
        bind(&HandleUploadBatch));

    registry.Register(
        "dufs_upload_status",
        "Get the status of a background upload job.",
        MakeSchema({{"job_id", StringProp("Upload job id")}}, {"job_id"}),
        bind(&HandleUploadStatus));

    registry.Register(
        "dufs_download",
        "Download a file from the dufs server.",
        MakeSchema({
            {"remote_path", StringProp("Remote file path")},
            {"local_path", StringProp("Local destination path (optional)")}
        }, {"remote_path"}),
        bind(&HandleDownload));

    registry.Register(
        "dufs_delete",
        "Delete a file or directory on the dufs server.",
        MakeSchema({{"path", StringProp("Path of the file or directory to delete")}},
                   {"path"}),
        bind(&HandleDelete));

    nlohmann::json format = StringProp("Output format: json or simple (optional)");
    format["enum"] = {"json", "simple"};
    registry.Register(
        "dufs_list",
        "List or search a directory on the dufs server.",
        MakeSchema({
            {"path", StringProp("Directory path (defaults to the root)")},
            {"query", StringProp("Search query (optional)")},
            {"format", format}
        }, nlohmann::json::array()),
        bind(&HandleList));

    registry.Register(
        "dufs_create_dir",
        "Create a directory on the dufs server.",
        MakeSchema({{"path", StringProp("Directory path to create")}}, {"path"}),
        bind(&HandleCreateDir));

    registry.Register(
        "dufs_move",
        "Move or rename a file or directory on the dufs server.",
        MakeSchema({
            {"source", StringProp("Source path")},
            {"destination", StringProp("Destination path")}
        }, {"source", "destination"}),
        bind(&HandleMove));

    registry.Register(
        "dufs_get_hash",
        "Get the SHA-256 hash of a file on the dufs server.",
        MakeSchema({{"path", StringProp("File path")}}, {"path"}),
        bind(&HandleGetHash));

    registry.Register(
        "dufs_download_folder",
        "Download a whole directory as a zip archive.",
        MakeSchema({
            {"remote_path", StringProp("Remote directory path")},
            {"local_path", StringProp("Local destination path (optional)")}
        }, {"remote_path"}),
        bind(&HandleDownloadFolder));

    registry.Register(
        "dufs_health",
        "Check whether the dufs server is healthy.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        bind(&HandleHealth));

    LogDebug("mcp", "Registered " + std::to_string(registry.Tools().size()) + " tools");
}

} // namespace dufs_mcp
