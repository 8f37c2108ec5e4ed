#pragma once

#include <dufs_mcp/core/time.hpp>
#include <dufs_mcp/jobs/job_runner.hpp>
#include <dufs_mcp/jobs/job_store.hpp>
#include <dufs_mcp/mcp/tool_registry.hpp>
#include <dufs_mcp/storage/i_storage_client.hpp>

#include <string>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// DufsToolContext: what the dufs tools operate on. The referenced objects
// must outlive the registry the tools are registered into.
// ---------------------------------------------------------------------------
struct DufsToolContext {
    IStorageClient& client;
    JobStore& jobs;
    JobRunner& runner;
    std::string upload_dir = "uploads";
    Clock clock = SystemClock();
};

// Register the dufs tools, in the order tools/list reports them:
//   dufs_upload, dufs_upload_batch, dufs_upload_status, dufs_download,
//   dufs_delete, dufs_list, dufs_create_dir, dufs_move, dufs_get_hash,
//   dufs_download_folder, dufs_health
//
// Uploads run inline unless async is requested (batch uploads default to
// async); async uploads become a job and answer with its id at once.
// Every other tool calls dufs inline.
void RegisterDufsTools(ToolRegistry& registry, const DufsToolContext& context);

} // namespace dufs_mcp
