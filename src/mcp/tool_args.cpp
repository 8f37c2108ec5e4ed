#include <dufs_mcp/mcp/tool_args.hpp>

#include <optional>

namespace dufs_mcp {

namespace {

Error ArgumentError(const std::string& field, const std::string& message) {
    return Error{"arguments", field, std::nullopt, message,
                 ErrorCategory::InvalidArgument};
}

Error MissingParam(const std::string& field) {
    return ArgumentError(field, "Missing required parameter: " + field);
}

Error InvalidParam(const std::string& field, const std::string& what) {
    return ArgumentError(field, "Invalid parameter: " + field + " " + what);
}

// Parser state shared by the per-tool functions: the first error wins and
// later lookups become no-ops.
class ArgReader {
public:
    ArgReader(const nlohmann::json& args, std::string prefix = "")
        : args_(args), prefix_(std::move(prefix)) {
        if (!args_.is_null() && !args_.is_object()) {
            error_ = ArgumentError(prefix_.empty() ? "arguments" : prefix_,
                                   "Invalid parameter: " +
                                       (prefix_.empty() ? std::string("arguments")
                                                        : prefix_) +
                                       " must be an object");
        }
    }

    // Required non-empty string.
    std::string RequireString(const std::string& key) {
        const auto* value = Find(key);
        if (error_) {
            return "";
        }
        if (value == nullptr || (value->is_string() && value->get<std::string>().empty())) {
            error_ = MissingParam(Field(key));
            return "";
        }
        if (!value->is_string()) {
            error_ = InvalidParam(Field(key), "must be a string");
            return "";
        }
        return value->get<std::string>();
    }

    std::string OptString(const std::string& key, const std::string& fallback = "") {
        const auto* value = Find(key);
        if (error_ || value == nullptr) {
            return fallback;
        }
        if (!value->is_string()) {
            error_ = InvalidParam(Field(key), "must be a string");
            return fallback;
        }
        return value->get<std::string>();
    }

    bool OptBool(const std::string& key, bool fallback) {
        const auto* value = Find(key);
        if (error_ || value == nullptr) {
            return fallback;
        }
        if (!value->is_boolean()) {
            error_ = InvalidParam(Field(key), "must be a boolean");
            return fallback;
        }
        return value->get<bool>();
    }

    // Raw access for nested values; null counts as absent.
    const nlohmann::json* Find(const std::string& key) const {
        if (error_ || !args_.is_object()) {
            return nullptr;
        }
        auto it = args_.find(key);
        if (it == args_.end() || it->is_null()) {
            return nullptr;
        }
        return &*it;
    }

    std::string Field(const std::string& key) const {
        return prefix_.empty() ? key : prefix_ + "." + key;
    }

    void Fail(Error error) {
        if (!error_) {
            error_ = std::move(error);
        }
    }

    const std::optional<Error>& error() const { return error_; }

private:
    const nlohmann::json& args_;
    std::string prefix_;
    std::optional<Error> error_;
};

template <typename T>
Result<T, Error> Finish(const ArgReader& reader, T value) {
    if (reader.error()) {
        return Result<T, Error>::Err(*reader.error());
    }
    return Result<T, Error>::Ok(std::move(value));
}

} // anonymous namespace

Result<UploadArgs, Error> ParseUploadArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    UploadArgs out;
    out.local_path = reader.RequireString("local_path");
    out.remote_path = reader.OptString("remote_path");
    out.async = reader.OptBool("async", false);
    return Finish(reader, std::move(out));
}

Result<BatchUploadArgs, Error> ParseBatchUploadArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    BatchUploadArgs out;

    const auto* files = reader.Find("files");
    if (!reader.error()) {
        if (files == nullptr) {
            reader.Fail(MissingParam("files"));
        } else if (!files->is_array()) {
            reader.Fail(InvalidParam("files", "must be an array"));
        } else if (files->empty()) {
            reader.Fail(InvalidParam("files", "must contain at least one entry"));
        }
    }

    if (!reader.error()) {
        for (size_t i = 0; i < files->size(); ++i) {
            const auto prefix = "files[" + std::to_string(i) + "]";
            const auto& item = (*files)[i];
            if (!item.is_object()) {
                reader.Fail(InvalidParam(prefix, "must be an object"));
                break;
            }
            ArgReader entry(item, prefix);
            BatchUploadEntry parsed;
            parsed.local_path = entry.RequireString("local_path");
            parsed.remote_path = entry.OptString("remote_path");
            if (entry.error()) {
                reader.Fail(*entry.error());
                break;
            }
            out.files.push_back(std::move(parsed));
        }
    }

    out.async = reader.OptBool("async", true);
    return Finish(reader, std::move(out));
}

Result<UploadStatusArgs, Error> ParseUploadStatusArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    UploadStatusArgs out;
    out.job_id = reader.RequireString("job_id");
    return Finish(reader, std::move(out));
}

Result<DownloadArgs, Error> ParseDownloadArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    DownloadArgs out;
    out.remote_path = reader.RequireString("remote_path");
    out.local_path = reader.OptString("local_path");
    return Finish(reader, std::move(out));
}

Result<PathArgs, Error> ParsePathArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    PathArgs out;
    out.path = reader.RequireString("path");
    return Finish(reader, std::move(out));
}

Result<ListArgs, Error> ParseListArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    ListArgs out;
    out.path = reader.OptString("path", "/");
    if (out.path.empty()) {
        out.path = "/";
    }
    out.query = reader.OptString("query");
    const auto format = reader.OptString("format");
    if (format == "json") {
        out.format = ListFormat::Json;
    } else if (format == "simple") {
        out.format = ListFormat::Simple;
    } else if (!format.empty()) {
        reader.Fail(InvalidParam("format", "must be one of: json, simple"));
    }
    return Finish(reader, std::move(out));
}

Result<MoveArgs, Error> ParseMoveArgs(const nlohmann::json& args) {
    ArgReader reader(args);
    MoveArgs out;
    out.source = reader.RequireString("source");
    out.destination = reader.RequireString("destination");
    return Finish(reader, std::move(out));
}

} // namespace dufs_mcp
