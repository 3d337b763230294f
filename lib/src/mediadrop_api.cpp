#include "mediadrop/mediadrop_api.h"
#include "MediaUploadPipeline.h"
#include "services/CurlTransport.h"
#include "services/WorkerApiClient.h"
#include <cstdlib>
#include <cstring>
#include <memory>
#include <vector>

using namespace mediadrop;

namespace {

struct PipelineHandle {
    std::unique_ptr<WorkerApiClient> api;
    std::unique_ptr<CurlTransport> transport;
    std::unique_ptr<MediaUploadPipeline> pipeline;
    LogCallback log;

    void Log(const std::string& message) const {
        if (log) log("[mediadrop_api] " + message);
    }
};

PipelineHandle* AsPipeline(mediadrop_pipeline_t handle) {
    return static_cast<PipelineHandle*>(handle);
}

// Null tokens get a private, never-signalled token
CancellationToken TokenFor(mediadrop_cancel_t token) {
    return token ? *static_cast<CancellationToken*>(token) : CancellationToken();
}

bool KindFromInt(int value, MediaKind& kind) {
    switch (value) {
        case MEDIADROP_KIND_IMAGE: kind = MediaKind::Image; return true;
        case MEDIADROP_KIND_AUDIO: kind = MediaKind::Audio; return true;
        case MEDIADROP_KIND_VIDEO: kind = MediaKind::Video; return true;
        default: return false;
    }
}

int StatusFor(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Succeeded:        return MEDIADROP_OK;
        case TransferOutcome::FellBackToLegacy: return MEDIADROP_FELL_BACK;
        case TransferOutcome::Cancelled:        return MEDIADROP_ERROR_CANCELLED;
        case TransferOutcome::NotStarted:       return MEDIADROP_ERROR_NOT_STARTED;
        case TransferOutcome::Failed:           return MEDIADROP_ERROR_FAILED;
    }
    return MEDIADROP_ERROR_FAILED;
}

MediaItem LoadFile(const MediaDropFile& file) {
    return MediaItem::FromSource(std::make_shared<FileMediaSource>(file.path),
                                 file.mime_type ? file.mime_type : "");
}

ProgressCallback BridgeProgress(mediadrop_progress_callback_t callback, void* user_data) {
    if (!callback) return nullptr;
    return [callback, user_data](uint64_t done, uint64_t total) {
        callback(done, total, user_data);
    };
}

int FinishSingle(const LargeUploadOutcome& outcome, char** out_key) {
    if (out_key) {
        *out_key = outcome.Ok() ? strdup(outcome.key_used.c_str()) : nullptr;
    }
    return StatusFor(outcome.outcome);
}

MediaDropBatchResult* NewBatchResult(int status, const std::string& error) {
    auto* result = new MediaDropBatchResult();
    result->items = nullptr;
    result->item_count = 0;
    result->cancelled = false;
    result->status = status;
    result->error = strdup(error.c_str());
    return result;
}

} // namespace

extern "C" {

MEDIADROP_API mediadrop_pipeline_t mediadrop_pipeline_create(const char* api_base_url, const MediaDropConfig* config) {
    if (!api_base_url || !*api_base_url) {
        return nullptr;
    }

    PipelineConfig pipeline_config;
    if (config) {
        if (config->sign_batch_size) pipeline_config.sign_batch_size = config->sign_batch_size;
        if (config->concurrency) pipeline_config.concurrency = config->concurrency;
        if (config->item_timeout_ms) pipeline_config.item_timeout_ms = config->item_timeout_ms;
        if (config->part_size_bytes) pipeline_config.part_size_bytes = config->part_size_bytes;
        if (config->part_concurrency) pipeline_config.part_concurrency = config->part_concurrency;
        pipeline_config.verbose = config->verbose;
    }

    auto handle = std::make_unique<PipelineHandle>();
    WorkerApiClient::Config api_config;
    api_config.base_url = api_base_url;
    api_config.part_timeout_ms = pipeline_config.item_timeout_ms;
    try {
        handle->api = std::make_unique<WorkerApiClient>(api_config);
        handle->transport = std::make_unique<CurlTransport>();
    } catch (const std::exception&) {
        return nullptr;
    }
    handle->pipeline = std::make_unique<MediaUploadPipeline>(*handle->api, *handle->api,
                                                             *handle->transport, pipeline_config);
    return handle.release();
}

MEDIADROP_API void mediadrop_pipeline_destroy(mediadrop_pipeline_t handle) {
    delete AsPipeline(handle);
}

MEDIADROP_API void mediadrop_pipeline_set_log_callback(mediadrop_pipeline_t handle, mediadrop_log_callback_t callback) {
    if (!handle) return;
    auto* pipeline = AsPipeline(handle);
    LogCallback log;
    if (callback) {
        log = [callback](const std::string& message) {
            callback(message.c_str());
        };
    }
    pipeline->log = log;
    pipeline->api->SetLogCallback(log);
    pipeline->transport->SetLogCallback(log);
    pipeline->pipeline->SetLogCallback(log);
}

MEDIADROP_API mediadrop_cancel_t mediadrop_cancel_create(void) {
    return new CancellationToken();
}

MEDIADROP_API void mediadrop_cancel_signal(mediadrop_cancel_t token) {
    if (token) {
        static_cast<CancellationToken*>(token)->Cancel();
    }
}

MEDIADROP_API bool mediadrop_cancel_is_signalled(mediadrop_cancel_t token) {
    return token && static_cast<CancellationToken*>(token)->IsCancelled();
}

MEDIADROP_API void mediadrop_cancel_destroy(mediadrop_cancel_t token) {
    delete static_cast<CancellationToken*>(token);
}

MEDIADROP_API MediaDropBatchResult* mediadrop_upload_media_batch(
    mediadrop_pipeline_t handle,
    int kind,
    const MediaDropFile* files,
    uint32_t file_count,
    const MediaDropBatchOptions* options,
    mediadrop_progress_callback_t on_progress,
    void* user_data,
    mediadrop_cancel_t cancel) {

    MediaKind media_kind;
    if (!handle || !options || (file_count && !files) || !KindFromInt(kind, media_kind)) {
        return NewBatchResult(MEDIADROP_ERROR_INVALID_ARG, "invalid arguments");
    }
    auto* pipeline = AsPipeline(handle);

    BatchUploadOptions batch_options;
    batch_options.content_slug = options->content_slug ? options->content_slug : "";
    batch_options.episode_number = options->episode_number;
    batch_options.start_index = options->start_index;
    batch_options.pad_width = options->pad_width > 0 ? options->pad_width : 3;
    batch_options.infer_from_name = options->infer_from_name;

    std::vector<MediaItem> items;
    items.reserve(file_count);
    std::vector<std::string> explicit_ids;
    for (uint32_t i = 0; i < file_count; ++i) {
        if (!files[i].path) {
            return NewBatchResult(MEDIADROP_ERROR_INVALID_ARG, "file " + std::to_string(i) + " has no path");
        }
        try {
            items.push_back(LoadFile(files[i]));
        } catch (const std::exception& e) {
            return NewBatchResult(MEDIADROP_ERROR_INVALID_ARG, e.what());
        }
        explicit_ids.push_back(files[i].explicit_id ? files[i].explicit_id : "");
    }
    if (options->use_explicit_ids) {
        batch_options.explicit_ids = explicit_ids;
    }

    BatchOutcome outcome;
    try {
        outcome = pipeline->pipeline->UploadMediaBatch(media_kind, items, batch_options,
                                                       BridgeProgress(on_progress, user_data),
                                                       TokenFor(cancel));
    } catch (const PlanningError& e) {
        pipeline->Log(std::string("Planning failed: ") + e.what());
        return NewBatchResult(MEDIADROP_ERROR_PLANNING, e.what());
    } catch (const std::exception& e) {
        pipeline->Log(std::string("Batch failed: ") + e.what());
        return NewBatchResult(MEDIADROP_ERROR_FAILED, e.what());
    }

    MediaDropBatchResult* result = NewBatchResult(MEDIADROP_OK, "");
    result->cancelled = outcome.cancelled;
    result->item_count = static_cast<uint32_t>(outcome.results.size());
    result->items = new MediaDropItemResult[outcome.results.size()];
    for (size_t i = 0; i < outcome.results.size(); ++i) {
        const TransferResult& item = outcome.results[i];
        result->items[i].logical_id = strdup(item.logical_id.c_str());
        result->items[i].key = strdup(item.key.c_str());
        result->items[i].error = strdup(item.error_detail.c_str());
        result->items[i].status = StatusFor(item.outcome);
    }
    return result;
}

MEDIADROP_API void mediadrop_free_batch_result(MediaDropBatchResult* result) {
    if (!result) return;
    for (uint32_t i = 0; i < result->item_count; ++i) {
        free((void*)result->items[i].logical_id);
        free((void*)result->items[i].key);
        free((void*)result->items[i].error);
    }
    delete[] result->items;
    free((void*)result->error);
    delete result;
}

MEDIADROP_API int mediadrop_upload_large_file(
    mediadrop_pipeline_t handle,
    int kind,
    const MediaDropFile* file,
    const char* content_slug,
    int episode_number,
    mediadrop_progress_callback_t on_byte_progress,
    void* user_data,
    mediadrop_cancel_t cancel,
    char** out_key) {

    if (out_key) *out_key = nullptr;
    MediaKind media_kind;
    if (!handle || !file || !file->path || !KindFromInt(kind, media_kind)) {
        return MEDIADROP_ERROR_INVALID_ARG;
    }
    auto* pipeline = AsPipeline(handle);

    LargeFileOptions options;
    options.content_slug = content_slug ? content_slug : "";
    options.episode_number = episode_number;

    try {
        MediaItem item = LoadFile(*file);
        LargeUploadOutcome outcome = pipeline->pipeline->UploadSingleLargeFile(
            media_kind, item, options, BridgeProgress(on_byte_progress, user_data), TokenFor(cancel));
        return FinishSingle(outcome, out_key);
    } catch (const PlanningError& e) {
        pipeline->Log(std::string("Planning failed: ") + e.what());
        return MEDIADROP_ERROR_PLANNING;
    } catch (const std::exception& e) {
        pipeline->Log(std::string("Large file upload failed: ") + e.what());
        return MEDIADROP_ERROR_FAILED;
    }
}

MEDIADROP_API int mediadrop_upload_episode_cover(
    mediadrop_pipeline_t handle,
    const MediaDropFile* file,
    const char* content_slug,
    int episode_number,
    bool landscape,
    mediadrop_cancel_t cancel,
    char** out_key) {

    if (out_key) *out_key = nullptr;
    if (!handle || !file || !file->path) {
        return MEDIADROP_ERROR_INVALID_ARG;
    }
    auto* pipeline = AsPipeline(handle);

    try {
        MediaItem item = LoadFile(*file);
        LargeUploadOutcome outcome = pipeline->pipeline->UploadEpisodeCover(
            content_slug ? content_slug : "", episode_number, item, landscape, TokenFor(cancel));
        return FinishSingle(outcome, out_key);
    } catch (const PlanningError& e) {
        pipeline->Log(std::string("Planning failed: ") + e.what());
        return MEDIADROP_ERROR_PLANNING;
    } catch (const std::exception& e) {
        pipeline->Log(std::string("Episode cover upload failed: ") + e.what());
        return MEDIADROP_ERROR_FAILED;
    }
}

MEDIADROP_API int mediadrop_upload_content_cover(
    mediadrop_pipeline_t handle,
    const MediaDropFile* file,
    const char* content_slug,
    bool landscape,
    mediadrop_cancel_t cancel,
    char** out_key) {

    if (out_key) *out_key = nullptr;
    if (!handle || !file || !file->path) {
        return MEDIADROP_ERROR_INVALID_ARG;
    }
    auto* pipeline = AsPipeline(handle);

    try {
        MediaItem item = LoadFile(*file);
        LargeUploadOutcome outcome = pipeline->pipeline->UploadContentCover(
            content_slug ? content_slug : "", item, landscape, TokenFor(cancel));
        return FinishSingle(outcome, out_key);
    } catch (const PlanningError& e) {
        pipeline->Log(std::string("Planning failed: ") + e.what());
        return MEDIADROP_ERROR_PLANNING;
    } catch (const std::exception& e) {
        pipeline->Log(std::string("Content cover upload failed: ") + e.what());
        return MEDIADROP_ERROR_FAILED;
    }
}

MEDIADROP_API void mediadrop_free_string(char* value) {
    free(value);
}

} // extern "C"
