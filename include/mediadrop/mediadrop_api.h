#ifndef MEDIADROP_API_H
#define MEDIADROP_API_H

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
    #ifdef MEDIADROP_EXPORTS
        #define MEDIADROP_API __declspec(dllexport)
    #else
        #define MEDIADROP_API __declspec(dllimport)
    #endif
#else
    #define MEDIADROP_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

// Opaque handles
typedef void* mediadrop_pipeline_t;
typedef void* mediadrop_cancel_t;

// Callback types
typedef void (*mediadrop_log_callback_t)(const char* message);
typedef void (*mediadrop_progress_callback_t)(uint64_t done, uint64_t total, void* user_data);

// Status codes
#define MEDIADROP_OK                 0
#define MEDIADROP_FELL_BACK          1
#define MEDIADROP_ERROR_FAILED      -1
#define MEDIADROP_ERROR_CANCELLED   -2
#define MEDIADROP_ERROR_INVALID_ARG -3
#define MEDIADROP_ERROR_PLANNING    -4
#define MEDIADROP_ERROR_NOT_STARTED -5

// Media kinds
#define MEDIADROP_KIND_IMAGE 0
#define MEDIADROP_KIND_AUDIO 1
#define MEDIADROP_KIND_VIDEO 2

// Pipeline tunables; zero fields keep the library defaults
struct MediaDropConfig {
    uint32_t sign_batch_size;      // default 100
    uint32_t concurrency;          // default 20
    uint32_t item_timeout_ms;      // default 120000
    uint64_t part_size_bytes;      // default 8 MiB, raised to 5 MiB minimum
    uint32_t part_concurrency;     // default 3
    bool verbose;
};

// One input file
struct MediaDropFile {
    const char* path;              // Local file path
    const char* mime_type;         // Declared MIME type
    const char* explicit_id;       // Optional; NULL or "" for automatic IDs
};

struct MediaDropBatchOptions {
    const char* content_slug;
    int episode_number;
    uint64_t start_index;
    int pad_width;                 // 0 selects the default of 3
    bool infer_from_name;
    bool use_explicit_ids;         // Read MediaDropFile::explicit_id for every file
};

// Per-item result of a batch upload
struct MediaDropItemResult {
    const char* logical_id;
    const char* key;               // Key written or last attempted
    const char* error;             // Empty on success
    int status;                    // MEDIADROP_OK, MEDIADROP_FELL_BACK or a negative code
};

struct MediaDropBatchResult {
    MediaDropItemResult* items;    // Plan order
    uint32_t item_count;
    bool cancelled;
    int status;                    // MEDIADROP_OK, or a negative code if nothing was attempted
    const char* error;             // Planning error text, else empty
};

// Pipeline lifecycle
MEDIADROP_API mediadrop_pipeline_t mediadrop_pipeline_create(const char* api_base_url, const struct MediaDropConfig* config);
MEDIADROP_API void mediadrop_pipeline_destroy(mediadrop_pipeline_t handle);
MEDIADROP_API void mediadrop_pipeline_set_log_callback(mediadrop_pipeline_t handle, mediadrop_log_callback_t callback);

// Cancellation tokens
MEDIADROP_API mediadrop_cancel_t mediadrop_cancel_create(void);
MEDIADROP_API void mediadrop_cancel_signal(mediadrop_cancel_t token);
MEDIADROP_API bool mediadrop_cancel_is_signalled(mediadrop_cancel_t token);
MEDIADROP_API void mediadrop_cancel_destroy(mediadrop_cancel_t token);

// Batch upload of card images/audio. Free the result with mediadrop_free_batch_result.
MEDIADROP_API struct MediaDropBatchResult* mediadrop_upload_media_batch(
    mediadrop_pipeline_t handle,
    int kind,
    const struct MediaDropFile* files,
    uint32_t file_count,
    const struct MediaDropBatchOptions* options,
    mediadrop_progress_callback_t on_progress,
    void* user_data,
    mediadrop_cancel_t cancel);

MEDIADROP_API void mediadrop_free_batch_result(struct MediaDropBatchResult* result);

// Full-episode audio/video. On success *out_key receives a malloc'd key (free with mediadrop_free_string).
MEDIADROP_API int mediadrop_upload_large_file(
    mediadrop_pipeline_t handle,
    int kind,
    const struct MediaDropFile* file,
    const char* content_slug,
    int episode_number,
    mediadrop_progress_callback_t on_byte_progress,
    void* user_data,
    mediadrop_cancel_t cancel,
    char** out_key);

MEDIADROP_API int mediadrop_upload_episode_cover(
    mediadrop_pipeline_t handle,
    const struct MediaDropFile* file,
    const char* content_slug,
    int episode_number,
    bool landscape,
    mediadrop_cancel_t cancel,
    char** out_key);

MEDIADROP_API int mediadrop_upload_content_cover(
    mediadrop_pipeline_t handle,
    const struct MediaDropFile* file,
    const char* content_slug,
    bool landscape,
    mediadrop_cancel_t cancel,
    char** out_key);

MEDIADROP_API void mediadrop_free_string(char* value);

#ifdef __cplusplus
}
#endif

#endif // MEDIADROP_API_H
