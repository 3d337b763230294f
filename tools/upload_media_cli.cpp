/**
 * Upload Media CLI - Bulk episode media upload through the media worker
 *
 * Accepts a single file or a directory of card images / audio clips and
 * uploads them under the episode's storage layout. Optionally uploads the
 * full-episode audio or video (multipart, with byte progress) and the
 * episode cover in the same run.
 *
 * Audio MIME types are detected with TagLib from the file itself
 * (MPEG, WAV, Opus, Ogg Vorbis); images and video by extension.
 *
 * Usage:
 *   upload_media_cli <file_or_directory> --api URL --slug S --episode N [options]
 *
 *   --kind image|audio   Media kind of the card files (default: image)
 *   --infer              Take IDs from trailing digits of file names
 *   --pad N              ID zero-padding width (default: 3)
 *   --start N            First sequential ID (default: 0)
 *   --concurrency N      Simultaneous uploads (default: 20)
 *   --full-audio F       Also upload F as full-episode audio
 *   --full-video F       Also upload F as full-episode video
 *   --episode-cover F    Also upload F as the episode cover
 *   --landscape          Episode cover is the landscape variant
 *   --dry-run            Print the plan and keys without uploading
 *   --verbose            Per-item logging
 *   --help               Show this help
 *
 * Ctrl+C cancels: no new items start and in-flight uploads finish or time
 * out. A second Ctrl+C exits immediately.
 */

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <thread>
#include <atomic>
#include <csignal>
#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <sstream>

#include <taglib/fileref.h>
#include <taglib/mpegfile.h>
#include <taglib/wavfile.h>
#include <taglib/opusfile.h>
#include <taglib/vorbisfile.h>

#include "lib/src/MediaUploadPipeline.h"
#include "lib/src/planning/KeyBuilder.h"
#include "lib/src/services/CurlTransport.h"
#include "lib/src/services/WorkerApiClient.h"

namespace fs = std::filesystem;
using namespace mediadrop;

static bool g_verbose = false;
static std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted = true;
    // Leave the next Ctrl+C to the default handler
    std::signal(SIGINT, SIG_DFL);
}

// ── Logging ──────────────────────────────────────────────────────────────

void log_ts(const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::cout << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
              << message << std::endl;
}

void log_phase(const std::string& name) {
    std::cout << std::endl;
    std::cout << "════════════════════════════════════════════════════════════" << std::endl;
    std::cout << "  " << name << std::endl;
    std::cout << "════════════════════════════════════════════════════════════" << std::endl;
}

// ── MIME Detection ───────────────────────────────────────────────────────

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

std::string detect_audio_mime(const fs::path& path) {
    TagLib::FileRef fileRef(path.c_str());
    if (!fileRef.isNull()) {
        if (dynamic_cast<TagLib::MPEG::File*>(fileRef.file())) return "audio/mpeg";
        if (dynamic_cast<TagLib::RIFF::WAV::File*>(fileRef.file())) return "audio/wav";
        if (dynamic_cast<TagLib::Ogg::Opus::File*>(fileRef.file())) return "audio/opus";
        if (dynamic_cast<TagLib::Ogg::Vorbis::File*>(fileRef.file())) return "audio/ogg";
    }
    return std::string();
}

std::string detect_mime(const fs::path& path, MediaKind kind) {
    const std::string ext = lower_extension(path);
    switch (kind) {
        case MediaKind::Audio:
            return detect_audio_mime(path);
        case MediaKind::Image:
            if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
            if (ext == ".webp") return "image/webp";
            if (ext == ".avif") return "image/avif";
            return std::string();
        case MediaKind::Video:
            if (ext == ".mp4" || ext == ".m4v") return "video/mp4";
            if (ext == ".webm") return "video/webm";
            return std::string();
    }
    return std::string();
}

// ── File Scanning ────────────────────────────────────────────────────────

std::vector<MediaItem> scan_files(const fs::path& input, MediaKind kind) {
    std::vector<fs::path> paths;
    if (fs::is_directory(input)) {
        for (const auto& entry : fs::directory_iterator(input)) {
            if (entry.is_regular_file()) paths.push_back(entry.path());
        }
        // Directory order is unspecified; sequential IDs follow file names
        std::sort(paths.begin(), paths.end());
    } else {
        paths.push_back(input);
    }

    std::vector<MediaItem> items;
    for (const auto& path : paths) {
        std::string mime = detect_mime(path, kind);
        if (mime.empty()) {
            if (g_verbose) log_ts("  Skipping " + path.filename().string() + " (not " +
                                  MediaKindToString(kind) + ")");
            continue;
        }
        items.push_back(MediaItem::FromSource(std::make_shared<FileMediaSource>(path.string()), mime));
    }
    return items;
}

MediaItem load_single(const std::string& path, MediaKind kind) {
    std::string mime = detect_mime(path, kind);
    if (mime.empty()) {
        throw PlanningError("cannot determine " + std::string(MediaKindToString(kind)) +
                            " type of " + path);
    }
    return MediaItem::FromSource(std::make_shared<FileMediaSource>(path), mime);
}

std::string format_bytes(uint64_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << bytes / 1024.0 / 1024.0 << "MB";
    return ss.str();
}

// Prints every 5% step and the final value
ProgressCallback make_progress(const std::string& label, bool bytes) {
    auto last_step = std::make_shared<int>(-1);
    return [label, bytes, last_step](uint64_t done, uint64_t total) {
        int step = total ? static_cast<int>(done * 20 / total) : 20;
        if (step == *last_step && done != total) return;
        *last_step = step;
        std::string text = bytes ? format_bytes(done) + " / " + format_bytes(total)
                                 : std::to_string(done) + " / " + std::to_string(total);
        log_ts("  " + label + " " + text + " (" + std::to_string(step * 5) + "%)");
    };
}

void report_single(const std::string& what, const LargeUploadOutcome& outcome) {
    if (outcome.Ok()) {
        log_ts("  ✓ " + what + " -> " + outcome.key_used +
               (outcome.outcome == TransferOutcome::FellBackToLegacy ? " (legacy layout)" : ""));
    } else {
        log_ts("  ✗ " + what + " " + TransferOutcomeToString(outcome.outcome) +
               (outcome.error_detail.empty() ? "" : ": " + outcome.error_detail));
    }
}

// ── Main ─────────────────────────────────────────────────────────────────

void print_usage(const char* prog) {
    std::cout << "Upload Media CLI - Bulk episode media upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << prog << " <file_or_directory> --api URL --slug S --episode N [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --kind image|audio   Media kind of the card files (default: image)" << std::endl;
    std::cout << "  --infer              Take IDs from trailing digits of file names" << std::endl;
    std::cout << "  --pad N              ID zero-padding width (default: 3)" << std::endl;
    std::cout << "  --start N            First sequential ID (default: 0)" << std::endl;
    std::cout << "  --concurrency N      Simultaneous uploads (default: 20)" << std::endl;
    std::cout << "  --full-audio F       Also upload F as full-episode audio" << std::endl;
    std::cout << "  --full-video F       Also upload F as full-episode video" << std::endl;
    std::cout << "  --episode-cover F    Also upload F as the episode cover" << std::endl;
    std::cout << "  --landscape          Episode cover is the landscape variant" << std::endl;
    std::cout << "  --dry-run            Show plan and keys without uploading" << std::endl;
    std::cout << "  --verbose            Per-item logging" << std::endl;
    std::cout << "  --help               Show this help" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) { print_usage(argv[0]); return 1; }

    std::string input_path, api_url, slug, full_audio, full_video, episode_cover;
    int episode = 0;
    MediaKind kind = MediaKind::Image;
    BatchUploadOptions options;
    PipelineConfig config;
    bool dry_run = false, landscape = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
                return argv[++i];
            };
            if (arg == "--help") { print_usage(argv[0]); return 0; }
            else if (arg == "--verbose") g_verbose = true;
            else if (arg == "--dry-run") dry_run = true;
            else if (arg == "--infer") options.infer_from_name = true;
            else if (arg == "--landscape") landscape = true;
            else if (arg == "--api") api_url = next();
            else if (arg == "--slug") slug = next();
            else if (arg == "--episode") episode = std::stoi(next());
            else if (arg == "--pad") options.pad_width = std::stoi(next());
            else if (arg == "--start") options.start_index = std::stoull(next());
            else if (arg == "--concurrency") config.concurrency = std::stoul(next());
            else if (arg == "--full-audio") full_audio = next();
            else if (arg == "--full-video") full_video = next();
            else if (arg == "--episode-cover") episode_cover = next();
            else if (arg == "--kind") {
                std::string value = next();
                if (value == "image") kind = MediaKind::Image;
                else if (value == "audio") kind = MediaKind::Audio;
                else throw std::invalid_argument("unknown kind: " + value);
            }
            else if (arg[0] != '-') input_path = arg;
            else throw std::invalid_argument("unknown option: " + arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    if (slug.empty() || episode < 1) {
        std::cerr << "ERROR: --slug and --episode (>= 1) are required" << std::endl;
        return 1;
    }
    if (!dry_run && api_url.empty()) {
        std::cerr << "ERROR: --api is required unless --dry-run is given" << std::endl;
        return 1;
    }
    if (!input_path.empty() && !fs::exists(input_path)) {
        std::cerr << "ERROR: Path not found: " << input_path << std::endl;
        return 1;
    }
    config.verbose = g_verbose;
    options.content_slug = slug;
    options.episode_number = episode;

    std::vector<MediaItem> files;
    std::optional<MediaItem> full_audio_item, full_video_item, cover_item;
    try {
        if (!input_path.empty()) files = scan_files(input_path, kind);
        if (!full_audio.empty()) full_audio_item = load_single(full_audio, MediaKind::Audio);
        if (!full_video.empty()) full_video_item = load_single(full_video, MediaKind::Video);
        if (!episode_cover.empty()) cover_item = load_single(episode_cover, MediaKind::Image);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ── Plan ─────────────────────────────────────────────────────────────

    log_phase("Upload Plan");
    std::cout << "  Episode: " << KeyBuilder::EpisodeFolder(slug, episode)
              << "  Kind: " << MediaKindToString(kind)
              << "  Files: " << files.size() << std::endl;

    // Dry runs never reach the network, so any base URL will do
    WorkerApiClient::Config api_config;
    api_config.base_url = api_url.empty() ? "http://localhost" : api_url;
    api_config.part_timeout_ms = config.item_timeout_ms;

    std::unique_ptr<WorkerApiClient> api;
    std::unique_ptr<CurlTransport> transport;
    try {
        api = std::make_unique<WorkerApiClient>(api_config);
        transport = std::make_unique<CurlTransport>();
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    MediaUploadPipeline pipeline(*api, *api, *transport, config);

    auto logger = [](const std::string& msg) {
        if (g_verbose) log_ts("  " + msg);
    };
    api->SetLogCallback(logger);
    transport->SetLogCallback(logger);
    pipeline.SetLogCallback(logger);

    try {
        BatchPlan plan = pipeline.PlanBatch(kind, files, options);
        for (size_t i = 0; i < plan.entries.size(); ++i) {
            std::cout << "    " << plan.entries[i].item.Name() << " -> " << plan.keys[i].primary_key
                      << " (" << format_bytes(plan.entries[i].item.byte_size) << ")" << std::endl;
        }
        if (full_audio_item) {
            std::cout << "    [full audio] " << KeyBuilder::BuildFullMediaKeys(
                slug, episode, MediaKind::Audio, full_audio_item->declared_mime_type).primary_key << std::endl;
        }
        if (full_video_item) {
            std::cout << "    [full video] " << KeyBuilder::BuildFullMediaKeys(
                slug, episode, MediaKind::Video, full_video_item->declared_mime_type).primary_key << std::endl;
        }
        if (cover_item) {
            std::cout << "    [cover] " << KeyBuilder::BuildEpisodeCoverKeys(
                slug, episode, cover_item->declared_mime_type, landscape).primary_key << std::endl;
        }
    } catch (const PlanningError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    if (dry_run) {
        std::cout << std::endl << "Dry run - nothing uploaded." << std::endl;
        return 0;
    }

    // ── Upload ───────────────────────────────────────────────────────────

    std::signal(SIGINT, signal_handler);
    CancellationToken cancel;
    std::atomic<bool> done{false};
    std::thread watcher([&]() {
        while (!done) {
            if (g_interrupted && !cancel.IsCancelled()) {
                log_ts("Interrupted - finishing in-flight uploads...");
                cancel.Cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exit_code = 0;
    auto start_time = std::chrono::steady_clock::now();

    try {
        if (!files.empty()) {
            log_phase("Card Media");
            BatchOutcome outcome = pipeline.UploadMediaBatch(kind, files, options,
                                                             make_progress("items", false), cancel);
            for (const auto& result : outcome.results) {
                if (result.outcome == TransferOutcome::Failed) {
                    log_ts("  ✗ " + result.logical_id + " " + result.key + ": " + result.error_detail);
                } else if (g_verbose && result.outcome == TransferOutcome::FellBackToLegacy) {
                    log_ts("  ⚠ " + result.logical_id + " stored under legacy key " + result.key);
                }
            }
            log_ts("Succeeded: " + std::to_string(outcome.Succeeded()) +
                   "  Legacy: " + std::to_string(outcome.FellBack()) +
                   "  Failed: " + std::to_string(outcome.Failed()) +
                   "  Not started: " + std::to_string(outcome.NotStarted()));
            if (outcome.Failed() || outcome.cancelled) exit_code = 2;
        }

        LargeFileOptions large_options;
        large_options.content_slug = slug;
        large_options.episode_number = episode;

        if (full_audio_item && !cancel.IsCancelled()) {
            log_phase("Full Episode Audio");
            auto outcome = pipeline.UploadSingleLargeFile(MediaKind::Audio, *full_audio_item, large_options,
                                                          make_progress("audio", true), cancel);
            report_single(full_audio, outcome);
            if (!outcome.Ok()) exit_code = 2;
        }
        if (full_video_item && !cancel.IsCancelled()) {
            log_phase("Full Episode Video");
            auto outcome = pipeline.UploadSingleLargeFile(MediaKind::Video, *full_video_item, large_options,
                                                          make_progress("video", true), cancel);
            report_single(full_video, outcome);
            if (!outcome.Ok()) exit_code = 2;
        }
        if (cover_item && !cancel.IsCancelled()) {
            log_phase("Episode Cover");
            auto outcome = pipeline.UploadEpisodeCover(slug, episode, *cover_item, landscape, cancel);
            report_single(episode_cover, outcome);
            if (!outcome.Ok()) exit_code = 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        exit_code = 1;
    }

    done = true;
    watcher.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time).count();
    std::cout << std::endl << "Finished in " << elapsed << " seconds"
              << (cancel.IsCancelled() ? " (cancelled)" : "") << "." << std::endl;
    return exit_code;
}
