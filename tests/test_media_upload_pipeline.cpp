/**
 * test_media_upload_pipeline.cpp
 *
 * End-to-end tests for MediaUploadPipeline against in-process fakes
 */

#include "lib/src/MediaUploadPipeline.h"
#include "lib/src/planning/KeyBuilder.h"
#include "mocks/FakeStorageServices.h"
#include <iostream>

using namespace mediadrop;
using namespace mediadrop::testing;

template<typename T>
bool AssertEqual(const T& actual, const T& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << expected << std::endl;
        std::cerr << "  Got:      " << actual << std::endl;
        return false;
    }
    return true;
}

#define ASSERT_EQ(actual, expected, msg) \
    if (!AssertEqual(actual, expected, msg)) return false;

#define ASSERT_TRUE(condition, msg) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to false" << std::endl; \
        return false; \
    }

#define ASSERT_FALSE(condition, msg) \
    if (condition) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to true (expected false)" << std::endl; \
        return false; \
    }

static PipelineConfig TestConfig() {
    PipelineConfig config;
    config.concurrency = 4;
    config.sign_batch_size = 10;
    config.part_size_bytes = 64 * 1024;
    config.min_part_size_bytes = 64 * 1024;
    config.multipart_threshold_bytes = 64 * 1024;
    config.part_retry_delay_ms = 1;
    return config;
}

// Test: a batch of card images is planned, signed in groups and stored
bool TestBatchEndToEnd() {
    std::cout << "Testing batch upload end to end..." << std::endl;

    FakeAuthorizationService service;
    FakeMultipartService multipart;
    FakeTransport transport;
    MediaUploadPipeline pipeline(service, multipart, transport, TestConfig());

    std::vector<MediaItem> files;
    for (int i = 1; i <= 25; ++i) {
        files.push_back(MakeItem("card_" + std::to_string(i) + ".webp", 100, "image/webp"));
    }

    BatchUploadOptions options;
    options.content_slug = "naruto";
    options.episode_number = 2;
    options.infer_from_name = true;

    ProgressLog log;
    CancellationToken cancel;
    BatchOutcome outcome = pipeline.UploadMediaBatch(MediaKind::Image, files, options,
                                                     log.Callback(), cancel);

    ASSERT_EQ(outcome.results.size(), size_t(25), "One result per file");
    ASSERT_EQ(outcome.Succeeded(), size_t(25), "All succeeded");
    ASSERT_FALSE(outcome.cancelled, "Not cancelled");
    ASSERT_EQ(service.BatchCalls(), size_t(3), "Signed in groups of 10");
    ASSERT_EQ(outcome.results[0].logical_id, std::string("001"), "Inferred first ID");
    ASSERT_EQ(outcome.results[0].key,
              std::string("items/naruto/episodes/naruto_002/image/naruto_002_001.webp"), "First key");
    ASSERT_EQ(transport.ContentType(outcome.results[0].key), std::string("image/webp"), "Content type");
    ASSERT_EQ(log.Last(), uint64_t(25), "Progress reaches total");
    ASSERT_TRUE(log.Monotonic(), "Progress monotonic");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: bad input is rejected before anything is signed or uploaded
bool TestPlanningErrors() {
    std::cout << "Testing planning errors..." << std::endl;

    FakeAuthorizationService service;
    FakeMultipartService multipart;
    FakeTransport transport;
    MediaUploadPipeline pipeline(service, multipart, transport, TestConfig());
    CancellationToken cancel;

    BatchUploadOptions options;
    options.content_slug = "show";

    std::vector<MediaItem> files = {MakeItem("a.jpg", 10, "image/jpeg"),
                                    MakeItem("b.png", 10, "image/png")};
    bool threw = false;
    try {
        pipeline.UploadMediaBatch(MediaKind::Image, files, options, nullptr, cancel);
    } catch (const PlanningError& e) {
        threw = std::string(e.what()).find("b.png") != std::string::npos;
    }
    ASSERT_TRUE(threw, "Unsupported MIME type names the file");

    options.explicit_ids = std::vector<std::string>{"1"};
    files.pop_back();
    files.push_back(MakeItem("c.jpg", 10, "image/jpeg"));
    threw = false;
    try {
        pipeline.UploadMediaBatch(MediaKind::Image, files, options, nullptr, cancel);
    } catch (const PlanningError&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "Explicit ID count mismatch");

    threw = false;
    try {
        pipeline.UploadSingleLargeFile(MediaKind::Image, files[0], LargeFileOptions(), nullptr, cancel);
    } catch (const PlanningError&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "Image is not full-episode media");

    ASSERT_EQ(service.BatchCalls() + service.SingleCalls(), size_t(0), "Nothing signed");
    ASSERT_EQ(transport.Attempts(), size_t(0), "Nothing uploaded");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: empty batch and dry-run planning
bool TestEmptyBatchAndPlan() {
    std::cout << "Testing empty batch and planning..." << std::endl;

    FakeAuthorizationService service;
    FakeMultipartService multipart;
    FakeTransport transport;
    MediaUploadPipeline pipeline(service, multipart, transport, TestConfig());
    CancellationToken cancel;

    BatchUploadOptions options;
    options.content_slug = "show";
    BatchOutcome empty = pipeline.UploadMediaBatch(MediaKind::Audio, {}, options, nullptr, cancel);
    ASSERT_TRUE(empty.results.empty(), "No results");
    ASSERT_EQ(service.BatchCalls(), size_t(0), "No sign request");

    std::vector<MediaItem> files = {MakeItem("line.ogg", 10, "audio/ogg"),
                                    MakeItem("line.wav", 10, "audio/wav")};
    options.start_index = 1000;
    BatchPlan plan = pipeline.PlanBatch(MediaKind::Audio, files, options);
    ASSERT_EQ(plan.keys.size(), size_t(2), "Two keys");
    ASSERT_EQ(plan.keys[0].primary_key,
              std::string("items/show/episodes/show_001/audio/show_001_1000.opus"), "ogg stored as opus");
    ASSERT_EQ(plan.keys[1].legacy_key,
              std::string("items/show/episodes/show_1/audio/show_001_1001.wav"), "wav legacy key");
    ASSERT_EQ(transport.Attempts(), size_t(0), "Planning uploads nothing");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: full-episode video goes through multipart with byte progress
bool TestLargeFileUpload() {
    std::cout << "Testing full-episode upload..." << std::endl;

    FakeAuthorizationService service;
    FakeMultipartService multipart;
    FakeTransport transport;
    MediaUploadPipeline pipeline(service, multipart, transport, TestConfig());
    CancellationToken cancel;

    ByteBuffer payload = MakeBytes(300 * 1024, 9);
    MediaItem video = MediaItem::FromSource(std::make_shared<MemoryMediaSource>("ep.webm", payload),
                                            "video/webm");
    LargeFileOptions options;
    options.content_slug = "show";
    options.episode_number = 4;
    options.part_size_bytes = 100 * 1024;
    options.part_concurrency = 2;

    ProgressLog log;
    LargeUploadOutcome outcome = pipeline.UploadSingleLargeFile(MediaKind::Video, video, options,
                                                                log.Callback(), cancel);

    const std::string key = "items/show/episodes/show_004/full/video.webm";
    ASSERT_TRUE(outcome.outcome == TransferOutcome::Succeeded, "Succeeded");
    ASSERT_EQ(outcome.key_used, key, "Full video key");
    ASSERT_EQ(multipart.PartAttempts(), size_t(3), "Override part size used");
    ASSERT_TRUE(multipart.Objects().at(key) == payload, "Object matches");
    ASSERT_EQ(log.Last(), uint64_t(payload.size()), "Byte progress reaches size");
    ASSERT_EQ(log.calls.back().second, uint64_t(payload.size()), "Total is the file size");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: covers use their own key layouts; only episode covers fall back
bool TestCovers() {
    std::cout << "Testing cover uploads..." << std::endl;

    FakeAuthorizationService service;
    FakeMultipartService multipart;
    FakeTransport transport;
    transport.fail_if = [](const std::string& key) {
        return key.find("/show_007/") != std::string::npos || key.find("/cover_image/") != std::string::npos;
    };
    MediaUploadPipeline pipeline(service, multipart, transport, TestConfig());
    CancellationToken cancel;

    MediaItem image = MakeItem("cover.jpg", 2048, "image/jpeg");

    LargeUploadOutcome episode = pipeline.UploadEpisodeCover("show", 7, image, true, cancel);
    ASSERT_TRUE(episode.outcome == TransferOutcome::FellBackToLegacy, "Episode cover fell back");
    ASSERT_EQ(episode.key_used, std::string("items/show/episodes/show_7/cover/cover_landscape.jpg"),
              "Legacy episode cover key");

    LargeUploadOutcome content = pipeline.UploadContentCover("show", image, false, cancel);
    ASSERT_TRUE(content.outcome == TransferOutcome::Failed, "Content cover has no fallback");
    ASSERT_EQ(content.key_used, std::string("items/show/cover_image/cover.jpg"), "Content cover key");

    transport.fail_if = nullptr;
    LargeUploadOutcome retry = pipeline.UploadContentCover("show", image, false, cancel);
    ASSERT_TRUE(retry.Ok(), "Content cover stored");
    ASSERT_EQ(multipart.Opened(), size_t(0), "Small covers never use multipart");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: batch outcome counts split cancelled items from unstarted ones
bool TestOutcomeCounts() {
    std::cout << "Testing batch outcome counts..." << std::endl;

    BatchOutcome outcome;
    const TransferOutcome mix[] = {TransferOutcome::Succeeded, TransferOutcome::Cancelled,
                                   TransferOutcome::Cancelled, TransferOutcome::NotStarted,
                                   TransferOutcome::FellBackToLegacy, TransferOutcome::Failed};
    for (TransferOutcome o : mix) {
        TransferResult r;
        r.outcome = o;
        outcome.results.push_back(r);
    }

    ASSERT_EQ(outcome.Succeeded(), size_t(1), "Succeeded");
    ASSERT_EQ(outcome.FellBack(), size_t(1), "Fell back");
    ASSERT_EQ(outcome.Failed(), size_t(1), "Failed");
    ASSERT_EQ(outcome.Cancelled(), size_t(2), "Cancelled");
    ASSERT_EQ(outcome.NotStarted(), size_t(1), "Not started");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: a cancelled token leaves every item NotStarted
bool TestCancelledBeforeStart() {
    std::cout << "Testing batch cancelled before start..." << std::endl;

    FakeAuthorizationService service;
    FakeMultipartService multipart;
    FakeTransport transport;
    MediaUploadPipeline pipeline(service, multipart, transport, TestConfig());

    CancellationToken cancel;
    cancel.Cancel();

    std::vector<MediaItem> files;
    for (int i = 0; i < 12; ++i) {
        files.push_back(MakeItem("clip.mp3", 10, "audio/mpeg"));
    }
    BatchUploadOptions options;
    options.content_slug = "show";

    BatchOutcome outcome = pipeline.UploadMediaBatch(MediaKind::Audio, files, options, nullptr, cancel);
    ASSERT_TRUE(outcome.cancelled, "Outcome marked cancelled");
    ASSERT_EQ(outcome.NotStarted(), size_t(12), "Every item NotStarted");
    ASSERT_EQ(transport.Attempts(), size_t(0), "Nothing uploaded");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " MediaUploadPipeline Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestBatchEndToEnd, "Batch End To End");
    run_test(TestPlanningErrors, "Planning Errors");
    run_test(TestEmptyBatchAndPlan, "Empty Batch and Planning");
    run_test(TestLargeFileUpload, "Full-Episode Upload");
    run_test(TestCovers, "Cover Uploads");
    run_test(TestCancelledBeforeStart, "Cancelled Before Start");
    run_test(TestOutcomeCounts, "Outcome Counts");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
