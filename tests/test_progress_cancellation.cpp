/**
 * test_progress_cancellation.cpp
 *
 * Unit tests for ProgressReporter and CancellationToken
 */

#include "lib/src/sync/CancellationToken.h"
#include "lib/src/sync/ProgressReporter.h"
#include "mocks/FakeStorageServices.h"
#include <iostream>
#include <thread>
#include <vector>

using namespace mediadrop;
using mediadrop::testing::ProgressLog;

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

// Test: concurrent ticks report every value once, in order
bool TestConcurrentTicks() {
    std::cout << "Testing concurrent ticks..." << std::endl;

    ProgressLog log;
    ProgressReporter progress(800, log.Callback());

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&progress]() {
            for (int i = 0; i < 100; ++i) progress.Tick();
        });
    }
    for (auto& thread : threads) thread.join();

    ASSERT_EQ(log.calls.size(), size_t(800), "One callback per tick");
    ASSERT_TRUE(log.Monotonic(), "Reported values never decrease");
    ASSERT_EQ(log.Last(), uint64_t(800), "Final value is the total");
    ASSERT_EQ(log.calls.back().second, uint64_t(800), "Total passed through");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: progress never exceeds the total
bool TestClampedAtTotal() {
    std::cout << "Testing clamp at total..." << std::endl;

    ProgressLog log;
    ProgressReporter progress(100, log.Callback());
    progress.Add(60);
    progress.Add(60);
    progress.Add(10);

    ASSERT_EQ(log.calls.size(), size_t(2), "No report once the total was reached");
    ASSERT_EQ(log.Last(), uint64_t(100), "Clamped to total");
    ASSERT_EQ(progress.Current(), uint64_t(100), "Current clamped");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: Restart keeps reported progress from going backwards
bool TestRestartStaysMonotonic() {
    std::cout << "Testing restart monotonicity..." << std::endl;

    ProgressLog log;
    ProgressReporter progress(30, log.Callback());
    progress.Add(10);
    progress.Add(10);   // reported 20
    progress.Restart();
    progress.Add(10);   // 10 <= 20, silent
    progress.Add(10);   // 20 <= 20, silent
    progress.Add(10);   // 30, reported

    ASSERT_EQ(log.calls.size(), size_t(3), "Three reports");
    ASSERT_TRUE(log.Monotonic(), "Never regresses across restart");
    ASSERT_EQ(log.Last(), uint64_t(30), "Reaches total");
    ASSERT_EQ(progress.Reported(), uint64_t(30), "Reported value");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: a ceiling holds reports back until it is released
bool TestCeilingHoldsFinalValue() {
    std::cout << "Testing progress ceiling..." << std::endl;

    ProgressLog log;
    ProgressReporter progress(40, log.Callback());
    progress.SetCeiling(39);
    progress.Add(20);
    progress.Add(20);   // running sum 40, reported 39

    ASSERT_EQ(log.Last(), uint64_t(39), "Held below the total");
    ASSERT_EQ(progress.Current(), uint64_t(40), "Running sum unaffected");

    progress.Restart();
    progress.Add(40);   // still capped, silent
    ASSERT_EQ(log.calls.size(), size_t(2), "No report while capped");

    progress.ReleaseCeiling();
    ASSERT_EQ(log.calls.size(), size_t(3), "Release reports the total");
    ASSERT_EQ(log.Last(), uint64_t(40), "Total reached after release");
    ASSERT_TRUE(log.Monotonic(), "Never regresses");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: the callback may read the reporter it is attached to
bool TestCallbackReadsReporter() {
    std::cout << "Testing callback re-entry..." << std::endl;

    std::vector<uint64_t> seen;
    ProgressReporter* self = nullptr;
    ProgressReporter progress(200, [&seen, &self](uint64_t done, uint64_t) {
        if (self->Reported() >= done) seen.push_back(done);
    });
    self = &progress;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&progress]() {
            for (int i = 0; i < 50; ++i) progress.Tick();
        });
    }
    for (auto& thread : threads) thread.join();

    ASSERT_EQ(seen.size(), size_t(200), "Every tick delivered");
    bool ordered = true;
    for (size_t i = 0; i < seen.size(); ++i) {
        if (seen[i] != i + 1) ordered = false;
    }
    ASSERT_TRUE(ordered, "Delivered in increasing order");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: copies of a token share one flag
bool TestTokenSharedState() {
    std::cout << "Testing token shared state..." << std::endl;

    CancellationToken token;
    CancellationToken copy = token;
    ASSERT_FALSE(copy.IsCancelled(), "Fresh token not cancelled");

    token.Cancel();
    ASSERT_TRUE(copy.IsCancelled(), "Copy observes cancellation");
    token.Cancel();
    ASSERT_TRUE(token.IsCancelled(), "Cancel is idempotent");

    CancellationToken other;
    ASSERT_FALSE(other.IsCancelled(), "Independent tokens are independent");

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: WaitFor wakes early on cancellation and times out otherwise
bool TestWaitFor() {
    std::cout << "Testing WaitFor..." << std::endl;

    CancellationToken idle;
    ASSERT_FALSE(idle.WaitFor(std::chrono::milliseconds(20)), "Times out without cancellation");

    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.Cancel();
    });
    bool cancelled = token.WaitFor(std::chrono::seconds(10));
    canceller.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(cancelled, "WaitFor reports cancellation");
    ASSERT_TRUE(elapsed < std::chrono::seconds(5), "WaitFor returned early");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " Progress / Cancellation Unit Tests" << std::endl;
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

    run_test(TestConcurrentTicks, "Concurrent Ticks");
    run_test(TestClampedAtTotal, "Clamp At Total");
    run_test(TestRestartStaysMonotonic, "Restart Monotonicity");
    run_test(TestCeilingHoldsFinalValue, "Progress Ceiling");
    run_test(TestCallbackReadsReporter, "Callback Re-entry");
    run_test(TestTokenSharedState, "Token Shared State");
    run_test(TestWaitFor, "WaitFor");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
