#pragma once

#include "dispatch/dispatcher.hpp"
#include "engine/engine.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <thread>

enum class WorkerState { Idle, Running, Stopped };

std::string_view to_string(WorkerState state);

// Owns the loaded engine and runs every inference on one dedicated thread.
// The engine is never touched from any other thread; the dispatcher queue is
// the only way in.
class TranscriptionWorker {
public:
    TranscriptionWorker(std::unique_ptr<TranscriptionEngine> engine, Dispatcher& dispatcher);
    ~TranscriptionWorker();

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    // Spawns the worker thread. It warms the engine up on a silent chunk,
    // then serves jobs until the dispatcher is closed and drained.
    void start();

    // Closes the dispatcher and joins once the queued jobs are finished.
    void stop();

    WorkerState state() const { return state_.load(std::memory_order_acquire); }
    bool warmed_up() const { return warmed_up_.load(std::memory_order_acquire); }
    uint64_t jobs_completed() const { return completed_.load(std::memory_order_relaxed); }
    uint64_t jobs_failed() const { return failed_.load(std::memory_order_relaxed); }

private:
    void run();
    void warm_up();
    void process(Job& job);

    std::unique_ptr<TranscriptionEngine> engine_;
    Dispatcher& dispatcher_;

    std::atomic<WorkerState> state_{WorkerState::Idle};
    std::atomic<bool> warmed_up_{false};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::jthread thread_;
};
