#pragma once

#include "dispatch/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// What the worker hands back for one job: the transcript, or the engine's
// error detail.
using TranscriptOutcome = std::expected<std::string, std::string>;

struct Job {
    uint64_t id = 0;
    std::vector<float> audio;
    std::promise<TranscriptOutcome> reply;
    std::chrono::steady_clock::time_point submitted_at;
};

enum class AdmissionError { QueueFull, WorkerUnavailable };

struct JobFailure {
    enum class Kind { TranscriptionFailed, WorkerUnavailable };
    Kind kind;
    std::string detail;
};

std::string_view describe(AdmissionError err);
std::string describe(const JobFailure& failure);

// Submitter's side of one job. Dropping the handle abandons the result; the
// job itself still runs.
class JobHandle {
public:
    JobHandle(uint64_t id, std::future<TranscriptOutcome> future)
        : id_(id), future_(std::move(future)) {}

    uint64_t id() const { return id_; }

    // True once the outcome is available, or once wait() has consumed it.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Blocks until the worker answers. Single use.
    std::expected<std::string, JobFailure> wait();

private:
    uint64_t id_;
    std::future<TranscriptOutcome> future_;
};

// Admission control in front of the single transcription worker.
class Dispatcher {
public:
    explicit Dispatcher(size_t capacity);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Never blocks. Fails with QueueFull when capacity jobs are already
    // waiting, WorkerUnavailable after close().
    std::expected<JobHandle, AdmissionError> submit(std::vector<float> audio);

    // Worker side: next job in submission order; nullopt once closed and
    // drained.
    std::optional<Job> next_job();

    void close();
    bool closed() const { return queue_.closed(); }

    size_t pending() const { return queue_.size(); }
    size_t capacity() const { return queue_.capacity(); }
    uint64_t admitted() const { return admitted_.load(std::memory_order_relaxed); }
    uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }

private:
    BoundedQueue<Job> queue_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> rejected_{0};
};
