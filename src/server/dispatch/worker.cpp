#include "dispatch/worker.hpp"

#include "audio/pcm.hpp"
#include "logging.hpp"

#include <chrono>
#include <exception>
#include <pthread.h>

std::string_view to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Idle: return "idle";
        case WorkerState::Running: return "running";
        case WorkerState::Stopped: return "stopped";
    }
    return "unknown";
}

TranscriptionWorker::TranscriptionWorker(std::unique_ptr<TranscriptionEngine> engine,
                                         Dispatcher& dispatcher)
    : engine_(std::move(engine)), dispatcher_(dispatcher) {}

TranscriptionWorker::~TranscriptionWorker() {
    stop();
}

void TranscriptionWorker::start() {
    if (state() != WorkerState::Idle) return;
    state_.store(WorkerState::Running, std::memory_order_release);
    thread_ = std::jthread([this] { run(); });
}

void TranscriptionWorker::stop() {
    dispatcher_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
    state_.store(WorkerState::Stopped, std::memory_order_release);
}

void TranscriptionWorker::run() {
    pthread_setname_np(pthread_self(), "transcriber");

    warm_up();
    logging::info("Transcription worker ready");

    while (auto job = dispatcher_.next_job()) {
        process(*job);
    }

    // Anyone still holding the queue open must now be told no.
    dispatcher_.close();
    state_.store(WorkerState::Stopped, std::memory_order_release);
    logging::info("Transcription worker stopped ({} completed, {} failed)",
                  jobs_completed(), jobs_failed());
}

void TranscriptionWorker::warm_up() {
    auto silence = pcm::silent_chunk();
    auto start = std::chrono::steady_clock::now();

    std::expected<std::string, std::string> result;
    try {
        result = engine_->transcribe(silence);
    } catch (const std::exception& e) {
        result = std::unexpected(std::string(e.what()));
    }

    if (!result) {
        logging::warn("Warm-up inference failed: {}", result.error());
        return;
    }
    warmed_up_.store(true, std::memory_order_release);
    logging::debug("Warm-up finished in {:.2f}s",
                   std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
}

void TranscriptionWorker::process(Job& job) {
    auto started = std::chrono::steady_clock::now();
    double waited = std::chrono::duration<double>(started - job.submitted_at).count();
    size_t samples = job.audio.size();

    TranscriptOutcome outcome;
    try {
        outcome = engine_->transcribe(job.audio);
    } catch (const std::exception& e) {
        outcome = std::unexpected(std::string(e.what()));
    }

    // Drop the audio before replying so at most one job's samples are alive.
    std::vector<float>().swap(job.audio);

    double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (outcome) {
        completed_.fetch_add(1, std::memory_order_relaxed);
        logging::debug("job {}: {:.1f}s audio, queued {:.3f}s, inference {:.2f}s, {} chars",
                       job.id, static_cast<double>(samples) / pcm::sample_rate_hz, waited, took,
                       outcome->size());
    } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
        logging::warn("job {} failed after {:.2f}s: {}", job.id, took, outcome.error());
    }

    // No-op for the submitter if it already gave up.
    job.reply.set_value(std::move(outcome));
}
