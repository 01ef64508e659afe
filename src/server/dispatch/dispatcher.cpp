#include "dispatch/dispatcher.hpp"

#include "logging.hpp"

std::string_view describe(AdmissionError err) {
    switch (err) {
        case AdmissionError::QueueFull: return "transcription queue is full";
        case AdmissionError::WorkerUnavailable: return "transcription worker unavailable";
    }
    return "admission failed";
}

std::string describe(const JobFailure& failure) {
    switch (failure.kind) {
        case JobFailure::Kind::TranscriptionFailed:
            return "transcription failed: " + failure.detail;
        case JobFailure::Kind::WorkerUnavailable:
            return "transcription worker unavailable";
    }
    return failure.detail;
}

bool JobHandle::wait_for(std::chrono::milliseconds timeout) const {
    // Already taken: wait() answers immediately.
    if (!future_.valid()) return true;
    return future_.wait_for(timeout) == std::future_status::ready;
}

std::expected<std::string, JobFailure> JobHandle::wait() {
    if (!future_.valid()) {
        return std::unexpected(JobFailure{JobFailure::Kind::WorkerUnavailable, "result already taken"});
    }

    try {
        auto outcome = future_.get();
        if (!outcome) {
            return std::unexpected(JobFailure{JobFailure::Kind::TranscriptionFailed,
                                              std::move(outcome.error())});
        }
        return std::move(*outcome);
    } catch (const std::future_error& e) {
        // The job was destroyed without a reply (worker gone).
        return std::unexpected(JobFailure{JobFailure::Kind::WorkerUnavailable, e.what()});
    }
}

Dispatcher::Dispatcher(size_t capacity) : queue_(capacity) {}

std::expected<JobHandle, AdmissionError> Dispatcher::submit(std::vector<float> audio) {
    Job job;
    job.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    job.audio = std::move(audio);
    job.submitted_at = std::chrono::steady_clock::now();
    auto future = job.reply.get_future();
    uint64_t id = job.id;

    switch (queue_.try_push(std::move(job))) {
        case PushStatus::Ok:
            admitted_.fetch_add(1, std::memory_order_relaxed);
            logging::debug("job {} queued ({}/{})", id, queue_.size(), queue_.capacity());
            return JobHandle(id, std::move(future));
        case PushStatus::Full:
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return std::unexpected(AdmissionError::QueueFull);
        case PushStatus::Closed:
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return std::unexpected(AdmissionError::WorkerUnavailable);
    }
    return std::unexpected(AdmissionError::WorkerUnavailable);
}

std::optional<Job> Dispatcher::next_job() {
    return queue_.pop();
}

void Dispatcher::close() {
    queue_.close();
}
