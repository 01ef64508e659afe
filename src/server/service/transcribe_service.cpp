#include "service/transcribe_service.hpp"

#include "logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

ServiceResponse plain(int status, std::string body) {
    return ServiceResponse{.status = status, .body = std::move(body)};
}

ServiceResponse overloaded(std::string body) {
    auto resp = plain(503, std::move(body));
    resp.headers.emplace_back("Retry-After", "1");
    // Rejected clients reconnect when they retry; do not keep a handler
    // thread parked on their idle connection.
    resp.headers.emplace_back("Connection", "close");
    return resp;
}

// "application/octet-stream; charset=binary" -> "application/octet-stream"
std::string_view media_type(std::string_view content_type) {
    auto semi = content_type.find(';');
    if (semi != std::string_view::npos) content_type = content_type.substr(0, semi);
    while (!content_type.empty() && content_type.back() == ' ') content_type.remove_suffix(1);
    while (!content_type.empty() && content_type.front() == ' ') content_type.remove_prefix(1);
    return content_type;
}

} // namespace

int status_for(pcm::DecodeError /*err*/) {
    return 400;
}

int status_for(AdmissionError /*err*/) {
    // Full queue and missing worker look the same to a client: retry later.
    return 503;
}

int status_for(const JobFailure& failure) {
    switch (failure.kind) {
        case JobFailure::Kind::TranscriptionFailed: return 500;
        case JobFailure::Kind::WorkerUnavailable: return 503;
    }
    return 500;
}

TranscribeService::TranscribeService(Dispatcher& dispatcher, const TranscriptionWorker* worker,
                                     Info info, std::chrono::milliseconds poll_interval)
    : dispatcher_(dispatcher), worker_(worker), info_(std::move(info)),
      poll_interval_(poll_interval) {}

ServiceResponse TranscribeService::transcribe(std::string_view content_type, std::string_view body,
                                              const AbandonCheck& abandoned) {
    auto started = std::chrono::steady_clock::now();

    if (media_type(content_type) != "application/octet-stream") {
        return plain(415, "Content-Type must be application/octet-stream");
    }

    logging::info("Received PCM audio ({} bytes)", body.size());
    auto samples = pcm::decode(body);
    if (!samples) {
        return plain(status_for(samples.error()), std::string(pcm::describe(samples.error())));
    }

    auto handle = dispatcher_.submit(std::move(*samples));
    if (!handle) {
        logging::warn("Transcription rejected: {}", describe(handle.error()));
        return overloaded(std::string(describe(handle.error())));
    }

    while (!handle->wait_for(poll_interval_)) {
        if (abandoned && abandoned()) {
            logging::info("Client disconnected, discarding result of job {}", handle->id());
            return plain(status_client_closed, "client disconnected");
        }
    }

    auto text = handle->wait();
    if (!text) {
        logging::warn("Transcription failed: {}", describe(text.error()));
        int status = status_for(text.error());
        return status == 503 ? overloaded(describe(text.error()))
                             : plain(status, describe(text.error()));
    }

    logging::info("Transcription completed in {:.3f}s",
                  std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    ServiceResponse resp;
    resp.body = json{{"text", std::move(*text)}}.dump(-1, ' ', false, json::error_handler_t::replace);
    resp.content_type = "application/json";
    resp.headers.emplace_back("Connection", "keep-alive");
    return resp;
}

ServiceResponse TranscribeService::health() const {
    // Once the queue is closed or the worker gone every submission gets 503.
    bool available = !dispatcher_.closed() &&
                     !(worker_ && worker_->state() == WorkerState::Stopped);
    json j = {
        {"status", available ? "ok" : "unavailable"},
        {"engine", std::string(to_string(info_.engine))},
        {"model_path", info_.model_path},
        {"queue_depth", dispatcher_.pending()},
        {"queue_capacity", dispatcher_.capacity()},
        {"worker", worker_ ? std::string(to_string(worker_->state())) : "none"},
    };
    return ServiceResponse{.status = available ? 200 : 503, .body = j.dump(),
                           .content_type = "application/json"};
}
