#pragma once

#include "audio/pcm.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/worker.hpp"
#include "engine/engine.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct ServiceResponse {
    int status = 200;
    std::string body;
    std::string content_type = "text/plain";
    std::vector<std::pair<std::string, std::string>> headers;
};

inline constexpr int status_client_closed = 499;

int status_for(pcm::DecodeError err);
int status_for(AdmissionError err);
int status_for(const JobFailure& failure);

// Maps HTTP-shaped requests onto the dispatcher and dispatcher outcomes onto
// responses. Knows nothing about sockets.
class TranscribeService {
public:
    using AbandonCheck = std::function<bool()>;

    struct Info {
        EngineKind engine = EngineKind::Whisper;
        std::string model_path;
    };

    TranscribeService(Dispatcher& dispatcher, const TranscriptionWorker* worker, Info info,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    // abandoned() is polled while waiting; once it returns true the job's
    // result is discarded and 499 is returned.
    ServiceResponse transcribe(std::string_view content_type, std::string_view body,
                               const AbandonCheck& abandoned = {});

    ServiceResponse health() const;

private:
    Dispatcher& dispatcher_;
    const TranscriptionWorker* worker_;
    Info info_;
    std::chrono::milliseconds poll_interval_;
};
