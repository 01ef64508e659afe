#include <catch2/catch_test_macros.hpp>

#include "dispatch/dispatcher.hpp"
#include "dispatch/worker.hpp"
#include "fake_engine.hpp"
#include "service/transcribe_service.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

constexpr std::string_view octet_stream = "application/octet-stream";

// n samples of little-endian PCM whose first sample carries the tag.
std::string pcm_body(int16_t tag, size_t samples = 16) {
    std::string body(samples * 2, '\0');
    auto u = static_cast<uint16_t>(tag);
    body[0] = static_cast<char>(u & 0xFF);
    body[1] = static_cast<char>(u >> 8);
    return body;
}

std::optional<std::string> header(const ServiceResponse& resp, std::string_view name) {
    for (const auto& [k, v] : resp.headers) {
        if (k == name) return v;
    }
    return std::nullopt;
}

TranscribeService::Info whisper_info() {
    return {.engine = EngineKind::Whisper, .model_path = "/models/ggml-base.en.bin"};
}

} // namespace

TEST_CASE("TranscribeService request validation", "[service]") {
    Dispatcher dispatcher(2);
    TranscribeService service(dispatcher, nullptr, whisper_info(), 10ms);

    SECTION("WrongContentType") {
        auto resp = service.transcribe("text/plain", pcm_body(1));
        REQUIRE(resp.status == 415);
        REQUIRE(dispatcher.admitted() == 0);
    }

    SECTION("MissingContentType") {
        REQUIRE(service.transcribe("", pcm_body(1)).status == 415);
    }

    SECTION("EmptyBody") {
        auto resp = service.transcribe(octet_stream, "");
        REQUIRE(resp.status == 400);
        REQUIRE(resp.body == "Empty audio payload");
    }

    SECTION("OddLengthBody") {
        auto resp = service.transcribe(octet_stream, std::string(3, '\0'));
        REQUIRE(resp.status == 400);
        REQUIRE(resp.body == "PCM byte length must be even");
        REQUIRE(dispatcher.admitted() == 0);
    }
}

TEST_CASE("TranscribeService overload", "[service]") {
    Dispatcher dispatcher(1);
    TranscribeService service(dispatcher, nullptr, whisper_info(), 10ms);

    SECTION("QueueFullIs503WithRetryAfter") {
        auto held = dispatcher.submit(tagged_audio(1));
        REQUIRE(held.has_value());

        auto before = std::chrono::steady_clock::now();
        auto resp = service.transcribe(octet_stream, pcm_body(2));
        REQUIRE(std::chrono::steady_clock::now() - before < 1s);

        REQUIRE(resp.status == 503);
        REQUIRE(resp.body == "transcription queue is full");
        REQUIRE(header(resp, "Retry-After") == "1");
        REQUIRE(header(resp, "Connection") == "close");
    }

    SECTION("ClosedDispatcherIs503") {
        dispatcher.close();
        auto resp = service.transcribe(octet_stream, pcm_body(2));
        REQUIRE(resp.status == 503);
        REQUIRE(header(resp, "Retry-After") == "1");
    }

    SECTION("JobDroppedByWorkerIs503") {
        std::jthread dropper([&dispatcher] {
            // Takes the job and discards it without an answer.
            auto job = dispatcher.next_job();
        });
        auto resp = service.transcribe(octet_stream, pcm_body(2));
        REQUIRE(resp.status == 503);
        REQUIRE(resp.body == "transcription worker unavailable");
    }
}

TEST_CASE("TranscribeService with worker", "[service]") {
    Dispatcher dispatcher(2);

    SECTION("SuccessReturnsJsonText") {
        TranscriptionWorker worker(std::make_unique<FakeEngine>(), dispatcher);
        worker.start();
        TranscribeService service(dispatcher, &worker, whisper_info(), 10ms);

        auto resp = service.transcribe(octet_stream, pcm_body(42));
        REQUIRE(resp.status == 200);
        REQUIRE(resp.content_type == "application/json");
        REQUIRE(json::parse(resp.body) == json{{"text", "tag-42"}});
        REQUIRE(header(resp, "Connection") == "keep-alive");
    }

    SECTION("ContentTypeParametersIgnored") {
        TranscriptionWorker worker(std::make_unique<FakeEngine>(), dispatcher);
        worker.start();
        TranscribeService service(dispatcher, &worker, whisper_info(), 10ms);

        auto resp = service.transcribe("application/octet-stream; charset=binary", pcm_body(3));
        REQUIRE(resp.status == 200);
    }

    SECTION("EmptyTranscriptIsSuccess") {
        auto engine = std::make_unique<FakeEngine>([](std::span<const float>)
                                                       -> std::expected<std::string, std::string> {
            return std::string{};
        });
        TranscriptionWorker worker(std::move(engine), dispatcher);
        worker.start();
        TranscribeService service(dispatcher, &worker, whisper_info(), 10ms);

        auto resp = service.transcribe(octet_stream, pcm_body(0, 8));
        REQUIRE(resp.status == 200);
        REQUIRE(json::parse(resp.body)["text"] == "");
    }

    SECTION("EngineFailureIs500") {
        auto engine = std::make_unique<FakeEngine>([](std::span<const float> samples)
                                                       -> std::expected<std::string, std::string> {
            if (is_warm_up(samples)) return std::string{};
            return std::unexpected(std::string("model crashed"));
        });
        TranscriptionWorker worker(std::move(engine), dispatcher);
        worker.start();
        TranscribeService service(dispatcher, &worker, whisper_info(), 10ms);

        auto resp = service.transcribe(octet_stream, pcm_body(7));
        REQUIRE(resp.status == 500);
        REQUIRE(resp.body == "transcription failed: model crashed");
        REQUIRE_FALSE(header(resp, "Retry-After").has_value());

        // The worker keeps serving after a failure.
        REQUIRE(service.transcribe(octet_stream, pcm_body(8)).status == 500);
        REQUIRE(worker.state() == WorkerState::Running);
    }

    SECTION("DisconnectedClientGets499") {
        Gate gate;
        auto engine = std::make_unique<FakeEngine>([&gate](std::span<const float> samples)
                                                       -> std::expected<std::string, std::string> {
            if (is_warm_up(samples)) return std::string{};
            gate.wait();
            return "tag-" + std::to_string(tag_of(samples));
        });
        auto* fake = engine.get();
        TranscriptionWorker worker(std::move(engine), dispatcher);
        worker.start();
        GateGuard release(gate);
        TranscribeService service(dispatcher, &worker, whisper_info(), 10ms);

        std::atomic<int> polls{0};
        auto resp = service.transcribe(octet_stream, pcm_body(5), [&polls] {
            return ++polls >= 3;
        });
        REQUIRE(resp.status == status_client_closed);
        REQUIRE(polls.load() == 3);

        // The abandoned job still runs; the next request is served normally.
        gate.open();
        auto next = service.transcribe(octet_stream, pcm_body(6));
        REQUIRE(next.status == 200);
        REQUIRE(json::parse(next.body)["text"] == "tag-6");
        REQUIRE(fake->calls() == std::vector<int>{0, 5, 6});
    }
}

TEST_CASE("TranscribeService health", "[service]") {
    Dispatcher dispatcher(3);

    SECTION("ReportsEngineAndQueue") {
        TranscriptionWorker worker(std::make_unique<FakeEngine>(), dispatcher);
        TranscribeService service(dispatcher, &worker,
                                  {.engine = EngineKind::Parakeet, .model_path = "/models/tdt"});

        auto held = dispatcher.submit(tagged_audio(1));
        REQUIRE(held.has_value());

        auto resp = service.health();
        REQUIRE(resp.status == 200);
        REQUIRE(resp.content_type == "application/json");

        auto j = json::parse(resp.body);
        REQUIRE(j["status"] == "ok");
        REQUIRE(j["engine"] == "parakeet");
        REQUIRE(j["model_path"] == "/models/tdt");
        REQUIRE(j["queue_depth"] == 1);
        REQUIRE(j["queue_capacity"] == 3);
        REQUIRE(j["worker"] == "idle");
    }

    SECTION("StoppedWorkerIsUnavailable") {
        TranscriptionWorker worker(std::make_unique<FakeEngine>(), dispatcher);
        worker.start();
        TranscribeService service(dispatcher, &worker, whisper_info());
        REQUIRE(service.health().status == 200);

        worker.stop();
        auto resp = service.health();
        REQUIRE(resp.status == 503);
        auto j = json::parse(resp.body);
        REQUIRE(j["status"] == "unavailable");
        REQUIRE(j["worker"] == "stopped");
    }

    SECTION("ClosedDispatcherIsUnavailable") {
        TranscribeService service(dispatcher, nullptr, whisper_info());
        dispatcher.close();
        auto resp = service.health();
        REQUIRE(resp.status == 503);
        REQUIRE(json::parse(resp.body)["status"] == "unavailable");
    }

    SECTION("WithoutWorker") {
        TranscribeService service(dispatcher, nullptr, whisper_info());
        auto j = json::parse(service.health().body);
        REQUIRE(j["engine"] == "whisper");
        REQUIRE(j["worker"] == "none");
        REQUIRE(j["status"] == "ok");
        REQUIRE(j["queue_depth"] == 0);
    }
}

TEST_CASE("Status mapping", "[service]") {
    REQUIRE(status_for(pcm::DecodeError::EmptyInput) == 400);
    REQUIRE(status_for(pcm::DecodeError::MisalignedLength) == 400);
    REQUIRE(status_for(AdmissionError::QueueFull) == 503);
    REQUIRE(status_for(AdmissionError::WorkerUnavailable) == 503);
    REQUIRE(status_for(JobFailure{JobFailure::Kind::TranscriptionFailed, "x"}) == 500);
    REQUIRE(status_for(JobFailure{JobFailure::Kind::WorkerUnavailable, ""}) == 503);
}
