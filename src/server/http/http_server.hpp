#pragma once

#include "config.hpp"
#include "service/transcribe_service.hpp"

#include <atomic>
#include <httplib.h>
#include <string>

// HTTP front end: GET /health, POST /transcribe (raw PCM body).
class HttpServer {
public:
    HttpServer(const Config::Server& config, TranscribeService& service);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds the configured address. Port 0 picks a free port.
    // Returns the bound port or -1.
    int bind(const std::string& host, int port);

    // Serves until stop() is called. Returns false if the server failed.
    bool run();

    // Blocks until run() is accepting connections or has already returned.
    void wait_until_ready() const;

    // Safe from any thread, before or after run() has started. A stop that
    // lands before run() makes run() return without serving.
    void stop();

    bool is_running() const { return server_.is_running(); }

private:
    static void apply(const ServiceResponse& from, httplib::Response& to);

    TranscribeService& service_;
    httplib::Server server_;
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> stop_requested_{false};
};
