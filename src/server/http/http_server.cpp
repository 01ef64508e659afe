#include "http/http_server.hpp"

#include "logging.hpp"

#include <chrono>
#include <thread>

HttpServer::HttpServer(const Config::Server& config, TranscribeService& service)
    : service_(service) {
    size_t threads = config.handler_threads();
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_.set_payload_max_length(config.max_bytes);
    // Idle keep-alive connections occupy a pool thread; keep them short so
    // overflow requests reach the dispatcher and get their 503 promptly.
    server_.set_keep_alive_timeout(config.keep_alive_timeout);
    server_.set_keep_alive_max_count(static_cast<size_t>(config.keep_alive_max_count));

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        apply(service_.health(), res);
    });

    server_.Post("/transcribe", [this](const httplib::Request& req, httplib::Response& res) {
        auto content_type = req.get_header_value("Content-Type");
        auto resp = service_.transcribe(content_type, req.body,
                                        [&req] { return req.is_connection_closed(); });
        apply(resp, res);
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // Reported below as "unknown error".
        }
        logging::error("{} {}: {}", req.method, req.path, what);
        res.status = 500;
        res.set_content("internal error: " + what, "text/plain");
    });

    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        logging::debug("{} {} -> {} ({} bytes in)", req.method, req.path, res.status, req.body.size());
    });
}

HttpServer::~HttpServer() {
    stop();
}

int HttpServer::bind(const std::string& host, int port) {
    if (port == 0) {
        return server_.bind_to_any_port(host);
    }
    return server_.bind_to_port(host, port) ? port : -1;
}

bool HttpServer::run() {
    started_ = true;
    if (stop_requested_) {
        finished_ = true;
        return true;
    }
    bool ok = server_.listen_after_bind();
    finished_ = true;
    return ok;
}

void HttpServer::wait_until_ready() const {
    while (!finished_ && !server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void HttpServer::stop() {
    stop_requested_ = true;
    if (started_) {
        wait_until_ready();
        server_.stop();
    }
}

void HttpServer::apply(const ServiceResponse& from, httplib::Response& to) {
    to.status = from.status;
    for (const auto& [name, value] : from.headers) {
        to.set_header(name, value);
    }
    to.set_content(from.body, from.content_type);
}
