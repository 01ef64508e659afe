#include "config.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/worker.hpp"
#include "engine/engine.hpp"
#include "engine/whisper_engine.hpp"
#include "http/http_server.hpp"
#include "logging.hpp"
#include "service/transcribe_service.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <print>
#include <signal.h>
#include <string>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>

namespace {

void print_usage() {
    std::println("Usage: speech-server [options]");
    std::println("Options:");
    std::println("  -c, --config PATH          Config file path");
    std::println("  -e, --engine NAME          whisper | parakeet | remote (default: whisper)");
    std::println("  -m, --model-path PATH      Whisper model file, Parakeet model directory or remote URL");
    std::println("  -b, --bind HOST:PORT       Bind address (default: 127.0.0.1:8080)");
    std::println("      --max-bytes N          Max request body size in bytes (default: 50000000)");
    std::println("      --queue-capacity N     Max number of queued transcription jobs (default: 8)");
    std::println("      --http-threads N       HTTP handler threads (default: queue capacity + 4)");
    std::println("      --keep-alive-timeout N Seconds an idle connection may stay open (default: 2)");
    std::println("      --keep-alive-max N     Requests served per connection (default: 5)");
    std::println("  -t, --threads N            Inference threads (default: 4)");
    std::println("  -l, --language CODE        Spoken language or 'auto' (default: auto)");
    std::println("  -v, --verbose              Enable debug logging");
    std::println("  -q, --quiet                Only log warnings and errors");
    std::println("  -h, --help                 Show this help");
}

template <typename T>
bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[i + 1];
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::println(stderr, "missing value for {}", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            logging::set_level(logging::Level::Debug);
        } else if (arg == "--quiet" || arg == "-q") {
            logging::set_level(logging::Level::Warn);
        } else if (arg == "--config" || arg == "-c") {
            if (!value(v)) return 2;
        } else if (arg == "--engine" || arg == "-e") {
            if (!value(config.engine.kind)) return 2;
        } else if (arg == "--model-path" || arg == "-m") {
            if (!value(config.engine.model_path)) return 2;
        } else if (arg == "--bind" || arg == "-b") {
            if (!value(config.server.bind)) return 2;
        } else if (arg == "--language" || arg == "-l") {
            if (!value(config.engine.language)) return 2;
        } else if (arg == "--max-bytes") {
            if (!value(v) || !parse_number(v, config.server.max_bytes)) {
                std::println(stderr, "invalid --max-bytes '{}'", v);
                return 2;
            }
        } else if (arg == "--queue-capacity") {
            if (!value(v) || !parse_number(v, config.server.queue_capacity)) {
                std::println(stderr, "invalid --queue-capacity '{}'", v);
                return 2;
            }
        } else if (arg == "--http-threads") {
            if (!value(v) || !parse_number(v, config.server.http_threads)) {
                std::println(stderr, "invalid --http-threads '{}'", v);
                return 2;
            }
        } else if (arg == "--keep-alive-timeout") {
            if (!value(v) || !parse_number(v, config.server.keep_alive_timeout)) {
                std::println(stderr, "invalid --keep-alive-timeout '{}'", v);
                return 2;
            }
        } else if (arg == "--keep-alive-max") {
            if (!value(v) || !parse_number(v, config.server.keep_alive_max_count)) {
                std::println(stderr, "invalid --keep-alive-max '{}'", v);
                return 2;
            }
        } else if (arg == "--threads" || arg == "-t") {
            if (!value(v) || !parse_number(v, config.engine.threads)) {
                std::println(stderr, "invalid --threads '{}'", v);
                return 2;
            }
        } else {
            std::println(stderr, "unknown option '{}' (see --help)", arg);
            return 2;
        }
    }

    if (auto ok = config.validate(); !ok) {
        logging::error("invalid configuration: {}", ok.error());
        return 2;
    }
    auto kind = *parse_engine_kind(config.engine.kind);
    auto bind_addr = *parse_bind_address(config.server.bind);

    // Block termination signals before any thread exists so every thread
    // inherits the mask and only the signalfd below sees them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    int signal_fd = signalfd(-1, &mask, SFD_CLOEXEC);
    if (signal_fd < 0) {
        logging::error("signalfd failed: {}", std::strerror(errno));
        return 1;
    }

    install_whisper_log_forwarding();

    auto engine = load_engine(kind, config);
    if (!engine) {
        logging::error("{}", engine.error().message);
        ::close(signal_fd);
        return 1;
    }
    logging::info("Loaded model for engine {} from {}", to_string(kind), config.engine.model_path);

    Dispatcher dispatcher(config.server.queue_capacity);
    TranscriptionWorker worker(std::move(*engine), dispatcher);
    worker.start();

    TranscribeService service(dispatcher, &worker,
                              {.engine = kind, .model_path = config.engine.model_path});
    HttpServer server(config.server, service);

    if (server.bind(bind_addr.host, bind_addr.port) < 0) {
        logging::error("could not bind {}", config.server.bind);
        worker.stop();
        ::close(signal_fd);
        return 1;
    }
    logging::info("HTTP server listening on {} (queue capacity {}, max body {} bytes)",
                  config.server.bind, config.server.queue_capacity, config.server.max_bytes);

    std::jthread http_thread([&server] {
        if (!server.run()) {
            logging::error("HTTP server stopped unexpectedly");
            // Wake the main thread so the process shuts down.
            ::kill(::getpid(), SIGTERM);
        }
    });
    // Signals are read only once connections are being accepted.
    server.wait_until_ready();

    signalfd_siginfo info{};
    while (::read(signal_fd, &info, sizeof(info)) < 0 && errno == EINTR) {
    }
    logging::info("Received signal {}, shutting down", info.ssi_signo);
    ::close(signal_fd);

    // New submissions get 503 from here on; queued jobs still finish.
    dispatcher.close();
    server.stop();
    http_thread.join();
    worker.stop();
    return 0;
}
