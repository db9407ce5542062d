// Niyama server: context rules over JSON-RPC on stdio
//
// Reads one JSON-RPC request per line from stdin and writes one response
// per line to stdout. Diagnostics go to stderr.
//
// Options:
//   --config-dir PATH        Context directory (default: $CONTEXT_CONFIG_DIR or ./contexts)
//   --no-auto-load           Start with an empty store
//   --memory-socket PATH     Memory service Unix socket ($NIYAMA_MEMORY_SOCKET)
//   --memory-timeout-ms N    Per-call memory service timeout ($NIYAMA_MEMORY_TIMEOUT_MS)

#include <niyama/audit.hpp>
#include <niyama/config.hpp>
#include <niyama/context_store.hpp>
#include <niyama/memory_client.hpp>
#include <niyama/rpc/handler.hpp>
#include <niyama/session.hpp>
#include <niyama/version.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

static std::atomic<bool> g_shutdown_requested{false};

// Closing stdin ends the read loop; everything else happens on the main thread
static void signal_handler(int) {
    g_shutdown_requested = true;
    close(STDIN_FILENO);
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config-dir PATH       Context directory (default: ./contexts)\n"
              << "  --no-auto-load          Do not load contexts at startup\n"
              << "  --memory-socket PATH    Memory service Unix socket\n"
              << "  --memory-timeout-ms N   Memory service call timeout (default: 5000)\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Environment: CONTEXT_CONFIG_DIR, AUTO_LOAD_CONTEXTS,\n"
              << "             NIYAMA_MEMORY_SOCKET, NIYAMA_MEMORY_TIMEOUT_MS\n";
}

static constexpr int AUDIT_DRAIN_MS = 2000;

int main(int argc, char* argv[]) {
    niyama::Config config = niyama::Config::from_env();

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config-dir") == 0 && i + 1 < argc) {
            config.config_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--no-auto-load") == 0) {
            config.auto_load = false;
        } else if (std::strcmp(argv[i], "--memory-socket") == 0 && i + 1 < argc) {
            config.memory_socket = argv[++i];
        } else if (std::strcmp(argv[i], "--memory-timeout-ms") == 0 && i + 1 < argc) {
            int ms = std::atoi(argv[++i]);
            if (ms <= 0) {
                std::cerr << "Invalid timeout: " << argv[i] << "\n";
                return 1;
            }
            config.memory_timeout_ms = ms;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::unique_ptr<niyama::MemoryService> memory;
    if (config.memory_socket.empty()) {
        std::cerr << "[niyama] Memory service not configured\n";
        memory = std::make_unique<niyama::UnconfiguredMemoryService>();
    } else {
        std::cerr << "[niyama] Memory service: " << config.memory_socket
                  << " (timeout " << config.memory_timeout_ms << "ms)\n";
        memory = std::make_unique<niyama::SocketMemoryService>(config.memory_socket,
                                                               config.memory_timeout_ms);
    }

    niyama::AuditHook audit(*memory, config.audit_queue_capacity);
    audit.start();

    niyama::ContextStore store(config.config_dir, config.auto_load, &audit);
    size_t loaded = store.load_all();
    std::cerr << "[niyama] Loaded " << loaded << " context file(s) from " << config.config_dir << "\n";

    niyama::SessionInitializer session(store, *memory);
    if (loaded > 0) session.run();

    niyama::rpc::Handler handler(store, session, *memory);

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    std::cerr << "[niyama] " << NIYAMA_SERVER_NAME << " " << NIYAMA_VERSION << " listening on stdin...\n";

    std::string line;
    while (!g_shutdown_requested && std::getline(std::cin, line)) {
        if (line.empty()) continue;

        std::string response = handler.handle(line);
        if (!response.empty()) {
            std::cout << response << "\n";
            std::cout.flush();
        }
        if (handler.shutdown_requested()) break;
    }

    if (!audit.drain(AUDIT_DRAIN_MS)) {
        std::cerr << "[niyama] Audit queue not drained, dropping pending events\n";
    }
    audit.stop();

    auto stats = audit.stats();
    std::cerr << "[niyama] Audit: " << stats.delivered << " delivered, " << stats.failed
              << " failed, " << stats.dropped << " dropped\n";
    std::cerr << "[niyama] Shutdown complete\n";
    return 0;
}
