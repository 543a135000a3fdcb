#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "process.hpp"
#include "server.hpp"
#include "signal_watcher.hpp"
#include "supervisor.hpp"
#include "tool.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <cstring>
#include <csignal>
#include <cstdlib>

static void print_usage() {
    std::cout << "Usage: perouter-mcp [options]\n"
              << "\n"
              << "Serves newline-delimited JSON-RPC (MCP tools) on stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.perouter-mcp/config.json)\n"
              << "  --scripts-dir DIR    Directory holding the diagnostic scripts\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Tools:\n"
              << "  extract_leaf_configs     Dump FRR running configs of all leaves\n"
              << "  start_traffic_capture    Start tshark captures in the background\n"
              << "  stop_traffic_capture     Stop all captures and collect pcap files\n"
              << "\n"
              << "Environment variables:\n"
              << "  PEROUTER_MCP_CONFIG        Config file path\n"
              << "  PEROUTER_MCP_SCRIPTS_DIR   Overrides scripts_dir\n"
              << "  PEROUTER_MCP_SHELL         Shell used to run scripts (default: bash)\n"
              << "  PEROUTER_MCP_CAPTURE_DIR   Root for default capture directories\n";
}

// One write per line so lines from drain threads do not interleave
static void log_line(const std::string& line) {
    std::cerr << (line + "\n");
}

static void subscribe_capture_logging(perouter::EventBus& bus) {
    using namespace perouter;

    subscribe<CaptureStartedEvent>(bus, [](const CaptureStartedEvent& ev) {
        log_line("[capture] " + ev.call_id + ": started " + ev.command +
                 " (PID: " + std::to_string(ev.pid) + ")");
    });
    subscribe<CaptureOutputEvent>(bus, [](const CaptureOutputEvent& ev) {
        log_line("[capture] " + ev.call_id + ": " + ev.line);
    });
    subscribe<CaptureExitedEvent>(bus, [](const CaptureExitedEvent& ev) {
        log_line("[capture] " + ev.call_id + ": PID " + std::to_string(ev.pid) +
                 " exited (" + describe_status(ev.status) + ")");
    });
    subscribe<CaptureSignaledEvent>(bus, [](const CaptureSignaledEvent& ev) {
        std::string pid = std::to_string(ev.pid);
        if (!ev.delivered) {
            log_line("[capture] Failed to send " + std::string(ev.signal == SIGKILL ? "SIGKILL" : "SIGTERM") +
                     " to PID " + pid);
        } else if (ev.signal == SIGKILL) {
            log_line("[capture] Force killed capture for request " + ev.call_id + " (PID: " + pid + ")");
        } else {
            log_line("[capture] Stopping capture for request " + ev.call_id + " (PID: " + pid + ")");
        }
    });
    subscribe<StopEscalatedEvent>(bus, [](const StopEscalatedEvent& ev) {
        std::ostringstream msg;
        msg << "[capture] Timeout waiting for " << ev.remaining << " capture(s) to stop after "
            << ev.timeout_ms << "ms, forcing kill";
        log_line(msg.str());
    });
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string scripts_dir;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--scripts-dir") == 0 && i + 1 < argc) {
            scripts_dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = perouter::Config::load(config_path);
    if (!scripts_dir.empty()) {
        config.scripts_dir = scripts_dir;
    }

    std::signal(SIGPIPE, SIG_IGN);

    perouter::EventBus bus;
    subscribe_capture_logging(bus);

    perouter::CaptureSupervisor supervisor(
        perouter::CaptureOptions::from_config(config.capture), &bus);
    perouter::McpServer server(config.server,
                               perouter::create_builtin_tools(config, supervisor));

    // Started before any capture thread so every thread inherits the mask.
    // Children get a clean mask at spawn.
    perouter::SignalWatcher signals({SIGINT, SIGTERM, SIGHUP}, [&supervisor](int sig) {
        std::cerr << "[server] Caught signal " << sig << ", stopping captures\n";
        supervisor.stop_all();
        std::cout.flush();
        std::_Exit(128 + sig);
    });

    std::cerr << "[server] " << config.server.name << " " << config.server.version
              << " ready (scripts: " << config.scripts_dir << ")\n";

    server.run(std::cin, std::cout);

    // From here on only this thread stops captures; a signal already being
    // handled finishes (and exits) before stop() returns
    signals.stop();
    std::cerr << "[server] Input closed, stopping captures\n";
    auto report = supervisor.stop_all();
    if (report.found > 0) {
        std::cerr << "[server] Stopped " << report.signaled << " capture(s)\n";
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
