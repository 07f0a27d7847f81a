#include "SpeedTestServer.h"

#include <pthread.h>
#include <signal.h>

#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--broadcast A.B.C.D] [--offer-port P] [--tcp-port P] [--udp-port P]"
              << " [--interval-ms MS] [--segment BYTES] [--verbose]\n";
}

static bool parse_args(int argc, char** argv, SpeedTestServerArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        if (s == "--broadcast" && need(1)) a.broadcast_ip = argv[++i];
        else if (s == "--offer-port" && need(1)) a.offer_port = (uint16_t)std::stoi(argv[++i]);
        else if (s == "--tcp-port" && need(1)) a.tcp_port = (uint16_t)std::stoi(argv[++i]);
        else if (s == "--udp-port" && need(1)) a.udp_port = (uint16_t)std::stoi(argv[++i]);
        else if (s == "--interval-ms" && need(1)) a.interval_ms = std::stoi(argv[++i]);
        else if (s == "--segment" && need(1)) a.segment_payload = (size_t)std::stoul(argv[++i]);
        else if (s == "--verbose") a.verbose = true;
        else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
        else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
    }

    if (a.interval_ms <= 0) { std::cerr << "--interval-ms must be > 0\n"; return false; }
    if (a.segment_payload < 1 || a.segment_payload > SPEEDTEST_MAX_DATAGRAM - SPEEDTEST_PAYLOAD_HEADER) {
        std::cerr << "--segment invalid; must be 1.."
                  << (SPEEDTEST_MAX_DATAGRAM - SPEEDTEST_PAYLOAD_HEADER) << "\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    SpeedTestServerArgs args;
    try {
        if (!parse_args(argc, argv, args)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    // Block the shutdown signals before any thread starts so only sigwait sees them.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    SpeedTestServer server(args);
    if (!server.init()) return 2;
    if (!server.start()) return 3;

    int sig = 0;
    sigwait(&sigs, &sig);
    std::cerr << "Server shutting down...\n";
    server.stop();
    return 0;
}
