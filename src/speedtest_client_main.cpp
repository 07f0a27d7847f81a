#include "SpeedTestClient.h"
#include "speedtest_size.h"

#include <iostream>
#include <stdexcept>
#include <string>

struct ClientMainArgs {
    SpeedTestClientArgs client;
    int discover_timeout_ms = 10000;   // re-announce "still waiting" after this long
    bool once = false;                 // exit after one test instead of listening again
};

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --size SIZE --tcp N --udp N [--offer-port P] [--udp-timeout-ms MS]"
              << " [--discover-timeout-ms MS] [--once] [--verbose]\n"
              << "  SIZE accepts B, KB, MB, GB, TB, KiB, MiB, ... (e.g. 500, 300K, 10MB)\n";
}

static bool parse_args(int argc, char** argv, ClientMainArgs& a) {
    bool have_size = false;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        if (s == "--size" && need(1)) {
            auto size = parse_size(argv[++i]);
            if (!size) { std::cerr << "Invalid size: " << argv[i] << "\n"; return false; }
            a.client.file_size = *size;
            have_size = true;
        }
        else if (s == "--tcp" && need(1)) a.client.tcp_count = std::stoi(argv[++i]);
        else if (s == "--udp" && need(1)) a.client.udp_count = std::stoi(argv[++i]);
        else if (s == "--offer-port" && need(1)) a.client.offer_port = (uint16_t)std::stoi(argv[++i]);
        else if (s == "--udp-timeout-ms" && need(1)) a.client.udp_idle_timeout_ms = std::stoi(argv[++i]);
        else if (s == "--discover-timeout-ms" && need(1)) a.discover_timeout_ms = std::stoi(argv[++i]);
        else if (s == "--once") a.once = true;
        else if (s == "--verbose") a.client.verbose = true;
        else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
        else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
    }

    if (!have_size || a.client.file_size == 0) { std::cerr << "--size must be > 0\n"; return false; }
    if (a.client.tcp_count < 0 || a.client.udp_count < 0) {
        std::cerr << "--tcp and --udp must be >= 0\n";
        return false;
    }
    if (a.client.udp_idle_timeout_ms <= 0) { std::cerr << "--udp-timeout-ms must be > 0\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    ClientMainArgs args;
    try {
        if (!parse_args(argc, argv, args)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    SpeedTestClient client(args.client);
    if (!client.init()) return 2;

    while (true) {
        std::cerr << "Looking for a server offer...\n";
        auto offer = client.discover(args.discover_timeout_ms);
        if (!offer) {
            std::cerr << "No server offer received within " << args.discover_timeout_ms
                      << " ms. Retrying...\n";
            continue;
        }

        SpeedTestReport report = client.run_test(*offer);
        for (const auto& r : report.results) {
            std::cout << format_result(r) << "\n";
        }
        std::cout.flush();

        if (args.once) return report.failures() == 0 ? 0 : 3;
        std::cerr << "All transfers complete, listening to offer requests...\n";
    }
}
