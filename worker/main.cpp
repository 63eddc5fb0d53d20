// transmit-worker: holds one authenticated SFTP session and serves the line
// protocol on stdin/stdout until "exit".
#include "transmit/Libssh2TransferClient.hpp"
#include "transmit/WorkerEngine.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--port <n>] [--known-hosts <path>]"
                 " [--known-hosts-policy strict|accept-new|off]\n";
}

bool parsePolicy(const std::string& raw, transmit::KnownHostsPolicy& out) {
    if (raw == "strict") {
        out = transmit::KnownHostsPolicy::Strict;
    } else if (raw == "accept-new") {
        out = transmit::KnownHostsPolicy::AcceptNew;
    } else if (raw == "off") {
        out = transmit::KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

bool parsePort(const std::string& raw, std::uint16_t& out) {
    try {
        const int n = std::stoi(raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    transmit::WorkerOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--port" && hasValue) {
            if (!parsePort(argv[++i], options.port)) {
                usage(argv[0]);
                return transmit::WorkerEngine::kExitStartupFailed;
            }
        } else if (arg == "--known-hosts" && hasValue) {
            options.known_hosts_path = std::string(argv[++i]);
        } else if (arg == "--known-hosts-policy" && hasValue) {
            if (!parsePolicy(argv[++i], options.known_hosts_policy)) {
                usage(argv[0]);
                return transmit::WorkerEngine::kExitStartupFailed;
            }
        } else {
            usage(argv[0]);
            return transmit::WorkerEngine::kExitStartupFailed;
        }
    }

    transmit::WorkerEngine engine(
        std::cin, std::cout,
        [] { return std::make_unique<transmit::Libssh2TransferClient>(); },
        options);
    return engine.run();
}
