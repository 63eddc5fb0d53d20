// Worker side of the line protocol: interactive startup followed by a
// one-command-at-a-time loop over a single authenticated TransferClient.
#pragma once
#include "TransferClient.hpp"
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace transmit {

struct WorkerOptions {
    std::uint16_t port = 22;
    std::optional<std::string> known_hosts_path;
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;
};

class WorkerEngine {
public:
    using ClientFactory = std::function<std::unique_ptr<TransferClient>()>;

    static constexpr int kExitOk = 0;
    static constexpr int kExitStartupFailed = 1;
    static constexpr int kExitSessionLost = 2;

    WorkerEngine(std::istream& in, std::ostream& out, ClientFactory factory,
                 WorkerOptions options = {});
    ~WorkerEngine();

    // Runs startup and the command loop; returns the process exit code.
    int run();

    TransferClient* client() const { return client_.get(); }

private:
    std::istream& in_;
    std::ostream& out_;
    ClientFactory factory_;
    WorkerOptions options_;
    std::unique_ptr<TransferClient> client_;

    bool readLine(std::string& line);
    void writeLine(const std::string& line);
    void status(bool ok, const std::string& message);
    void trace(const std::string& message) const;
    bool ask(const char* prompt, const char* what, std::string& answer);

    bool startSession();
    int commandLoop();
    void upload(const std::string& local, const std::string& remote);
    void remove(const std::string& remote);
    void closeSession();
};

} // namespace transmit
