#include "transmit/WorkerEngine.hpp"
#include "transmit/LineProtocol.hpp"
#include "transmit/RemoteTree.hpp"
#include "transmit/RuntimeLogging.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

namespace transmit {

WorkerEngine::WorkerEngine(std::istream& in, std::ostream& out,
                           ClientFactory factory, WorkerOptions options)
    : in_(in), out_(out), factory_(std::move(factory)),
      options_(std::move(options)) {}

WorkerEngine::~WorkerEngine() {
    closeSession();
}

bool WorkerEngine::readLine(std::string& line) {
    if (!std::getline(in_, line))
        return false;
    protocol::stripLineEnding(line);
    return true;
}

// Every line is flushed immediately: the parent reads us through a pipe.
void WorkerEngine::writeLine(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
}

void WorkerEngine::status(bool ok, const std::string& message) {
    writeLine(protocol::formatStatusLine(ok, message));
}

void WorkerEngine::trace(const std::string& message) const {
    if (workerTraceEnabled())
        std::cerr << "[transmit-worker] " << message << std::endl;
}

bool WorkerEngine::ask(const char* prompt, const char* what,
                       std::string& answer) {
    writeLine(prompt);
    if (!readLine(answer)) {
        status(false, std::string("Failed to read ") + what);
        return false;
    }
    return true;
}

bool WorkerEngine::startSession() {
    SessionOptions opt;
    opt.port = options_.port;
    opt.known_hosts_path = options_.known_hosts_path;
    opt.known_hosts_policy = options_.known_hosts_policy;

    std::string method;
    std::string credential;
    if (!ask(protocol::kHostnamePrompt, "hostname", opt.host) ||
        !ask(protocol::kUsernamePrompt, "username", opt.username) ||
        !ask(protocol::kAuthMethodPrompt, "auth method", method))
        return false;

    if (method == protocol::kAuthMethodPassword) {
        opt.auth_method = AuthMethod::Password;
        if (!ask(protocol::kPasswordPrompt, "password", credential))
            return false;
        opt.password = credential;
    } else {
        opt.auth_method = AuthMethod::PrivateKey;
        if (!ask(protocol::kPrivateKeyPrompt, "private key path", credential))
            return false;
        opt.private_key_path = credential;
    }

    trace("connecting to " + opt.host + " as " + opt.username +
          " credential=" + redacted(credential));

    client_ = factory_ ? factory_() : nullptr;
    if (!client_) {
        status(false, "No transfer backend available");
        return false;
    }
    std::string err;
    if (!client_->connect(opt, err)) {
        status(false, "Failed to establish SFTP session: " + err);
        client_.reset();
        return false;
    }
    status(true, "Connected to " + opt.host + " as " + opt.username);
    return true;
}

void WorkerEngine::upload(const std::string& local, const std::string& remote) {
    std::string err;
    std::error_code ec;
    if (std::filesystem::is_directory(local, ec)) {
        // Directory contents are not transferred, only the remote chain
        if (ensureDirectoryChain(*client_, remote, err))
            status(true, protocol::kUploadSucceeded);
        else
            status(false, err);
        return;
    }

    const std::string parent = remoteParentPath(remote);
    if (!parent.empty() && !ensureDirectoryChain(*client_, parent, err)) {
        status(false, err);
        return;
    }

    int lastPercent = -1;
    auto progress = [&](std::size_t done, std::size_t total) {
        const int pct = total ? static_cast<int>((done * 100) / total) : 100;
        if (pct != lastPercent) {
            lastPercent = pct;
            writeLine(protocol::formatProgressLine(remote, pct));
        }
    };
    if (client_->put(local, remote, err, progress))
        status(true, protocol::kUploadSucceeded);
    else
        status(false, err.empty() ? "Upload failed" : err);
}

void WorkerEngine::remove(const std::string& remote) {
    std::string err;
    if (removePathRecursive(*client_, remote, err))
        status(true, protocol::kRemoveSucceeded);
    else
        status(false, err.empty() ? "Remove failed" : err);
}

int WorkerEngine::commandLoop() {
    std::string line;
    std::vector<std::string> words;
    while (true) {
        if (!client_->isAlive()) {
            status(false, protocol::kSessionLost);
            closeSession();
            return kExitSessionLost;
        }
        if (!readLine(line)) {
            status(false, "Failed to read input");
            closeSession();
            return kExitOk;
        }
        if (!protocol::splitCommand(line, words) || words.empty()) {
            status(false, protocol::kUnknownCommand);
            continue;
        }
        trace("command: " + words[0]);

        const std::string& cmd = words[0];
        if (cmd == protocol::kExitCommand && words.size() == 1) {
            status(true, protocol::kExitingShell);
            closeSession();
            return kExitOk;
        } else if (cmd == protocol::kUploadCommand && words.size() == 3) {
            upload(words[1], words[2]);
        } else if (cmd == protocol::kRemoveCommand && words.size() == 2) {
            remove(words[1]);
        } else {
            status(false, protocol::kUnknownCommand);
        }
    }
}

void WorkerEngine::closeSession() {
    if (client_ && client_->isConnected())
        client_->disconnect();
}

int WorkerEngine::run() {
    if (!startSession())
        return kExitStartupFailed;
    return commandLoop();
}

} // namespace transmit
